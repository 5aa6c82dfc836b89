#include "OutputUtils.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace stratvalidator
{
namespace utils
{

std::string formatNumber(double value, int precision)
{
    if (std::isnan(value))
        return "nan";

    if (std::isinf(value))
        return value > 0 ? "inf" : "-inf";

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string formatNumber(const std::optional<double>& value, int precision)
{
    if (!value)
        return "n/a";

    return formatNumber(*value, precision);
}

std::string join(const std::vector<std::string>& parts, const std::string& separator)
{
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
        if (i > 0)
            result += separator;
        result += parts[i];
    }
    return result;
}

void logVerdict(std::ostream& os, const std::string& tag, bool passed, const std::string& message)
{
    os << "   [" << tag << "] " << (passed ? "✓ " : "✗ ") << message << "\n";
}

void logInfo(std::ostream& os, const std::string& tag, const std::string& message)
{
    os << "   [" << tag << "] " << message << "\n";
}

void logWarning(std::ostream& os, const std::string& tag, const std::string& message)
{
    os << "   [" << tag << "] WARNING: " << message << "\n";
}

} // namespace utils
} // namespace stratvalidator
