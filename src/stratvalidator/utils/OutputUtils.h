#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace stratvalidator
{
namespace utils
{

/**
 * @brief Fixed-point rendering of a value for log lines and reasons
 * @param value Value to format; non-finite values render as "nan"/"inf"
 * @param precision Digits after the decimal point
 */
std::string formatNumber(double value, int precision = 4);

/**
 * @brief formatNumber for an optional value, "n/a" when empty
 */
std::string formatNumber(const std::optional<double>& value, int precision = 4);

/**
 * @brief Join parts with a separator
 */
std::string join(const std::vector<std::string>& parts, const std::string& separator);

/**
 * @brief Write a verdict line: "   [tag] ✓ message" or "   [tag] ✗ message"
 */
void logVerdict(std::ostream& os, const std::string& tag, bool passed, const std::string& message);

/**
 * @brief Write an informational line: "   [tag] message"
 */
void logInfo(std::ostream& os, const std::string& tag, const std::string& message);

/**
 * @brief Write a warning line: "   [tag] WARNING: message"
 */
void logWarning(std::ostream& os, const std::string& tag, const std::string& message);

} // namespace utils
} // namespace stratvalidator
