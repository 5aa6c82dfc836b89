#include "ValidationTypes.h"
#include <stdexcept>
#include <type_traits>

namespace stratvalidator
{
namespace validation
{

std::string toString(ValidationStatus status)
{
    switch (status)
    {
        case ValidationStatus::Pass:
            return "pass";
        case ValidationStatus::Fail:
            return "fail";
        case ValidationStatus::InsufficientData:
            return "insufficient_data";
        case ValidationStatus::DegenerateInput:
            return "degenerate_input";
        case ValidationStatus::Unavailable:
            return "unavailable";
        default:
            throw std::invalid_argument("Unknown validation status");
    }
}

const ValidationRecord& getRecord(const ValidationResult& result)
{
    return std::visit([](const auto& r) -> const ValidationRecord& { return r; }, result);
}

bool passed(const ValidationResult& result)
{
    return getRecord(result).passed();
}

ValidationStatus getStatus(const ValidationResult& result)
{
    return getRecord(result).getStatus();
}

const std::string& getReason(const ValidationResult& result)
{
    return getRecord(result).getReason();
}

std::string validatorName(const ValidationResult& result)
{
    return std::visit([](const auto& r) -> std::string {
        using T = std::decay_t<decltype(r)>;

        if constexpr (std::is_same_v<T, DataSplitResult>)
            return "data_split";
        else if constexpr (std::is_same_v<T, WalkForwardResult>)
            return "walk_forward";
        else if constexpr (std::is_same_v<T, BonferroniResult>)
            return "bonferroni";
        else if constexpr (std::is_same_v<T, BootstrapResult>)
            return "bootstrap";
        else
            return "baseline";
    }, result);
}

} // namespace validation
} // namespace stratvalidator
