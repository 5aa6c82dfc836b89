#include "BaselineTypes.h"

namespace stratvalidator
{
namespace baseline
{

std::string toString(BaselineId id)
{
    switch (id)
    {
        case BaselineId::BuyAndHoldIndex:
            return "buy_and_hold_index";
        case BaselineId::EqualWeightTopN:
            return "equal_weight_top_n";
        case BaselineId::InverseVolatility:
            return "inverse_volatility";
        default:
            throw std::invalid_argument("Unknown baseline id");
    }
}

BaselineId baselineIdFromString(const std::string& name)
{
    for (BaselineId id : allBaselines())
        if (toString(id) == name)
            return id;

    throw std::invalid_argument("Unknown baseline: " + name);
}

const std::vector<BaselineId>& allBaselines()
{
    static const std::vector<BaselineId> baselines = {
        BaselineId::BuyAndHoldIndex,
        BaselineId::EqualWeightTopN,
        BaselineId::InverseVolatility
    };

    return baselines;
}

} // namespace baseline
} // namespace stratvalidator
