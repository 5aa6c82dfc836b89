#include "PanelBaselineSimulator.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <set>
#include <stdexcept>

namespace stratvalidator
{
namespace baseline
{

AssetReturnPanel::AssetReturnPanel(std::vector<boost::gregorian::date> dates,
                                   std::vector<std::string> assetNames,
                                   std::vector<std::vector<double>> values)
    : mDates(std::move(dates)),
      mAssetNames(std::move(assetNames)),
      mValues(std::move(values))
{
    if (mAssetNames.empty())
        throw std::invalid_argument("AssetReturnPanel: at least one asset is required");

    if (mValues.size() != mDates.size())
        throw std::invalid_argument("AssetReturnPanel: " + std::to_string(mValues.size()) +
                                    " rows for " + std::to_string(mDates.size()) + " dates");

    for (std::size_t t = 0; t < mValues.size(); ++t)
    {
        if (mValues[t].size() != mAssetNames.size())
            throw std::invalid_argument("AssetReturnPanel: row " + std::to_string(t) +
                                        " does not have one value per asset");

        if (t > 0 && !(mDates[t - 1] < mDates[t]))
            throw std::invalid_argument("AssetReturnPanel: dates must be strictly ascending");
    }

    std::set<std::string> unique(mAssetNames.begin(), mAssetNames.end());
    if (unique.size() != mAssetNames.size())
        throw std::invalid_argument("AssetReturnPanel: asset names must be unique");
}

std::optional<std::size_t> AssetReturnPanel::findAsset(const std::string& name) const
{
    auto it = std::find(mAssetNames.begin(), mAssetNames.end(), name);
    if (it == mAssetNames.end())
        return std::nullopt;

    return static_cast<std::size_t>(std::distance(mAssetNames.begin(), it));
}

PanelBaselineSimulator::PanelBaselineSimulator(AssetReturnPanel panel,
                                               std::vector<std::vector<double>> rankingScores,
                                               const PanelSimulatorConfig& config)
    : mPanel(std::move(panel)),
      mRankingScores(std::move(rankingScores)),
      mConfig(config)
{
    if (mConfig.topN == 0)
        throw std::invalid_argument("PanelBaselineSimulator: topN must be > 0");

    if (mConfig.volatilityWindow < 2)
        throw std::invalid_argument("PanelBaselineSimulator: volatility window must be >= 2");

    if (!(mConfig.periodsPerYear > 0.0))
        throw std::invalid_argument("PanelBaselineSimulator: periods per year must be > 0");

    if (!mRankingScores.empty())
    {
        if (mRankingScores.size() != mPanel.numPeriods())
            throw std::invalid_argument("PanelBaselineSimulator: ranking scores must have one row per period");

        for (const auto& row : mRankingScores)
            if (row.size() != mPanel.numAssets())
                throw std::invalid_argument("PanelBaselineSimulator: ranking scores must have one column per asset");
    }
}

BaselineRecord PanelBaselineSimulator::simulate(BaselineId id, const PeriodBounds& bounds) const
{
    return makeBaselineRecord(id, bounds, simulateReturns(id, bounds), mConfig.periodsPerYear);
}

std::vector<double> PanelBaselineSimulator::simulateReturns(BaselineId id, const PeriodBounds& bounds) const
{
    switch (id)
    {
        case BaselineId::BuyAndHoldIndex:
            return restrictToBounds(indexReturns(), 0, bounds);
        case BaselineId::EqualWeightTopN:
            return restrictToBounds(equalWeightTopNReturns(), 1, bounds);
        case BaselineId::InverseVolatility:
            return restrictToBounds(inverseVolatilityReturns(), 1, bounds);
        default:
            throw BaselineSimulationException("PanelBaselineSimulator: unknown baseline");
    }
}

std::vector<double> PanelBaselineSimulator::indexReturns() const
{
    const std::size_t periods = mPanel.numPeriods();
    std::vector<double> result(periods, std::numeric_limits<double>::quiet_NaN());

    std::optional<std::size_t> column;
    if (!mConfig.indexAsset.empty())
        column = mPanel.findAsset(mConfig.indexAsset);

    for (std::size_t t = 0; t < periods; ++t)
    {
        if (column)
        {
            result[t] = mPanel.getValue(t, *column);
            continue;
        }

        // Market average as index proxy
        double sum = 0.0;
        std::size_t count = 0;
        for (double r : mPanel.getRow(t))
        {
            if (std::isfinite(r))
            {
                sum += r;
                ++count;
            }
        }

        if (count > 0)
            result[t] = sum / static_cast<double>(count);
    }

    return result;
}

std::vector<double> PanelBaselineSimulator::equalWeightTopNReturns() const
{
    if (mRankingScores.empty())
        throw BaselineSimulationException("PanelBaselineSimulator: no ranking scores for the top-N basket");

    const std::size_t periods = mPanel.numPeriods();
    const std::size_t assets = mPanel.numAssets();
    const double weight = 1.0 / static_cast<double>(mConfig.topN);

    std::vector<double> result;
    if (periods < 2)
        return result;

    result.reserve(periods - 1);

    std::vector<std::size_t> ranked;
    ranked.reserve(assets);

    for (std::size_t t = 1; t < periods; ++t)
    {
        const auto& scores = mRankingScores[t - 1];

        ranked.clear();
        for (std::size_t a = 0; a < assets; ++a)
            if (std::isfinite(scores[a]))
                ranked.push_back(a);

        const std::size_t selected = std::min(mConfig.topN, ranked.size());
        std::partial_sort(ranked.begin(),
                          ranked.begin() + static_cast<std::ptrdiff_t>(selected),
                          ranked.end(),
                          [&scores](std::size_t lhs, std::size_t rhs) {
                              if (scores[lhs] != scores[rhs])
                                  return scores[lhs] > scores[rhs];
                              return lhs < rhs;
                          });

        double portfolio = 0.0;
        for (std::size_t k = 0; k < selected; ++k)
        {
            const double r = mPanel.getValue(t, ranked[k]);
            if (std::isfinite(r))
                portfolio += weight * r;
        }

        result.push_back(portfolio);
    }

    return result;
}

std::vector<double> PanelBaselineSimulator::inverseVolatilityReturns() const
{
    const std::size_t periods = mPanel.numPeriods();
    const std::size_t assets = mPanel.numAssets();
    const std::size_t window = mConfig.volatilityWindow;
    constexpr double kVolatilityEpsilon = 1e-8;

    std::vector<double> result;
    if (periods < 2)
        return result;

    result.reserve(periods - 1);

    std::vector<double> weights(assets, 0.0);
    std::vector<double> sample(window);

    for (std::size_t t = 1; t < periods; ++t)
    {
        // Weights formed at t - 1 from the trailing window ending there
        const std::size_t formation = t - 1;
        std::fill(weights.begin(), weights.end(), 0.0);
        double total = 0.0;

        if (formation + 1 >= window)
        {
            for (std::size_t a = 0; a < assets; ++a)
            {
                bool complete = true;
                for (std::size_t k = 0; k < window; ++k)
                {
                    sample[k] = mPanel.getValue(formation + 1 - window + k, a);
                    if (!std::isfinite(sample[k]))
                    {
                        complete = false;
                        break;
                    }
                }

                if (!complete)
                    continue;

                const double sigma = StatUtils::computeStdDev(sample);
                if (!std::isfinite(sigma))
                    continue;

                weights[a] = 1.0 / (sigma + kVolatilityEpsilon);
                total += weights[a];
            }
        }

        double portfolio = 0.0;
        if (total > 0.0)
        {
            for (std::size_t a = 0; a < assets; ++a)
            {
                const double r = mPanel.getValue(t, a);
                if (weights[a] > 0.0 && std::isfinite(r))
                    portfolio += (weights[a] / total) * r;
            }
        }

        result.push_back(portfolio);
    }

    return result;
}

std::vector<double> PanelBaselineSimulator::restrictToBounds(const std::vector<double>& returns,
                                                             std::size_t firstPeriod,
                                                             const PeriodBounds& bounds) const
{
    const auto& dates = mPanel.getDates();
    std::vector<double> result;

    for (std::size_t i = 0; i < returns.size(); ++i)
    {
        const std::size_t t = firstPeriod + i;
        if (bounds.contains(dates[t]) && std::isfinite(returns[i]))
            result.push_back(returns[i]);
    }

    return result;
}

} // namespace baseline
} // namespace stratvalidator
