#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "BaselineTypes.h"
#include "PerformanceMetrics.h"

namespace stratvalidator
{
namespace baseline
{

/**
 * @brief Per-period returns of a universe of assets.
 *
 * values[t][a] is the return of asset a over period t. Missing values are
 * NaN. Dates are strictly ascending.
 */
class AssetReturnPanel
{
public:
    /**
     * @throws std::invalid_argument if the shape is inconsistent, the asset
     *         names are not unique or the dates are not strictly ascending
     */
    AssetReturnPanel(std::vector<boost::gregorian::date> dates,
                     std::vector<std::string> assetNames,
                     std::vector<std::vector<double>> values);

    std::size_t numPeriods() const
    {
        return mDates.size();
    }

    std::size_t numAssets() const
    {
        return mAssetNames.size();
    }

    const std::vector<boost::gregorian::date>& getDates() const
    {
        return mDates;
    }

    const std::vector<std::string>& getAssetNames() const
    {
        return mAssetNames;
    }

    double getValue(std::size_t period, std::size_t asset) const
    {
        return mValues[period][asset];
    }

    const std::vector<double>& getRow(std::size_t period) const
    {
        return mValues[period];
    }

    std::optional<std::size_t> findAsset(const std::string& name) const;

private:
    std::vector<boost::gregorian::date> mDates;
    std::vector<std::string> mAssetNames;
    std::vector<std::vector<double>> mValues;
};

struct PanelSimulatorConfig
{
    std::string indexAsset;               ///< Column used for buy-and-hold, empty = cross-sectional mean
    std::size_t topN = 50;
    std::size_t volatilityWindow = 60;
    double periodsPerYear = kTradingDaysPerYear;
};

/**
 * @class PanelBaselineSimulator
 * @brief Builds the reference portfolios from an asset return panel.
 *
 *  - BuyAndHoldIndex: returns of the configured index column, or the
 *    cross-sectional mean of the finite returns when the column is absent.
 *  - EqualWeightTopN: weight 1/N on each of the N assets with the highest
 *    ranking score at the previous period.
 *  - InverseVolatility: weights proportional to 1 / (sigma + 1e-8), sigma
 *    being the sample volatility over the trailing window, applied from the
 *    next period on. Periods before a full window carry zero weight.
 *
 * Portfolio returns are computed over the whole panel and then restricted
 * to the requested bounds, so weights are always formed from information
 * available before the period they are applied to.
 */
class PanelBaselineSimulator : public IBaselineSimulator
{
public:
    /**
     * @param rankingScores Same shape as the panel (e.g. market capitalization).
     *        May be empty, in which case EqualWeightTopN is unavailable.
     * @throws std::invalid_argument if rankingScores has the wrong shape or
     *         the configuration is invalid
     */
    PanelBaselineSimulator(AssetReturnPanel panel,
                           std::vector<std::vector<double>> rankingScores,
                           const PanelSimulatorConfig& config = PanelSimulatorConfig());

    BaselineRecord simulate(BaselineId id, const PeriodBounds& bounds) const override;

    /**
     * @brief Per-period portfolio returns of a baseline inside bounds.
     * @throws BaselineSimulationException if the baseline cannot be formed
     */
    std::vector<double> simulateReturns(BaselineId id, const PeriodBounds& bounds) const;

private:
    std::vector<double> indexReturns() const;
    std::vector<double> equalWeightTopNReturns() const;
    std::vector<double> inverseVolatilityReturns() const;

    std::vector<double> restrictToBounds(const std::vector<double>& returns,
                                         std::size_t firstPeriod,
                                         const PeriodBounds& bounds) const;

private:
    AssetReturnPanel mPanel;
    std::vector<std::vector<double>> mRankingScores;
    PanelSimulatorConfig mConfig;
};

} // namespace baseline
} // namespace stratvalidator
