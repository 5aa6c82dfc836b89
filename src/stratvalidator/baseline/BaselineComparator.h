#pragma once

#include <cstddef>
#include <memory>
#include <ostream>
#include <vector>
#include "BaselineCache.h"
#include "BaselineTypes.h"
#include "PerformanceMetrics.h"
#include "ReturnSeries.h"
#include "ValidationTypes.h"

namespace stratvalidator
{
namespace baseline
{

struct BaselineConfig
{
    std::vector<BaselineId> baselines = allBaselines();
    double minAlpha = 0.5;                ///< Required edge over the best-beaten baseline
    bool underperformanceGuard = false;   ///< Fail when trailing any baseline by maxUnderperformance
    double maxUnderperformance = 1.0;
    std::size_t lookbackPeriods = 0;      ///< Trailing periods compared, 0 = whole series
};

/**
 * @class BaselineComparator
 * @brief Checks that a candidate beats at least one reference portfolio.
 *
 * alpha_b = candidate metric - Sharpe of baseline b. The comparison passes
 * when max_b alpha_b > minAlpha over the baselines that could be simulated.
 * Baseline records come from the shared BaselineCache, so each
 * (baseline, horizon) pair is simulated once per run.
 */
class BaselineComparator
{
public:
    /**
     * @throws std::invalid_argument if simulator or cache is null, no
     *         baseline is configured or a threshold is not finite.
     */
    BaselineComparator(std::shared_ptr<const IBaselineSimulator> simulator,
                       std::shared_ptr<BaselineCache> cache,
                       const BaselineConfig& config = BaselineConfig());

    validation::BaselineComparisonResult compare(double candidateMetric,
                                                 const PeriodBounds& bounds,
                                                 std::ostream& os) const;

    /**
     * @brief Compare over the configured lookback of the candidate's series,
     *        scoring the candidate with metric over the same periods.
     */
    validation::BaselineComparisonResult compare(const ReturnSeries& candidate,
                                                 const MetricFunction& metric,
                                                 std::ostream& os) const;

    const BaselineConfig& getConfig() const
    {
        return mConfig;
    }

private:
    std::shared_ptr<const IBaselineSimulator> mSimulator;
    std::shared_ptr<BaselineCache> mCache;
    BaselineConfig mConfig;
};

} // namespace baseline
} // namespace stratvalidator
