#include "BaselineComparator.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "OutputUtils.h"

namespace stratvalidator
{
namespace baseline
{

using validation::BaselineComparisonDetails;
using validation::BaselineComparisonResult;
using validation::BaselineOutcome;
using validation::ValidationStatus;
using utils::formatNumber;

namespace
{
    const char* const kTag = "Baseline";
}

BaselineComparator::BaselineComparator(std::shared_ptr<const IBaselineSimulator> simulator,
                                       std::shared_ptr<BaselineCache> cache,
                                       const BaselineConfig& config)
    : mSimulator(std::move(simulator)),
      mCache(std::move(cache)),
      mConfig(config)
{
    if (!mSimulator)
        throw std::invalid_argument("BaselineComparator: simulator must not be null");

    if (!mCache)
        throw std::invalid_argument("BaselineComparator: cache must not be null");

    if (mConfig.baselines.empty())
        throw std::invalid_argument("BaselineComparator: at least one baseline is required");

    if (!std::isfinite(mConfig.minAlpha) || !std::isfinite(mConfig.maxUnderperformance) ||
        mConfig.maxUnderperformance < 0.0)
        throw std::invalid_argument("BaselineComparator: thresholds must be finite, underperformance limit >= 0");
}

BaselineComparisonResult BaselineComparator::compare(double candidateMetric,
                                                     const PeriodBounds& bounds,
                                                     std::ostream& os) const
{
    BaselineComparisonDetails details;
    details.candidateMetric = candidateMetric;
    details.bounds = bounds;

    if (!std::isfinite(candidateMetric))
    {
        utils::logVerdict(os, kTag, false, "candidate metric is not finite");
        return BaselineComparisonResult(ValidationStatus::DegenerateInput,
                                        "Candidate metric is not finite",
                                        std::nullopt,
                                        details);
    }

    for (BaselineId id : mConfig.baselines)
    {
        BaselineOutcome outcome{id, std::nullopt, std::nullopt, ""};

        try
        {
            BaselineRecord record = mCache->getOrCompute(id, bounds, [this, id, &bounds]() {
                return mSimulator->simulate(id, bounds);
            });

            if (!std::isfinite(record.getSharpeRatio()))
                throw BaselineSimulationException("non-finite Sharpe ratio");

            outcome.alpha = candidateMetric - record.getSharpeRatio();
            outcome.record = record;
            ++details.availableCount;

            utils::logInfo(os, kTag, toString(id) + ": Sharpe " + formatNumber(record.getSharpeRatio()) +
                           ", alpha " + formatNumber(*outcome.alpha));
        }
        catch (const std::exception& e)
        {
            outcome.error = e.what();
            utils::logWarning(os, kTag, toString(id) + " unavailable: " + outcome.error);
        }

        if (outcome.alpha)
        {
            if (!details.bestAlpha || *outcome.alpha > *details.bestAlpha)
            {
                details.bestAlpha = outcome.alpha;
                details.bestBaseline = id;
            }

            if (!details.worstAlpha || *outcome.alpha < *details.worstAlpha)
                details.worstAlpha = outcome.alpha;
        }

        details.baselines.push_back(std::move(outcome));
    }

    if (details.availableCount == 0)
    {
        utils::logVerdict(os, kTag, false, "no baseline available over " + bounds.toString());
        return BaselineComparisonResult(ValidationStatus::Unavailable,
                                        "No baseline could be simulated over " + bounds.toString(),
                                        std::nullopt,
                                        details);
    }

    if (mConfig.underperformanceGuard && *details.worstAlpha <= -mConfig.maxUnderperformance)
    {
        details.underperformanceGuardTriggered = true;
        const std::string reason = "Worst alpha " + formatNumber(*details.worstAlpha) + " <= -" +
            formatNumber(mConfig.maxUnderperformance) + " (underperforms a baseline)";
        utils::logVerdict(os, kTag, false, reason);
        return BaselineComparisonResult(ValidationStatus::Fail, reason, details.bestAlpha, details);
    }

    const bool pass = *details.bestAlpha > mConfig.minAlpha;
    const std::string reason = pass
        ? "Beats " + toString(*details.bestBaseline) + " by " + formatNumber(*details.bestAlpha)
        : "Best alpha " + formatNumber(*details.bestAlpha) + " <= " + formatNumber(mConfig.minAlpha);

    utils::logVerdict(os, kTag, pass, reason);
    return BaselineComparisonResult(pass ? ValidationStatus::Pass : ValidationStatus::Fail,
                                    reason,
                                    details.bestAlpha,
                                    details);
}

BaselineComparisonResult BaselineComparator::compare(const ReturnSeries& candidate,
                                                     const MetricFunction& metric,
                                                     std::ostream& os) const
{
    const std::size_t n = candidate.size();
    const std::size_t lookback = (mConfig.lookbackPeriods == 0) ? n : std::min(n, mConfig.lookbackPeriods);

    if (lookback < 2)
    {
        utils::logVerdict(os, kTag, false, "candidate series too short for a comparison horizon");
        return BaselineComparisonResult(ValidationStatus::InsufficientData,
                                        "Candidate series has " + std::to_string(n) +
                                        " periods, at least 2 required",
                                        std::nullopt,
                                        BaselineComparisonDetails());
    }

    const ReturnSeries horizon = candidate.slice(n - lookback, n);
    return compare(metric(horizon.getReturns()), horizon.getBounds(), os);
}

} // namespace baseline
} // namespace stratvalidator
