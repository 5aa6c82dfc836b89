#include "BonferroniValidator.h"
#include <cmath>
#include <stdexcept>
#include "OutputUtils.h"
#include "StatisticalExceptions.h"

namespace stratvalidator
{
namespace validation
{

using analysis::ThresholdMode;
using utils::formatNumber;

namespace
{
    const char* const kTag = "Bonferroni";
}

BonferroniValidator::BonferroniValidator(std::size_t numStrategies, const BonferroniConfig& config)
    : mCorrector(numStrategies, config.familyWiseAlpha, config.conservativeFloor),
      mConfig(config)
{
}

BonferroniResult BonferroniValidator::validate(double metric,
                                               std::size_t numPeriods,
                                               uint64_t seed,
                                               std::ostream& os) const
{
    BonferroniDetails details;
    details.metric = metric;

    CorrectionContext& context = details.context;
    context.numStrategies = mCorrector.getNumStrategies();
    context.familyWiseAlpha = mCorrector.getFamilyWiseAlpha();
    context.adjustedAlpha = mCorrector.getAdjustedAlpha();
    context.conservativeFloor = mCorrector.getConservativeFloor();
    context.numPeriods = numPeriods;
    context.mode = mConfig.mode;

    if (numPeriods < 2)
    {
        const std::string reason = "Threshold needs at least 2 return periods, got " + std::to_string(numPeriods);
        utils::logVerdict(os, kTag, false, reason);
        return BonferroniResult(ValidationStatus::InsufficientData, reason, std::nullopt, details);
    }

    if (!std::isfinite(metric))
    {
        const std::string reason = "Candidate metric is not finite";
        utils::logVerdict(os, kTag, false, reason);
        return BonferroniResult(ValidationStatus::DegenerateInput, reason, std::nullopt, details);
    }

    context.parametricThreshold = mCorrector.parametricThreshold(numPeriods);
    context.chosenThreshold = context.parametricThreshold;

    if (mConfig.mode == ThresholdMode::Bootstrap)
    {
        try
        {
            const auto comparison = mCorrector.bootstrapThreshold(numPeriods, mConfig.nullSettings, seed);
            context.bootstrapThreshold = comparison.bootstrap;
            context.thresholdDivergence = comparison.relativeDifference;
            context.chosenThreshold = comparison.bootstrap;

            utils::logInfo(os, kTag, "parametric threshold " + formatNumber(comparison.parametric) +
                           ", bootstrap threshold " + formatNumber(comparison.bootstrap) + " (" +
                           std::to_string(comparison.validIterations) + "/" +
                           std::to_string(comparison.requestedIterations) + " resamples)");

            if (std::fabs(comparison.relativeDifference) > mConfig.divergenceWarning)
                utils::logWarning(os, kTag, "thresholds diverge by " +
                                  formatNumber(comparison.relativeDifference * 100.0, 1) + "%");
        }
        catch (const DegenerateInputException& e)
        {
            utils::logWarning(os, kTag, std::string("bootstrap threshold unavailable, using parametric: ") + e.what());
        }
    }

    context.appliedThreshold = mCorrector.appliedThreshold(context.chosenThreshold);
    details.significant = mCorrector.isSignificant(metric, context.chosenThreshold);

    utils::logInfo(os, kTag, "N = " + std::to_string(context.numStrategies) + ", adjusted alpha " +
                   formatNumber(context.adjustedAlpha, 6) + ", applied threshold " +
                   formatNumber(context.appliedThreshold));

    const std::string reason = details.significant
        ? "Metric " + formatNumber(metric) + " exceeds corrected threshold " + formatNumber(context.appliedThreshold)
        : "Metric " + formatNumber(metric) + " does not exceed corrected threshold " +
          formatNumber(context.appliedThreshold);

    utils::logVerdict(os, kTag, details.significant, reason);
    return BonferroniResult(details.significant ? ValidationStatus::Pass : ValidationStatus::Fail,
                            reason,
                            metric,
                            details);
}

BonferroniResult BonferroniValidator::withConfidenceInterval(const BonferroniResult& result,
                                                             const BootstrapResult& ci)
{
    const bool hasInterval = ci.getStatus() == ValidationStatus::Pass ||
        ci.getStatus() == ValidationStatus::Fail;
    const bool hasThreshold = result.getStatus() == ValidationStatus::Pass ||
        result.getStatus() == ValidationStatus::Fail;

    if (!hasInterval || !hasThreshold)
        return result;

    BonferroniDetails details = result.getDetails();
    const double threshold = details.context.appliedThreshold;
    details.ciLowerClearsThreshold = ci.getDetails().pointEstimate > threshold &&
        ci.getDetails().ciLower > threshold;

    return BonferroniResult(result.getStatus(), result.getReason(), result.getMetricValue(), details);
}

} // namespace validation
} // namespace stratvalidator
