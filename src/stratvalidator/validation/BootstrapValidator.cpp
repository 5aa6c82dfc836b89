#include "BootstrapValidator.h"
#include <cmath>
#include <stdexcept>
#include "BlockBootstrap.h"
#include "BlockResamplers.h"
#include "OutputUtils.h"
#include "ParallelExecutors.h"
#include "RngUtils.h"
#include "StatisticalExceptions.h"

namespace stratvalidator
{
namespace validation
{

using analysis::BlockBootstrap;
using analysis::MovingBlockResampler;
using utils::formatNumber;

namespace
{
    const char* const kTag = "Bootstrap";

    template <class Executor>
    BootstrapDetails runBootstrap(const BootstrapConfig& config,
                                  const MetricFunction& metric,
                                  const std::vector<double>& returns,
                                  uint64_t seed)
    {
        BlockBootstrap<MetricFunction, MovingBlockResampler, std::mt19937_64, Executor>
            bootstrap(config.iterations,
                      config.confidenceLevel,
                      MovingBlockResampler(config.blockLength),
                      config.minObservations,
                      config.maxFailureFraction);

        const auto r = bootstrap.run(returns, metric, seed);

        BootstrapDetails details;
        details.pointEstimate = r.pointEstimate;
        details.ciLower = r.lower;
        details.ciUpper = r.upper;
        details.confidenceLevel = r.cl;
        details.iterationsRequested = r.B;
        details.iterationsUsed = r.effectiveB;
        details.blockLength = r.L;
        details.numObservations = r.n;
        details.standardError = r.standardError;
        details.excludesZero = r.lower > 0.0;
        return details;
    }
}

BootstrapValidator::BootstrapValidator(const BootstrapConfig& config, MetricFunction metric)
    : mConfig(config),
      mMetric(std::move(metric))
{
    if (!mMetric)
        throw std::invalid_argument("BootstrapValidator: metric function must not be empty");

    if (mConfig.iterations == 0)
        throw std::invalid_argument("BootstrapValidator: iterations must be > 0");

    if (mConfig.blockLength == 0)
        throw std::invalid_argument("BootstrapValidator: block length must be > 0");

    if (!(mConfig.confidenceLevel > 0.5 && mConfig.confidenceLevel < 1.0))
        throw std::invalid_argument("BootstrapValidator: confidence level must be in (0.5, 1)");

    if (!(mConfig.maxFailureFraction >= 0.0 && mConfig.maxFailureFraction < 1.0))
        throw std::invalid_argument("BootstrapValidator: max failure fraction must be in [0, 1)");
}

BootstrapResult BootstrapValidator::validate(const ReturnSeries& series,
                                             std::optional<uint64_t> seed,
                                             std::ostream& os) const
{
    return validate(series.getReturns(), seed, os);
}

BootstrapResult BootstrapValidator::validate(const std::vector<double>& returns,
                                             std::optional<uint64_t> seed,
                                             std::ostream& os) const
{
    const uint64_t masterSeed = rng_utils::resolve_seed(seed);
    BootstrapDetails details;

    try
    {
        details = mConfig.parallelReplicates
            ? runBootstrap<concurrency::ThreadPoolExecutor>(mConfig, mMetric, returns, masterSeed)
            : runBootstrap<concurrency::SingleThreadExecutor>(mConfig, mMetric, returns, masterSeed);
    }
    catch (const InsufficientDataException& e)
    {
        utils::logVerdict(os, kTag, false, e.what());
        return BootstrapResult(ValidationStatus::InsufficientData, e.what(), std::nullopt, details);
    }
    catch (const DegenerateInputException& e)
    {
        utils::logVerdict(os, kTag, false, e.what());
        return BootstrapResult(ValidationStatus::DegenerateInput, e.what(), std::nullopt, details);
    }

    utils::logInfo(os, kTag, "point " + formatNumber(details.pointEstimate) + ", " +
                   formatNumber(details.confidenceLevel * 100.0, 1) + "% CI [" +
                   formatNumber(details.ciLower) + ", " + formatNumber(details.ciUpper) + "] from " +
                   std::to_string(details.iterationsUsed) + "/" +
                   std::to_string(details.iterationsRequested) + " resamples, block " +
                   std::to_string(details.blockLength));

    std::string reason;
    bool pass = false;
    if (!details.excludesZero)
        reason = "CI lower bound " + formatNumber(details.ciLower) + " does not exclude zero";
    else if (!(details.ciLower >= mConfig.minLowerBound))
        reason = "CI lower bound " + formatNumber(details.ciLower) + " < " + formatNumber(mConfig.minLowerBound);
    else
    {
        pass = true;
        reason = "CI [" + formatNumber(details.ciLower) + ", " + formatNumber(details.ciUpper) +
            "] excludes zero with lower bound >= " + formatNumber(mConfig.minLowerBound);
    }

    utils::logVerdict(os, kTag, pass, reason);
    return BootstrapResult(pass ? ValidationStatus::Pass : ValidationStatus::Fail,
                           reason,
                           details.pointEstimate,
                           details);
}

} // namespace validation
} // namespace stratvalidator
