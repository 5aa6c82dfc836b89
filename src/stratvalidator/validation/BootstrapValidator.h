#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include "PerformanceMetrics.h"
#include "ReturnSeries.h"
#include "ValidationTypes.h"

namespace stratvalidator
{
namespace validation
{

struct BootstrapConfig
{
    std::size_t iterations = 1000;
    std::size_t blockLength = 21;
    double confidenceLevel = 0.95;
    std::size_t minObservations = 100;
    double maxFailureFraction = 0.10;
    double minLowerBound = 0.5;
    bool parallelReplicates = false;   ///< Run replicates on a thread pool
};

/**
 * @class BootstrapValidator
 * @brief Moving-block bootstrap confidence interval of the candidate metric.
 *
 * Passes when the interval excludes zero (lower > 0) and the lower bound
 * reaches minLowerBound. Replicate engines are derived from the seed and
 * the replicate index, so a seeded run gives the same interval whether or
 * not replicates run in parallel.
 */
class BootstrapValidator
{
public:
    /**
     * @throws std::invalid_argument on an empty metric, zero iterations, zero
     *         block length, CL outside (0.5, 1) or failure fraction outside [0, 1)
     */
    BootstrapValidator(const BootstrapConfig& config, MetricFunction metric);

    BootstrapResult validate(const ReturnSeries& series,
                             std::optional<uint64_t> seed,
                             std::ostream& os) const;

    BootstrapResult validate(const std::vector<double>& returns,
                             std::optional<uint64_t> seed,
                             std::ostream& os) const;

    const BootstrapConfig& getConfig() const
    {
        return mConfig;
    }

private:
    BootstrapConfig mConfig;
    MetricFunction mMetric;
};

} // namespace validation
} // namespace stratvalidator
