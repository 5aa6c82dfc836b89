#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <vector>
#include "PeriodBounds.h"
#include "PeriodEvaluator.h"
#include "ReturnSeries.h"
#include "ValidationTypes.h"

namespace stratvalidator
{
namespace validation
{

struct DataSplitConfig
{
    std::optional<PeriodBounds> trainBounds;        ///< All three set, or none for the default split
    std::optional<PeriodBounds> validationBounds;
    std::optional<PeriodBounds> testBounds;
    double minTestMetric = 1.0;
    double minConsistency = 0.6;
    double minDegradationRatio = 0.7;
    double consistencyEpsilon = 0.1;
    std::size_t minObservationsPerPeriod = 252;
};

struct SplitBounds
{
    PeriodBounds train;
    PeriodBounds validation;
    PeriodBounds test;
};

/**
 * @class DataSplitValidator
 * @brief Temporal train/validation/test stability check.
 *
 * The metric is computed in each of three chronologically ordered periods.
 * The strategy passes when the test metric is high enough, the three
 * metrics agree (consistency = 1 - sd/mean, clamped to [0, 1]) and the test
 * metric retains enough of the training metric (degradation = test/train).
 *
 * A mean below the consistency epsilon is rejected with consistency 0, so a
 * losing strategy with tightly clustered metrics never scores as consistent.
 */
class DataSplitValidator
{
public:
    /**
     * @throws std::invalid_argument if only some of the bounds are set, they
     *         overlap or are out of order, or the epsilon is not positive
     */
    explicit DataSplitValidator(const DataSplitConfig& config = DataSplitConfig());

    /**
     * @brief 1 - sample sd / mean over the finite metrics, clamped to [0, 1].
     *        0 when fewer than two metrics are finite or mean < epsilon.
     */
    static double computeConsistency(const std::vector<double>& metrics, double epsilon);

    /**
     * @brief Chronological 3/7, 2/7, 2/7 split of the series by index.
     * @throws InsufficientDataException if a segment would hold fewer than 2 entries
     */
    static SplitBounds defaultSplit(const ReturnSeries& series);

    /**
     * @throws std::invalid_argument if the bounds overlap or are out of order
     */
    DataSplitResult validate(const IPeriodEvaluator& evaluator,
                             const PeriodBounds& train,
                             const PeriodBounds& validation,
                             const PeriodBounds& test,
                             std::ostream& os) const;

    // Uses the configured bounds, or the default split of series
    DataSplitResult validate(const IPeriodEvaluator& evaluator,
                             const ReturnSeries& series,
                             std::ostream& os) const;

    // Precomputed period metrics
    DataSplitResult validateMetrics(double trainMetric,
                                    double validationMetric,
                                    double testMetric,
                                    std::ostream& os) const;

    const DataSplitConfig& getConfig() const
    {
        return mConfig;
    }

private:
    static void checkOrdering(const PeriodBounds& train,
                              const PeriodBounds& validation,
                              const PeriodBounds& test);

    DataSplitResult assess(DataSplitDetails details, std::ostream& os) const;

private:
    DataSplitConfig mConfig;
};

} // namespace validation
} // namespace stratvalidator
