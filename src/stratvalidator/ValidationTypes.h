#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "PeriodBounds.h"
#include "BonferroniCorrection.h"
#include "BaselineTypes.h"

namespace stratvalidator
{
namespace validation
{

/**
 * @brief Outcome category shared by every validator
 */
enum class ValidationStatus
{
    Pass,              ///< All criteria met
    Fail,              ///< Evaluated, criteria not met
    InsufficientData,  ///< Fewer observations or windows than required
    DegenerateInput,   ///< Zero variance, all-NaN, or mean below epsilon
    Unavailable        ///< Upstream evaluation raised or the evaluation budget ran out
};

/**
 * @brief Convert ValidationStatus to its report string ("pass", "fail", ...)
 * @throws std::invalid_argument if status is unknown
 */
std::string toString(ValidationStatus status);

/**
 * @brief Common pass/status/reason part of every validator result.
 *
 * Records are immutable once built; validators create a new record rather
 * than modifying an existing one.
 */
class ValidationRecord
{
public:
    ValidationRecord(ValidationStatus status,
                     std::string reason,
                     std::optional<double> metricValue = std::nullopt)
        : mStatus(status),
          mReason(std::move(reason)),
          mMetricValue(metricValue)
    {}

    bool passed() const
    {
        return mStatus == ValidationStatus::Pass;
    }

    ValidationStatus getStatus() const
    {
        return mStatus;
    }

    const std::string& getReason() const
    {
        return mReason;
    }

    const std::optional<double>& getMetricValue() const
    {
        return mMetricValue;
    }

private:
    ValidationStatus mStatus;
    std::string mReason;
    std::optional<double> mMetricValue;
};

/**
 * @brief Metrics of the train/validation/test split and the verdict on
 *        each pass criterion.
 */
struct DataSplitDetails
{
    std::optional<PeriodBounds> trainBounds;
    std::optional<PeriodBounds> validationBounds;
    std::optional<PeriodBounds> testBounds;
    std::optional<double> trainMetric;
    std::optional<double> validationMetric;
    std::optional<double> testMetric;
    double consistency = 0.0;
    std::optional<double> degradationRatio;   ///< test / train, empty when train <= 0
    bool testCriterionMet = false;
    bool consistencyCriterionMet = false;
    bool degradationCriterionMet = false;
};

/**
 * @brief One walk-forward window, cut on the index axis of a return series.
 *
 * Index ranges are half-open: train = [trainBegin, trainEnd),
 * test = [testBegin, testEnd) with trainEnd == testBegin.
 */
struct WalkForwardWindow
{
    std::size_t index = 0;
    std::size_t trainBegin = 0;
    std::size_t trainEnd = 0;
    std::size_t testBegin = 0;
    std::size_t testEnd = 0;
    std::optional<PeriodBounds> trainBounds;
    std::optional<PeriodBounds> testBounds;
};

struct WindowEvaluation
{
    WalkForwardWindow window;
    std::optional<double> metric;   ///< Empty when evaluation failed
    std::string error;
};

struct WalkForwardDetails
{
    std::vector<WindowEvaluation> windows;
    std::size_t windowsGenerated = 0;
    std::size_t windowsEvaluated = 0;
    double meanMetric = 0.0;
    double stdDevMetric = 0.0;
    double winRate = 0.0;
    double worstMetric = 0.0;
    double bestMetric = 0.0;
};

/**
 * @brief Multiple-comparison context of one significance decision.
 */
struct CorrectionContext
{
    std::size_t numStrategies = 1;
    double familyWiseAlpha = 0.05;
    double adjustedAlpha = 0.05;
    std::size_t numPeriods = 0;
    analysis::ThresholdMode mode = analysis::ThresholdMode::Parametric;
    double parametricThreshold = 0.0;
    std::optional<double> bootstrapThreshold;
    std::optional<double> thresholdDivergence;  ///< relative (bootstrap - parametric) / parametric
    double chosenThreshold = 0.0;               ///< before flooring
    double appliedThreshold = 0.0;              ///< max(floor, chosen)
    double conservativeFloor = 0.5;
};

struct BonferroniDetails
{
    CorrectionContext context;
    double metric = 0.0;
    bool significant = false;
    std::optional<bool> ciLowerClearsThreshold;
};

struct BootstrapDetails
{
    double pointEstimate = 0.0;
    double ciLower = 0.0;
    double ciUpper = 0.0;
    double confidenceLevel = 0.95;
    std::size_t iterationsRequested = 0;
    std::size_t iterationsUsed = 0;
    std::size_t blockLength = 0;
    std::size_t numObservations = 0;
    double standardError = 0.0;
    bool excludesZero = false;
};

struct BaselineOutcome
{
    baseline::BaselineId id;
    std::optional<baseline::BaselineRecord> record;   ///< Empty when unavailable
    std::optional<double> alpha;                      ///< candidate - baseline Sharpe
    std::string error;
};

struct BaselineComparisonDetails
{
    double candidateMetric = 0.0;
    std::optional<PeriodBounds> bounds;
    std::vector<BaselineOutcome> baselines;
    std::size_t availableCount = 0;
    std::optional<double> bestAlpha;
    std::optional<double> worstAlpha;
    std::optional<baseline::BaselineId> bestBaseline;
    bool underperformanceGuardTriggered = false;
};

/**
 * @brief A ValidationRecord carrying the validator specific fields.
 */
template <class Details>
class DetailedValidationResult : public ValidationRecord
{
public:
    DetailedValidationResult(ValidationStatus status,
                             std::string reason,
                             std::optional<double> metricValue,
                             Details details)
        : ValidationRecord(status, std::move(reason), metricValue),
          mDetails(std::move(details))
    {}

    const Details& getDetails() const
    {
        return mDetails;
    }

private:
    Details mDetails;
};

using DataSplitResult = DetailedValidationResult<DataSplitDetails>;
using WalkForwardResult = DetailedValidationResult<WalkForwardDetails>;
using BonferroniResult = DetailedValidationResult<BonferroniDetails>;
using BootstrapResult = DetailedValidationResult<BootstrapDetails>;
using BaselineComparisonResult = DetailedValidationResult<BaselineComparisonDetails>;

using ValidationResult = std::variant<DataSplitResult,
                                      WalkForwardResult,
                                      BonferroniResult,
                                      BootstrapResult,
                                      BaselineComparisonResult>;

const ValidationRecord& getRecord(const ValidationResult& result);

bool passed(const ValidationResult& result);
ValidationStatus getStatus(const ValidationResult& result);
const std::string& getReason(const ValidationResult& result);

/**
 * @brief Report key of the validator that produced result
 *        ("data_split", "walk_forward", "bonferroni", "bootstrap", "baseline")
 */
std::string validatorName(const ValidationResult& result);

} // namespace validation
} // namespace stratvalidator
