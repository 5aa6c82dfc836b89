#include "DataSplitValidator.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include "OutputUtils.h"
#include "StatisticalExceptions.h"
#include "StatUtils.h"

namespace stratvalidator
{
namespace validation
{

using utils::formatNumber;

namespace
{
    const char* const kTag = "DataSplit";

    std::optional<double> finiteOrEmpty(const std::optional<double>& value)
    {
        if (value && std::isfinite(*value))
            return value;

        return std::nullopt;
    }
}

DataSplitValidator::DataSplitValidator(const DataSplitConfig& config)
    : mConfig(config)
{
    const int configured = static_cast<int>(mConfig.trainBounds.has_value()) +
        static_cast<int>(mConfig.validationBounds.has_value()) +
        static_cast<int>(mConfig.testBounds.has_value());

    if (configured != 0 && configured != 3)
        throw std::invalid_argument("DataSplitValidator: train, validation and test bounds must be set together");

    if (configured == 3)
        checkOrdering(*mConfig.trainBounds, *mConfig.validationBounds, *mConfig.testBounds);

    if (!(mConfig.consistencyEpsilon > 0.0))
        throw std::invalid_argument("DataSplitValidator: consistency epsilon must be > 0");
}

void DataSplitValidator::checkOrdering(const PeriodBounds& train,
                                       const PeriodBounds& validation,
                                       const PeriodBounds& test)
{
    if (!train.precedes(validation))
        throw std::invalid_argument("DataSplitValidator: train period " + train.toString() +
                                    " must end before validation period " + validation.toString());

    if (!validation.precedes(test))
        throw std::invalid_argument("DataSplitValidator: validation period " + validation.toString() +
                                    " must end before test period " + test.toString());
}

double DataSplitValidator::computeConsistency(const std::vector<double>& metrics, double epsilon)
{
    std::vector<double> finite;
    finite.reserve(metrics.size());
    std::copy_if(metrics.begin(), metrics.end(), std::back_inserter(finite),
                 [](double m) { return std::isfinite(m); });

    if (finite.size() < 2)
        return 0.0;

    const double mean = StatUtils::computeMean(finite);
    if (mean < epsilon)
        return 0.0;

    const double consistency = 1.0 - StatUtils::computeStdDev(finite) / mean;
    return std::clamp(consistency, 0.0, 1.0);
}

SplitBounds DataSplitValidator::defaultSplit(const ReturnSeries& series)
{
    const std::size_t n = series.size();
    const std::size_t trainEnd = (n * 3) / 7;
    const std::size_t validationEnd = (n * 5) / 7;

    if (trainEnd < 2 || validationEnd < trainEnd + 2 || n < validationEnd + 2)
        throw InsufficientDataException("DataSplitValidator: series of " + std::to_string(n) +
                                        " periods is too short to split");

    return SplitBounds{series.boundsForIndexRange(0, trainEnd),
                       series.boundsForIndexRange(trainEnd, validationEnd),
                       series.boundsForIndexRange(validationEnd, n)};
}

DataSplitResult DataSplitValidator::validate(const IPeriodEvaluator& evaluator,
                                             const PeriodBounds& train,
                                             const PeriodBounds& validation,
                                             const PeriodBounds& test,
                                             std::ostream& os) const
{
    checkOrdering(train, validation, test);

    DataSplitDetails details;
    details.trainBounds = train;
    details.validationBounds = validation;
    details.testBounds = test;

    struct Period
    {
        const char* name;
        const PeriodBounds& bounds;
        std::optional<double>& metric;
    };

    Period periods[] = {
        {"train", train, details.trainMetric},
        {"validation", validation, details.validationMetric},
        {"test", test, details.testMetric}
    };

    for (const auto& period : periods)
    {
        const auto count = evaluator.observationCount(period.bounds);
        if (count && *count < mConfig.minObservationsPerPeriod)
        {
            const std::string reason = std::string("Insufficient data: ") + period.name + " period " +
                period.bounds.toString() + " has " + std::to_string(*count) +
                " observations, minimum " + std::to_string(mConfig.minObservationsPerPeriod);
            utils::logVerdict(os, kTag, false, reason);
            return DataSplitResult(ValidationStatus::InsufficientData, reason, std::nullopt, details);
        }
    }

    for (auto& period : periods)
    {
        try
        {
            period.metric = evaluator.evaluatePeriod(period.bounds);
            utils::logInfo(os, kTag, std::string(period.name) + " " + period.bounds.toString() +
                           ": metric " + formatNumber(*period.metric));
        }
        catch (const UpstreamEvaluationException& e)
        {
            const std::string reason = std::string("Evaluation of ") + period.name + " period unavailable: " + e.what();
            utils::logVerdict(os, kTag, false, reason);
            return DataSplitResult(ValidationStatus::Unavailable, reason, std::nullopt, details);
        }
        catch (const InsufficientDataException& e)
        {
            const std::string reason = std::string("Insufficient data in ") + period.name + " period: " + e.what();
            utils::logVerdict(os, kTag, false, reason);
            return DataSplitResult(ValidationStatus::InsufficientData, reason, std::nullopt, details);
        }
        catch (const DegenerateInputException& e)
        {
            const std::string reason = std::string("Degenerate ") + period.name + " period: " + e.what();
            utils::logVerdict(os, kTag, false, reason);
            return DataSplitResult(ValidationStatus::DegenerateInput, reason, std::nullopt, details);
        }
    }

    return assess(std::move(details), os);
}

DataSplitResult DataSplitValidator::validate(const IPeriodEvaluator& evaluator,
                                             const ReturnSeries& series,
                                             std::ostream& os) const
{
    if (mConfig.trainBounds)
        return validate(evaluator, *mConfig.trainBounds, *mConfig.validationBounds, *mConfig.testBounds, os);

    try
    {
        const SplitBounds split = defaultSplit(series);
        return validate(evaluator, split.train, split.validation, split.test, os);
    }
    catch (const InsufficientDataException& e)
    {
        utils::logVerdict(os, kTag, false, e.what());
        return DataSplitResult(ValidationStatus::InsufficientData, e.what(), std::nullopt, DataSplitDetails());
    }
}

DataSplitResult DataSplitValidator::validateMetrics(double trainMetric,
                                                    double validationMetric,
                                                    double testMetric,
                                                    std::ostream& os) const
{
    DataSplitDetails details;
    details.trainMetric = trainMetric;
    details.validationMetric = validationMetric;
    details.testMetric = testMetric;

    return assess(std::move(details), os);
}

DataSplitResult DataSplitValidator::assess(DataSplitDetails details, std::ostream& os) const
{
    const auto train = finiteOrEmpty(details.trainMetric);
    const auto test = finiteOrEmpty(details.testMetric);

    std::vector<double> finite;
    for (const auto& m : {details.trainMetric, details.validationMetric, details.testMetric})
        if (finiteOrEmpty(m))
            finite.push_back(*m);

    if (finite.size() < 2)
    {
        details.consistency = 0.0;
        const std::string reason = "Fewer than two finite period metrics";
        utils::logVerdict(os, kTag, false, reason);
        return DataSplitResult(ValidationStatus::DegenerateInput, reason, test, details);
    }

    const double mean = StatUtils::computeMean(finite);
    if (mean < mConfig.consistencyEpsilon)
    {
        details.consistency = 0.0;
        const std::string reason = "Mean period metric " + formatNumber(mean) +
            " below epsilon " + formatNumber(mConfig.consistencyEpsilon) + ", consistency set to 0";
        utils::logVerdict(os, kTag, false, reason);
        return DataSplitResult(ValidationStatus::DegenerateInput, reason, test, details);
    }

    details.consistency = computeConsistency(finite, mConfig.consistencyEpsilon);

    if (train && *train > 0.0 && test)
        details.degradationRatio = *test / *train;

    details.testCriterionMet = test && *test > mConfig.minTestMetric;
    details.consistencyCriterionMet = details.consistency > mConfig.minConsistency;
    details.degradationCriterionMet = details.degradationRatio &&
        *details.degradationRatio > mConfig.minDegradationRatio;

    std::vector<std::string> failures;
    if (!details.testCriterionMet)
        failures.push_back("test metric " + formatNumber(details.testMetric) +
                           " <= " + formatNumber(mConfig.minTestMetric));

    if (!details.consistencyCriterionMet)
        failures.push_back("consistency " + formatNumber(details.consistency) +
                           " <= " + formatNumber(mConfig.minConsistency));

    if (!details.degradationRatio)
    {
        std::string cause;
        if (!train)
            cause = "train metric not finite";
        else if (*train <= 0.0)
            cause = "train metric " + formatNumber(*train) + " <= 0";
        else
            cause = "test metric not finite";

        failures.push_back("degradation ratio undefined (" + cause + ")");
    }
    else if (!details.degradationCriterionMet)
        failures.push_back("degradation ratio " + formatNumber(details.degradationRatio) +
                           " <= " + formatNumber(mConfig.minDegradationRatio));

    utils::logInfo(os, kTag, "consistency " + formatNumber(details.consistency) +
                   ", degradation " + formatNumber(details.degradationRatio));

    const bool pass = failures.empty();
    const std::string reason = pass ? "All split criteria met" : utils::join(failures, "; ");

    utils::logVerdict(os, kTag, pass, reason);
    return DataSplitResult(pass ? ValidationStatus::Pass : ValidationStatus::Fail, reason, test, details);
}

} // namespace validation
} // namespace stratvalidator
