#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PeriodBounds.h"
#include "ReturnSeries.h"
#include "PerformanceMetrics.h"

namespace stratvalidator
{
namespace validation
{

/**
 * @brief Raised when the collaborator that evaluates a period fails.
 *
 * Validators report it as ValidationStatus::Unavailable, never as Fail.
 */
class UpstreamEvaluationException : public std::runtime_error
{
public:
    explicit UpstreamEvaluationException(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

class EvaluationBudgetExceededException : public UpstreamEvaluationException
{
public:
    explicit EvaluationBudgetExceededException(const std::string& msg)
        : UpstreamEvaluationException(msg)
    {}
};

/**
 * @brief Computes the candidate's metric over a date range.
 */
class IPeriodEvaluator
{
public:
    virtual ~IPeriodEvaluator() = default;

    /**
     * @throws UpstreamEvaluationException if the underlying evaluation fails
     * @throws InsufficientDataException if the period holds too few observations
     */
    virtual double evaluatePeriod(const PeriodBounds& bounds) const = 0;

    // Number of return observations inside bounds, when the evaluator knows it
    virtual std::optional<std::size_t> observationCount(const PeriodBounds& bounds) const
    {
        (void) bounds;
        return std::nullopt;
    }
};

/**
 * @brief Adapts a caller supplied evaluate(start, end) callback.
 *
 * Any std::exception thrown by the callback is rethrown as
 * UpstreamEvaluationException.
 */
class CallbackPeriodEvaluator : public IPeriodEvaluator
{
public:
    using Callback = std::function<double(const boost::gregorian::date&, const boost::gregorian::date&)>;

    explicit CallbackPeriodEvaluator(Callback callback);

    double evaluatePeriod(const PeriodBounds& bounds) const override;

private:
    Callback mCallback;
};

/**
 * @brief Evaluates a metric function on slices of a return series.
 */
class ReturnSeriesPeriodEvaluator : public IPeriodEvaluator
{
public:
    ReturnSeriesPeriodEvaluator(std::shared_ptr<const ReturnSeries> series,
                                MetricFunction metric);

    double evaluatePeriod(const PeriodBounds& bounds) const override;

    std::optional<std::size_t> observationCount(const PeriodBounds& bounds) const override;

private:
    std::shared_ptr<const ReturnSeries> mSeries;
    MetricFunction mMetric;
};

/**
 * @brief Caps the number of evaluations forwarded to another evaluator.
 *
 * A budget of 0 means unlimited. The count is shared by all threads using
 * this instance. When the inner evaluator cannot count observations, they
 * are counted in the candidate's own series if one is given.
 */
class BudgetedPeriodEvaluator : public IPeriodEvaluator
{
public:
    BudgetedPeriodEvaluator(std::shared_ptr<const IPeriodEvaluator> inner,
                            std::size_t maxEvaluations,
                            std::shared_ptr<const ReturnSeries> series = nullptr);

    double evaluatePeriod(const PeriodBounds& bounds) const override;

    std::optional<std::size_t> observationCount(const PeriodBounds& bounds) const override;

    std::size_t getEvaluationCount() const
    {
        return mEvaluations.load();
    }

private:
    std::shared_ptr<const IPeriodEvaluator> mInner;
    std::shared_ptr<const ReturnSeries> mSeries;
    std::size_t mMaxEvaluations;
    mutable std::atomic<std::size_t> mEvaluations;
};

} // namespace validation
} // namespace stratvalidator
