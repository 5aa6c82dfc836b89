#include "PeriodEvaluator.h"
#include "StatisticalExceptions.h"

namespace stratvalidator
{
namespace validation
{

CallbackPeriodEvaluator::CallbackPeriodEvaluator(Callback callback)
    : mCallback(std::move(callback))
{
    if (!mCallback)
        throw std::invalid_argument("CallbackPeriodEvaluator: callback must not be empty");
}

double CallbackPeriodEvaluator::evaluatePeriod(const PeriodBounds& bounds) const
{
    try
    {
        return mCallback(bounds.getStartDate(), bounds.getEndDate());
    }
    catch (const UpstreamEvaluationException&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw UpstreamEvaluationException("Evaluation of " + bounds.toString() + " failed: " + e.what());
    }
}

ReturnSeriesPeriodEvaluator::ReturnSeriesPeriodEvaluator(std::shared_ptr<const ReturnSeries> series,
                                                         MetricFunction metric)
    : mSeries(std::move(series)),
      mMetric(std::move(metric))
{
    if (!mSeries)
        throw std::invalid_argument("ReturnSeriesPeriodEvaluator: series must not be null");

    if (!mMetric)
        throw std::invalid_argument("ReturnSeriesPeriodEvaluator: metric function must not be empty");
}

double ReturnSeriesPeriodEvaluator::evaluatePeriod(const PeriodBounds& bounds) const
{
    const ReturnSeries period = mSeries->slice(bounds);
    if (period.size() < 2)
        throw InsufficientDataException("Period " + bounds.toString() + " holds " +
                                        std::to_string(period.size()) + " observations");

    return mMetric(period.getReturns());
}

std::optional<std::size_t> ReturnSeriesPeriodEvaluator::observationCount(const PeriodBounds& bounds) const
{
    return mSeries->countInRange(bounds);
}

BudgetedPeriodEvaluator::BudgetedPeriodEvaluator(std::shared_ptr<const IPeriodEvaluator> inner,
                                                 std::size_t maxEvaluations,
                                                 std::shared_ptr<const ReturnSeries> series)
    : mInner(std::move(inner)),
      mSeries(std::move(series)),
      mMaxEvaluations(maxEvaluations),
      mEvaluations(0)
{
    if (!mInner)
        throw std::invalid_argument("BudgetedPeriodEvaluator: inner evaluator must not be null");
}

double BudgetedPeriodEvaluator::evaluatePeriod(const PeriodBounds& bounds) const
{
    const std::size_t issued = ++mEvaluations;
    if (mMaxEvaluations > 0 && issued > mMaxEvaluations)
        throw EvaluationBudgetExceededException("Evaluation budget of " + std::to_string(mMaxEvaluations) +
                                                " periods exceeded while evaluating " + bounds.toString());

    return mInner->evaluatePeriod(bounds);
}

std::optional<std::size_t> BudgetedPeriodEvaluator::observationCount(const PeriodBounds& bounds) const
{
    const auto count = mInner->observationCount(bounds);
    if (count || !mSeries)
        return count;

    return mSeries->countInRange(bounds);
}

} // namespace validation
} // namespace stratvalidator
