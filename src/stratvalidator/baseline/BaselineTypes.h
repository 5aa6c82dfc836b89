#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/functional/hash.hpp>
#include "PeriodBounds.h"
#include "StatUtils.h"

namespace stratvalidator
{
namespace baseline
{

/**
 * @brief Reference portfolios a candidate is compared against
 */
enum class BaselineId
{
    BuyAndHoldIndex,    ///< Passive position in a broad market index
    EqualWeightTopN,    ///< Equal weight over the top N assets by ranking score
    InverseVolatility   ///< Risk parity weights proportional to 1 / trailing volatility
};

/**
 * @brief Report/config string of a baseline id ("buy_and_hold_index", ...)
 * @throws std::invalid_argument if id is unknown
 */
std::string toString(BaselineId id);

/**
 * @brief Parse the string produced by toString(BaselineId)
 * @throws std::invalid_argument if name is not a known baseline
 */
BaselineId baselineIdFromString(const std::string& name);

const std::vector<BaselineId>& allBaselines();

class BaselineSimulationException : public std::runtime_error
{
public:
    explicit BaselineSimulationException(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

// Hash of (id, bounds) identifying one baseline computation
inline std::size_t makeBaselineCacheKey(BaselineId id, const PeriodBounds& bounds)
{
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<int>(id));
    boost::hash_combine(seed, bounds);
    return seed;
}

/**
 * @brief Performance of one reference portfolio over one evaluation horizon.
 */
class BaselineRecord
{
public:
    BaselineRecord(BaselineId id,
                   const PeriodBounds& bounds,
                   double sharpeRatio,
                   double annualizedReturn,
                   double maxDrawdown,
                   std::size_t numPeriods)
        : mId(id),
          mBounds(bounds),
          mSharpeRatio(sharpeRatio),
          mAnnualizedReturn(annualizedReturn),
          mMaxDrawdown(maxDrawdown),
          mNumPeriods(numPeriods),
          mCacheKey(makeBaselineCacheKey(id, bounds))
    {}

    BaselineId getId() const
    {
        return mId;
    }

    const PeriodBounds& getBounds() const
    {
        return mBounds;
    }

    double getSharpeRatio() const
    {
        return mSharpeRatio;
    }

    double getAnnualizedReturn() const
    {
        return mAnnualizedReturn;
    }

    double getMaxDrawdown() const
    {
        return mMaxDrawdown;
    }

    std::size_t getNumPeriods() const
    {
        return mNumPeriods;
    }

    std::size_t getCacheKey() const
    {
        return mCacheKey;
    }

private:
    BaselineId mId;
    PeriodBounds mBounds;
    double mSharpeRatio;
    double mAnnualizedReturn;
    double mMaxDrawdown;
    std::size_t mNumPeriods;
    std::size_t mCacheKey;
};

/**
 * @brief Build a record from the per-period returns of a baseline portfolio.
 *
 * @throws BaselineSimulationException if fewer than two returns are given
 *         or the annualized Sharpe ratio is not finite.
 */
inline BaselineRecord makeBaselineRecord(BaselineId id,
                                         const PeriodBounds& bounds,
                                         const std::vector<double>& returns,
                                         double periodsPerYear)
{
    if (returns.size() < 2)
        throw BaselineSimulationException(toString(id) + ": " + std::to_string(returns.size()) +
                                          " returns inside " + bounds.toString());

    const double sharpe = StatUtils::sharpeRatio(returns, periodsPerYear);
    if (!std::isfinite(sharpe))
        throw BaselineSimulationException(toString(id) + ": Sharpe ratio is not finite over " +
                                          bounds.toString());

    return BaselineRecord(id,
                          bounds,
                          sharpe,
                          StatUtils::annualizedReturn(returns, periodsPerYear),
                          StatUtils::maxDrawdown(returns),
                          returns.size());
}

/**
 * @brief Produces the performance of a reference portfolio over a horizon.
 */
class IBaselineSimulator
{
public:
    virtual ~IBaselineSimulator() = default;

    /**
     * @throws BaselineSimulationException (or any std::exception) when the
     *         baseline cannot be simulated over bounds.
     */
    virtual BaselineRecord simulate(BaselineId id, const PeriodBounds& bounds) const = 0;
};

} // namespace baseline
} // namespace stratvalidator
