#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <atomic>
#include <cmath>
#include <limits>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "BaselineCache.h"
#include "BaselineComparator.h"
#include "TestUtils.h"

using namespace stratvalidator;
using namespace stratvalidator::baseline;
using namespace stratvalidator::validation;
using boost::gregorian::date;
using Catch::Approx;

namespace
{
  class CountingSimulator : public IBaselineSimulator
  {
  public:
    CountingSimulator(std::map<BaselineId, double> sharpeRatios,
                      std::set<BaselineId> failing = {})
      : mSharpeRatios(std::move(sharpeRatios)),
        mFailing(std::move(failing)),
        mCalls(0)
    {}

    BaselineRecord simulate(BaselineId id, const PeriodBounds& bounds) const override
    {
      ++mCalls;
      if (mFailing.count(id) > 0)
        throw BaselineSimulationException("no market data for " + toString(id));

      return BaselineRecord(id, bounds, mSharpeRatios.at(id), 0.08, 0.25, 252);
    }

    int getCalls() const
    {
      return mCalls.load();
    }

  private:
    std::map<BaselineId, double> mSharpeRatios;
    std::set<BaselineId> mFailing;
    mutable std::atomic<int> mCalls;
  };

  std::map<BaselineId, double> defaultSharpeRatios()
  {
    return {{BaselineId::BuyAndHoldIndex, 0.8},
            {BaselineId::EqualWeightTopN, 0.6},
            {BaselineId::InverseVolatility, 1.2}};
  }

  PeriodBounds horizon()
  {
    return PeriodBounds(date(2019, 1, 2), date(2021, 12, 31));
  }
}

TEST_CASE("Baseline id strings", "[Baseline]")
{
  REQUIRE(toString(BaselineId::BuyAndHoldIndex) == "buy_and_hold_index");
  REQUIRE(toString(BaselineId::EqualWeightTopN) == "equal_weight_top_n");
  REQUIRE(toString(BaselineId::InverseVolatility) == "inverse_volatility");

  for (BaselineId id : allBaselines())
    REQUIRE(baselineIdFromString(toString(id)) == id);

  REQUIRE(allBaselines().size() == 3);
  REQUIRE_THROWS_AS(baselineIdFromString("sixty_forty"), std::invalid_argument);
}

TEST_CASE("Baseline cache key identifies baseline and horizon", "[Baseline]")
{
  const PeriodBounds other(date(2019, 1, 2), date(2020, 12, 31));

  REQUIRE(makeBaselineCacheKey(BaselineId::BuyAndHoldIndex, horizon()) ==
          makeBaselineCacheKey(BaselineId::BuyAndHoldIndex, horizon()));
  REQUIRE(makeBaselineCacheKey(BaselineId::BuyAndHoldIndex, horizon()) !=
          makeBaselineCacheKey(BaselineId::InverseVolatility, horizon()));
  REQUIRE(makeBaselineCacheKey(BaselineId::BuyAndHoldIndex, horizon()) !=
          makeBaselineCacheKey(BaselineId::BuyAndHoldIndex, other));

  BaselineRecord record(BaselineId::EqualWeightTopN, horizon(), 0.7, 0.09, 0.3, 756);
  REQUIRE(record.getCacheKey() == makeBaselineCacheKey(BaselineId::EqualWeightTopN, horizon()));
}

TEST_CASE("Baseline records from return streams", "[Baseline]")
{
  auto record = makeBaselineRecord(BaselineId::BuyAndHoldIndex, horizon(),
                                   makeReturnsWithMoments(252, 0.001, 0.01), 252.0);

  REQUIRE(record.getSharpeRatio() == Approx(0.1 * std::sqrt(252.0)));
  REQUIRE(record.getNumPeriods() == 252);
  REQUIRE(record.getMaxDrawdown() <= 0.0);

  REQUIRE_THROWS_AS(makeBaselineRecord(BaselineId::BuyAndHoldIndex, horizon(), {0.01}, 252.0),
                    BaselineSimulationException);
  REQUIRE_THROWS_AS(makeBaselineRecord(BaselineId::BuyAndHoldIndex, horizon(),
                                       std::vector<double>(10, 0.0), 252.0),
                    BaselineSimulationException);
}

TEST_CASE("BaselineCache computes each baseline once", "[Baseline]")
{
  BaselineCache cache;
  int computations = 0;
  auto compute = [&]() {
    ++computations;
    return BaselineRecord(BaselineId::BuyAndHoldIndex, horizon(), 0.9, 0.1, 0.2, 756);
  };

  BaselineRecord first = cache.getOrCompute(BaselineId::BuyAndHoldIndex, horizon(), compute);
  BaselineRecord second = cache.getOrCompute(BaselineId::BuyAndHoldIndex, horizon(), compute);

  REQUIRE(computations == 1);
  REQUIRE(cache.size() == 1);
  REQUIRE(first.getSharpeRatio() == second.getSharpeRatio());
  REQUIRE(cache.find(BaselineId::BuyAndHoldIndex, horizon()).has_value());
  REQUIRE_FALSE(cache.find(BaselineId::InverseVolatility, horizon()).has_value());

  const PeriodBounds shorter(date(2020, 1, 2), date(2021, 12, 31));
  cache.getOrCompute(BaselineId::BuyAndHoldIndex, shorter, compute);
  REQUIRE(computations == 2);
  REQUIRE(cache.size() == 2);

  cache.clear();
  REQUIRE(cache.size() == 0);
}

TEST_CASE("BaselineCache does not cache failed computations", "[Baseline]")
{
  BaselineCache cache;
  int attempts = 0;
  auto failing = [&]() -> BaselineRecord {
    ++attempts;
    throw BaselineSimulationException("feed unavailable");
  };

  REQUIRE_THROWS_AS(cache.getOrCompute(BaselineId::EqualWeightTopN, horizon(), failing),
                    BaselineSimulationException);
  REQUIRE(cache.size() == 0);

  REQUIRE_THROWS_AS(cache.getOrCompute(BaselineId::EqualWeightTopN, horizon(), failing),
                    BaselineSimulationException);
  REQUIRE(attempts == 2);
}

TEST_CASE("BaselineCache is safe under concurrent lookups", "[Baseline]")
{
  BaselineCache cache;
  std::vector<double> seen(8, 0.0);
  std::vector<std::thread> threads;

  for (std::size_t i = 0; i < seen.size(); ++i)
    threads.emplace_back([&cache, &seen, i]() {
      BaselineRecord record = cache.getOrCompute(BaselineId::InverseVolatility, horizon(), [i]() {
        return BaselineRecord(BaselineId::InverseVolatility, horizon(), 1.0 + static_cast<double>(i),
                              0.1, 0.2, 756);
      });
      seen[i] = record.getSharpeRatio();
    });

  for (auto& t : threads)
    t.join();

  REQUIRE(cache.size() == 1);
  const double stored = cache.find(BaselineId::InverseVolatility, horizon())->getSharpeRatio();
  for (double s : seen)
    REQUIRE(s == stored);
}

TEST_CASE("Candidate beating a baseline by the minimum alpha passes", "[Baseline]")
{
  auto simulator = std::make_shared<CountingSimulator>(defaultSharpeRatios());
  auto cache = std::make_shared<BaselineCache>();
  BaselineComparator comparator(simulator, cache);
  std::ostringstream os;

  BaselineComparisonResult result = comparator.compare(1.5, horizon(), os);
  const auto& details = result.getDetails();

  REQUIRE(result.getStatus() == ValidationStatus::Pass);
  REQUIRE(details.availableCount == 3);
  REQUIRE(*details.bestAlpha == Approx(0.9));
  REQUIRE(*details.worstAlpha == Approx(0.3));
  REQUIRE(*details.bestBaseline == BaselineId::EqualWeightTopN);
  REQUIRE(*result.getMetricValue() == Approx(0.9));
  REQUIRE(details.baselines.size() == 3);

  SECTION("repeated comparisons reuse cached baselines")
  {
    comparator.compare(1.0, horizon(), os);
    BaselineComparator another(simulator, cache);
    another.compare(2.0, horizon(), os);

    REQUIRE(simulator->getCalls() == 3);
    REQUIRE(cache->size() == 3);
  }
}

TEST_CASE("Candidate below the minimum alpha fails", "[Baseline]")
{
  BaselineComparator comparator(std::make_shared<CountingSimulator>(defaultSharpeRatios()),
                                std::make_shared<BaselineCache>());
  std::ostringstream os;

  BaselineComparisonResult result = comparator.compare(1.0, horizon(), os);

  REQUIRE(result.getStatus() == ValidationStatus::Fail);
  REQUIRE(*result.getDetails().bestAlpha == Approx(0.4));
}

TEST_CASE("Unavailable baselines are excluded", "[Baseline]")
{
  auto simulator = std::make_shared<CountingSimulator>(defaultSharpeRatios(),
                                                       std::set<BaselineId>{BaselineId::EqualWeightTopN});
  BaselineComparator comparator(simulator, std::make_shared<BaselineCache>());
  std::ostringstream os;

  BaselineComparisonResult result = comparator.compare(1.5, horizon(), os);
  const auto& details = result.getDetails();

  REQUIRE(details.availableCount == 2);
  REQUIRE(*details.bestBaseline == BaselineId::BuyAndHoldIndex);
  REQUIRE(*details.bestAlpha == Approx(0.7));
  REQUIRE(result.getStatus() == ValidationStatus::Pass);
  REQUIRE_FALSE(details.baselines[1].record.has_value());
  REQUIRE(details.baselines[1].error.find("no market data") != std::string::npos);
}

TEST_CASE("No available baseline is unavailable", "[Baseline]")
{
  auto simulator = std::make_shared<CountingSimulator>(
    defaultSharpeRatios(),
    std::set<BaselineId>{BaselineId::BuyAndHoldIndex, BaselineId::EqualWeightTopN, BaselineId::InverseVolatility});
  BaselineComparator comparator(simulator, std::make_shared<BaselineCache>());
  std::ostringstream os;

  BaselineComparisonResult result = comparator.compare(1.5, horizon(), os);

  REQUIRE(result.getStatus() == ValidationStatus::Unavailable);
  REQUIRE_FALSE(result.passed());
  REQUIRE(result.getDetails().availableCount == 0);
}

TEST_CASE("Underperformance guard", "[Baseline]")
{
  std::map<BaselineId, double> sharpeRatios = {{BaselineId::BuyAndHoldIndex, 2.5},
                                               {BaselineId::EqualWeightTopN, 0.2},
                                               {BaselineId::InverseVolatility, 0.4}};
  auto simulator = std::make_shared<CountingSimulator>(sharpeRatios);
  std::ostringstream os;

  SECTION("disabled by default")
  {
    BaselineComparator comparator(simulator, std::make_shared<BaselineCache>());
    BaselineComparisonResult result = comparator.compare(1.0, horizon(), os);

    REQUIRE(result.getStatus() == ValidationStatus::Pass);
    REQUIRE_FALSE(result.getDetails().underperformanceGuardTriggered);
  }

  SECTION("enabled it fails a candidate far below one baseline")
  {
    BaselineConfig config;
    config.underperformanceGuard = true;
    BaselineComparator comparator(simulator, std::make_shared<BaselineCache>(), config);
    BaselineComparisonResult result = comparator.compare(1.0, horizon(), os);

    REQUIRE(result.getStatus() == ValidationStatus::Fail);
    REQUIRE(result.getDetails().underperformanceGuardTriggered);
    REQUIRE(*result.getDetails().worstAlpha == Approx(-1.5));
  }
}

TEST_CASE("Non-finite candidate metric is degenerate", "[Baseline]")
{
  BaselineComparator comparator(std::make_shared<CountingSimulator>(defaultSharpeRatios()),
                                std::make_shared<BaselineCache>());
  std::ostringstream os;

  REQUIRE(comparator.compare(std::numeric_limits<double>::quiet_NaN(), horizon(), os).getStatus() ==
          ValidationStatus::DegenerateInput);
}

TEST_CASE("Series comparison uses the lookback horizon", "[Baseline]")
{
  auto simulator = std::make_shared<CountingSimulator>(defaultSharpeRatios());
  ReturnSeries series = makeNormalReturnSeries(500, 0.001, 0.01, 8);
  std::ostringstream os;

  SECTION("whole series by default")
  {
    BaselineComparator comparator(simulator, std::make_shared<BaselineCache>());
    BaselineComparisonResult result = comparator.compare(series, makeAnnualizedSharpeMetric(), os);

    REQUIRE(*result.getDetails().bounds == series.getBounds());
    REQUIRE(result.getDetails().candidateMetric == Approx(makeAnnualizedSharpeMetric()(series.getReturns())));
  }

  SECTION("trailing lookback")
  {
    BaselineConfig config;
    config.lookbackPeriods = 252;
    BaselineComparator comparator(simulator, std::make_shared<BaselineCache>(), config);
    BaselineComparisonResult result = comparator.compare(series, makeAnnualizedSharpeMetric(), os);

    REQUIRE(result.getDetails().bounds->getStartDate() == series.getDate(248));
    REQUIRE(result.getDetails().bounds->getEndDate() == series.getLastDate());
  }

  SECTION("too short")
  {
    BaselineComparator comparator(simulator, std::make_shared<BaselineCache>());
    BaselineComparisonResult result = comparator.compare(makeReturnSeries({0.01}), makeAnnualizedSharpeMetric(), os);

    REQUIRE(result.getStatus() == ValidationStatus::InsufficientData);
  }
}

TEST_CASE("BaselineComparator construction checks", "[Baseline]")
{
  auto simulator = std::make_shared<CountingSimulator>(defaultSharpeRatios());

  REQUIRE_THROWS_AS(BaselineComparator(nullptr, std::make_shared<BaselineCache>()), std::invalid_argument);
  REQUIRE_THROWS_AS(BaselineComparator(simulator, nullptr), std::invalid_argument);

  BaselineConfig none;
  none.baselines.clear();
  REQUIRE_THROWS_AS(BaselineComparator(simulator, std::make_shared<BaselineCache>(), none), std::invalid_argument);
}
