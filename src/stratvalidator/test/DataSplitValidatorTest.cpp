#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "DataSplitValidator.h"
#include "StatisticalExceptions.h"
#include "TestUtils.h"

using namespace stratvalidator;
using namespace stratvalidator::validation;
using boost::gregorian::date;
using Catch::Approx;

namespace
{
  PeriodBounds trainPeriod()
  {
    return PeriodBounds(date(2015, 1, 2), date(2017, 12, 29));
  }

  PeriodBounds validationPeriod()
  {
    return PeriodBounds(date(2018, 1, 2), date(2019, 12, 31));
  }

  PeriodBounds testPeriod()
  {
    return PeriodBounds(date(2020, 1, 2), date(2021, 12, 31));
  }
}

TEST_CASE("DataSplitValidator passes a strategy with a stable metric", "[DataSplitValidator]")
{
  CallbackPeriodEvaluator evaluator([](const date&, const date&) { return 1.4; });
  DataSplitValidator validator;
  std::ostringstream os;

  DataSplitResult result = validator.validate(evaluator, trainPeriod(), validationPeriod(), testPeriod(), os);

  REQUIRE(result.getStatus() == ValidationStatus::Pass);
  REQUIRE(result.passed());
  REQUIRE(result.getDetails().consistency == Approx(1.0));
  REQUIRE(*result.getDetails().degradationRatio == Approx(1.0));
  REQUIRE(*result.getMetricValue() == Approx(1.4));
  REQUIRE(result.getDetails().testCriterionMet);
  REQUIRE(result.getDetails().consistencyCriterionMet);
  REQUIRE(result.getDetails().degradationCriterionMet);
  REQUIRE(os.str().find("[DataSplit]") != std::string::npos);
}

TEST_CASE("DataSplitValidator evaluates each period with its own dates", "[DataSplitValidator]")
{
  std::vector<date> starts;
  CallbackPeriodEvaluator evaluator([&](const date& start, const date&) {
    starts.push_back(start);
    return start.year() < 2020 ? 1.6 : 1.3;
  });

  DataSplitValidator validator;
  std::ostringstream os;
  DataSplitResult result = validator.validate(evaluator, trainPeriod(), validationPeriod(), testPeriod(), os);

  REQUIRE(starts.size() == 3);
  REQUIRE(starts[0] == trainPeriod().getStartDate());
  REQUIRE(starts[1] == validationPeriod().getStartDate());
  REQUIRE(starts[2] == testPeriod().getStartDate());
  REQUIRE(*result.getDetails().trainMetric == Approx(1.6));
  REQUIRE(*result.getDetails().testMetric == Approx(1.3));
  REQUIRE(*result.getDetails().degradationRatio == Approx(1.3 / 1.6));
}

TEST_CASE("Consistency of losing strategies is zero", "[DataSplitValidator]")
{
  REQUIRE(DataSplitValidator::computeConsistency({-0.5, -0.6, -0.7}, 0.1) == 0.0);

  DataSplitValidator validator;
  std::ostringstream os;
  DataSplitResult result = validator.validateMetrics(-0.5, -0.6, -0.7, os);

  REQUIRE(result.getStatus() == ValidationStatus::DegenerateInput);
  REQUIRE_FALSE(result.passed());
  REQUIRE(result.getDetails().consistency == 0.0);
}

TEST_CASE("Consistency never increases with dispersion", "[DataSplitValidator]")
{
  const double tight = DataSplitValidator::computeConsistency({1.0, 1.0, 1.0}, 0.1);
  const double moderate = DataSplitValidator::computeConsistency({0.9, 1.0, 1.1}, 0.1);
  const double wide = DataSplitValidator::computeConsistency({0.5, 1.0, 1.5}, 0.1);
  const double extreme = DataSplitValidator::computeConsistency({0.1, 2.0, 0.2}, 0.1);

  REQUIRE(tight == Approx(1.0));
  REQUIRE(moderate == Approx(0.9));
  REQUIRE(wide == Approx(0.5));
  REQUIRE(extreme == 0.0);

  REQUIRE(tight >= moderate);
  REQUIRE(moderate >= wide);
  REQUIRE(wide >= extreme);
}

TEST_CASE("Consistency ignores non-finite metrics", "[DataSplitValidator]")
{
  const double nan = std::numeric_limits<double>::quiet_NaN();

  REQUIRE(DataSplitValidator::computeConsistency({1.0, nan, 1.0}, 0.1) == Approx(1.0));
  REQUIRE(DataSplitValidator::computeConsistency({nan, nan, 1.0}, 0.1) == 0.0);

  DataSplitValidator validator;
  std::ostringstream os;
  REQUIRE(validator.validateMetrics(nan, nan, 1.2, os).getStatus() == ValidationStatus::DegenerateInput);
}

TEST_CASE("DataSplitValidator fails on weak out-of-sample performance", "[DataSplitValidator]")
{
  DataSplitValidator validator;
  std::ostringstream os;

  DataSplitResult result = validator.validateMetrics(2.0, 1.8, 0.9, os);

  REQUIRE(result.getStatus() == ValidationStatus::Fail);
  REQUIRE_FALSE(result.getDetails().testCriterionMet);
  REQUIRE_FALSE(result.getDetails().degradationCriterionMet);
  REQUIRE(*result.getDetails().degradationRatio == Approx(0.45));
  REQUIRE(result.getReason().find("test metric") != std::string::npos);
}

TEST_CASE("Degradation is undefined when the train metric is not positive", "[DataSplitValidator]")
{
  DataSplitValidator validator;
  std::ostringstream os;

  DataSplitResult result = validator.validateMetrics(-0.2, 1.5, 1.6, os);

  REQUIRE(result.getStatus() == ValidationStatus::Fail);
  REQUIRE_FALSE(result.getDetails().degradationRatio.has_value());
  REQUIRE_FALSE(result.getDetails().degradationCriterionMet);
  REQUIRE(result.getReason().find("undefined") != std::string::npos);
  REQUIRE(result.getReason().find("train metric -0.2") != std::string::npos);
}

TEST_CASE("Degradation reason names a non-finite test metric", "[DataSplitValidator]")
{
  DataSplitValidator validator;
  std::ostringstream os;

  DataSplitResult result = validator.validateMetrics(1.5, 1.4, std::numeric_limits<double>::quiet_NaN(), os);

  REQUIRE(result.getStatus() == ValidationStatus::Fail);
  REQUIRE_FALSE(result.getDetails().degradationRatio.has_value());
  REQUIRE(result.getReason().find("degradation ratio undefined (test metric not finite)") != std::string::npos);
  REQUIRE(result.getReason().find("train metric") == std::string::npos);
}

TEST_CASE("DataSplitValidator rejects misordered periods", "[DataSplitValidator]")
{
  CallbackPeriodEvaluator evaluator([](const date&, const date&) { return 1.4; });
  DataSplitValidator validator;
  std::ostringstream os;

  REQUIRE_THROWS_AS(validator.validate(evaluator, validationPeriod(), trainPeriod(), testPeriod(), os),
                    std::invalid_argument);

  PeriodBounds overlapping(date(2019, 6, 3), date(2021, 12, 31));
  REQUIRE_THROWS_AS(validator.validate(evaluator, trainPeriod(), validationPeriod(), overlapping, os),
                    std::invalid_argument);
}

TEST_CASE("DataSplitConfig validation", "[DataSplitValidator]")
{
  DataSplitConfig partial;
  partial.trainBounds = trainPeriod();
  REQUIRE_THROWS_AS(DataSplitValidator(partial), std::invalid_argument);

  DataSplitConfig misordered;
  misordered.trainBounds = testPeriod();
  misordered.validationBounds = validationPeriod();
  misordered.testBounds = trainPeriod();
  REQUIRE_THROWS_AS(DataSplitValidator(misordered), std::invalid_argument);

  DataSplitConfig badEpsilon;
  badEpsilon.consistencyEpsilon = 0.0;
  REQUIRE_THROWS_AS(DataSplitValidator(badEpsilon), std::invalid_argument);

  DataSplitConfig complete;
  complete.trainBounds = trainPeriod();
  complete.validationBounds = validationPeriod();
  complete.testBounds = testPeriod();
  REQUIRE_NOTHROW(DataSplitValidator(complete));
}

TEST_CASE("Default split cuts the series at 3/7 and 5/7", "[DataSplitValidator]")
{
  ReturnSeries series = makeNormalReturnSeries(700, 0.0005, 0.01, 11);
  SplitBounds split = DataSplitValidator::defaultSplit(series);

  REQUIRE(series.countInRange(split.train) == 300);
  REQUIRE(series.countInRange(split.validation) == 200);
  REQUIRE(series.countInRange(split.test) == 200);
  REQUIRE(split.train.precedes(split.validation));
  REQUIRE(split.validation.precedes(split.test));
  REQUIRE(split.train.getStartDate() == series.getFirstDate());
  REQUIRE(split.test.getEndDate() == series.getLastDate());

  REQUIRE_THROWS_AS(DataSplitValidator::defaultSplit(makeNormalReturnSeries(5, 0.0, 0.01, 11)),
                    InsufficientDataException);
}

TEST_CASE("Short periods are reported as insufficient data", "[DataSplitValidator]")
{
  auto series = std::make_shared<const ReturnSeries>(makeNormalReturnSeries(300, 0.001, 0.01, 5));
  ReturnSeriesPeriodEvaluator evaluator(series, makeAnnualizedSharpeMetric());
  DataSplitValidator validator;
  std::ostringstream os;

  DataSplitResult result = validator.validate(evaluator, *series, os);

  REQUIRE(result.getStatus() == ValidationStatus::InsufficientData);
  REQUIRE_FALSE(result.passed());
  REQUIRE_FALSE(result.getMetricValue().has_value());
}

TEST_CASE("Series that cannot be split are reported as insufficient data", "[DataSplitValidator]")
{
  auto series = std::make_shared<const ReturnSeries>(makeNormalReturnSeries(6, 0.001, 0.01, 5));
  ReturnSeriesPeriodEvaluator evaluator(series, makeAnnualizedSharpeMetric());
  DataSplitValidator validator;
  std::ostringstream os;

  REQUIRE(validator.validate(evaluator, *series, os).getStatus() == ValidationStatus::InsufficientData);
}

TEST_CASE("Default split evaluates slices of the series", "[DataSplitValidator]")
{
  auto series = std::make_shared<const ReturnSeries>(makeNormalReturnSeries(1400, 0.001, 0.01, 17));
  ReturnSeriesPeriodEvaluator evaluator(series, makeAnnualizedSharpeMetric());
  DataSplitValidator validator;
  std::ostringstream os;

  DataSplitResult result = validator.validate(evaluator, *series, os);

  REQUIRE(result.getStatus() != ValidationStatus::InsufficientData);
  REQUIRE(result.getStatus() != ValidationStatus::Unavailable);
  REQUIRE(result.getDetails().trainMetric.has_value());
  REQUIRE(result.getDetails().validationMetric.has_value());
  REQUIRE(result.getDetails().testMetric.has_value());

  const SplitBounds split = DataSplitValidator::defaultSplit(*series);
  const double expectedTest = makeAnnualizedSharpeMetric()(series->slice(split.test).getReturns());
  REQUIRE(*result.getDetails().testMetric == Approx(expectedTest));
}

TEST_CASE("Upstream evaluation failure is reported as unavailable", "[DataSplitValidator]")
{
  CallbackPeriodEvaluator evaluator([](const date& start, const date&) -> double {
    if (start.year() >= 2018)
      throw std::runtime_error("simulation engine offline");
    return 1.5;
  });

  DataSplitValidator validator;
  std::ostringstream os;
  DataSplitResult result = validator.validate(evaluator, trainPeriod(), validationPeriod(), testPeriod(), os);

  REQUIRE(result.getStatus() == ValidationStatus::Unavailable);
  REQUIRE_FALSE(result.passed());
  REQUIRE(*result.getDetails().trainMetric == Approx(1.5));
  REQUIRE_FALSE(result.getDetails().validationMetric.has_value());
  REQUIRE(result.getReason().find("simulation engine offline") != std::string::npos);
}
