#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "BonferroniCorrection.h"
#include "NormalQuantile.h"

using namespace stratvalidator::analysis;
using Catch::Approx;

TEST_CASE("BonferroniCorrector: adjusted alpha is alpha / N", "[Bonferroni]")
{
  for (std::size_t n : {1u, 2u, 7u, 20u, 500u, 10000u})
    {
      BonferroniCorrector corrector(n, 0.05);
      REQUIRE(corrector.getAdjustedAlpha() == 0.05 / static_cast<double>(n));
    }

  BonferroniCorrector corrector(500);
  REQUIRE(corrector.getAdjustedAlpha() == Approx(0.0001));
  REQUIRE(corrector.getFamilyWiseAlpha() == 0.05);
  REQUIRE(corrector.getConservativeFloor() == 0.5);
}

TEST_CASE("BonferroniCorrector: invalid configuration", "[Bonferroni]")
{
  REQUIRE_THROWS_AS(BonferroniCorrector(0), std::invalid_argument);
  REQUIRE_THROWS_AS(BonferroniCorrector(10, 0.0), std::invalid_argument);
  REQUIRE_THROWS_AS(BonferroniCorrector(10, 1.0), std::invalid_argument);
  REQUIRE_THROWS_AS(BonferroniCorrector(10, 0.05, -0.1), std::invalid_argument);
  REQUIRE_THROWS_AS(BonferroniCorrector(10).parametricThreshold(1), std::invalid_argument);
}

TEST_CASE("BonferroniCorrector: parametric threshold", "[Bonferroni]")
{
  SECTION("single strategy reduces to the usual two-sided z")
  {
    BonferroniCorrector corrector(1);
    REQUIRE(corrector.parametricThreshold(252) == Approx(1.959963984540054 / std::sqrt(252.0)));
  }

  SECTION("threshold is non-decreasing in the number of strategies")
  {
    double previous = 0.0;
    for (std::size_t n = 1; n <= 2000; n *= 3)
      {
        const double t = BonferroniCorrector(n).parametricThreshold(252);
        REQUIRE(t >= previous);
        previous = t;
      }
  }

  SECTION("threshold shrinks with more return periods")
  {
    BonferroniCorrector corrector(50);
    REQUIRE(corrector.parametricThreshold(1000) < corrector.parametricThreshold(250));
  }
}

TEST_CASE("BonferroniCorrector: N=500 screening rejects a 0.4 metric over 252 periods", "[Bonferroni][Scenario]")
{
  BonferroniCorrector corrector(500, 0.05);
  REQUIRE(corrector.getAdjustedAlpha() == Approx(0.0001));

  const double raw = corrector.parametricThreshold(252);
  REQUIRE(raw == Approx(3.890591886413 / std::sqrt(252.0)).epsilon(1e-9));
  REQUIRE(raw < 0.5);
  REQUIRE(corrector.appliedThreshold(raw) == 0.5);

  REQUIRE_FALSE(corrector.isSignificant(0.4, raw));
  REQUIRE(corrector.isSignificant(0.51, raw));
}

TEST_CASE("BonferroniCorrector: significance edge cases", "[Bonferroni]")
{
  BonferroniCorrector corrector(10);
  REQUIRE_FALSE(corrector.isSignificant(std::numeric_limits<double>::quiet_NaN(), 0.1));
  REQUIRE_FALSE(corrector.isSignificant(std::numeric_limits<double>::infinity(), 0.1));
  // Strictly greater than the applied threshold
  REQUIRE_FALSE(corrector.isSignificant(0.5, 0.1));
  REQUIRE(corrector.isSignificant(0.9, 0.8));
  REQUIRE_FALSE(corrector.isSignificant(0.7, 0.8));
}

TEST_CASE("BonferroniCorrector: bootstrap threshold", "[Bonferroni][Bootstrap]")
{
  BonferroniCorrector corrector(20);
  BootstrapNullSettings settings;

  auto a = corrector.bootstrapThreshold(252, settings, 2718);
  auto b = corrector.bootstrapThreshold(252, settings, 2718);

  REQUIRE(a.bootstrap == b.bootstrap);
  REQUIRE(std::isfinite(a.bootstrap));
  REQUIRE(a.bootstrap > 0.0);
  REQUIRE(a.parametric == Approx(corrector.parametricThreshold(252)));
  REQUIRE(a.absoluteDifference == Approx(a.bootstrap - a.parametric));
  REQUIRE(a.relativeDifference == Approx(a.absoluteDifference / a.parametric));
  REQUIRE(std::fabs(a.relativeDifference) < 0.5);
  REQUIRE(a.validIterations == 1000);
  REQUIRE(a.requestedIterations == 1000);

  SECTION("invalid settings")
  {
    BootstrapNullSettings bad;
    bad.iterations = 0;
    REQUIRE_THROWS_AS(corrector.bootstrapThreshold(252, bad, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(corrector.bootstrapThreshold(1, settings, 1), std::invalid_argument);
  }
}

TEST_CASE("BonferroniCorrector: error-rate summaries", "[Bonferroni]")
{
  BonferroniCorrector corrector(100, 0.05);
  REQUIRE(corrector.expectedFalseDiscoveries() == Approx(0.05));
  REQUIRE(corrector.familyWiseErrorRate() == Approx(1.0 - std::pow(1.0 - 0.0005, 100.0)));
  REQUIRE(corrector.familyWiseErrorRate() <= 0.05);

  std::vector<std::string> ids{"a", "b", "c", "d"};
  std::vector<double> metrics{1.2, 0.3, std::nan(""), 0.8};
  std::vector<double> thresholds(4, 0.6);

  StrategySetCorrection summary = summarizeStrategySet(corrector, ids, metrics, thresholds);
  REQUIRE(summary.totalStrategies == 4);
  REQUIRE(summary.significantCount == 2);
  REQUIRE(summary.significantStrategies == std::vector<std::string>{"a", "d"});
  REQUIRE(summary.estimatedFalseDiscoveryRate == Approx(0.05 / 2.0));

  std::vector<double> shortThresholds(3, 0.6);
  REQUIRE_THROWS_AS(summarizeStrategySet(corrector, ids, metrics, shortThresholds), std::invalid_argument);
}
