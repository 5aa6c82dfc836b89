// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, November 2017
//

#include "BonferroniCorrection.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include "BlockResamplers.h"
#include "NormalQuantile.h"
#include "PerformanceMetrics.h"
#include "RngUtils.h"
#include "StatisticalExceptions.h"
#include "StatUtils.h"

namespace stratvalidator
{
  namespace analysis
  {
    std::string toString(ThresholdMode mode)
    {
      switch (mode)
	{
	case ThresholdMode::Parametric:
	  return "parametric";
	case ThresholdMode::Bootstrap:
	  return "bootstrap";
	}

      return "unknown";
    }

    BonferroniCorrector::BonferroniCorrector(std::size_t numStrategies,
					     double familyWiseAlpha,
					     double conservativeFloor)
      : mNumStrategies(numStrategies),
	mFamilyWiseAlpha(familyWiseAlpha),
	mAdjustedAlpha(0.0),
	mConservativeFloor(conservativeFloor)
    {
      if (numStrategies == 0)
	throw std::invalid_argument("BonferroniCorrector: number of strategies must be >= 1");

      if (!(familyWiseAlpha > 0.0 && familyWiseAlpha < 1.0))
	throw std::invalid_argument("BonferroniCorrector: family-wise alpha must be in (0, 1)");

      if (!(conservativeFloor >= 0.0) || !std::isfinite(conservativeFloor))
	throw std::invalid_argument("BonferroniCorrector: conservative floor must be a non-negative number");

      mAdjustedAlpha = familyWiseAlpha / static_cast<double>(numStrategies);
    }

    double BonferroniCorrector::parametricThreshold(std::size_t numPeriods) const
    {
      if (numPeriods < 2)
	throw std::invalid_argument("BonferroniCorrector::parametricThreshold: at least 2 return periods are required");

      const double z = detail::compute_normal_quantile(1.0 - mAdjustedAlpha / 2.0);
      return z / std::sqrt(static_cast<double>(numPeriods));
    }

    ThresholdComparison BonferroniCorrector::bootstrapThreshold(std::size_t numPeriods,
								const BootstrapNullSettings& settings,
								uint64_t seed) const
    {
      if (settings.iterations == 0)
	throw std::invalid_argument("BonferroniCorrector::bootstrapThreshold: iterations must be > 0");

      if (!(settings.annualVolatility > 0.0) || !(settings.periodsPerYear > 0.0))
	throw std::invalid_argument("BonferroniCorrector::bootstrapThreshold: volatility and periods per year must be positive");

      ThresholdComparison comparison;
      comparison.parametric = parametricThreshold(numPeriods);
      comparison.requestedIterations = settings.iterations;

      const rng_utils::CRNKey key(seed);
      const double periodVolatility = settings.annualVolatility / std::sqrt(settings.periodsPerYear);

      std::vector<double> nullReturns(numPeriods);
      {
	auto rng = rng_utils::make_seeded_engine<>(key.with_tag(0).make_seed_for(0));
	std::normal_distribution<double> dist(0.0, periodVolatility);
	for (auto& r : nullReturns)
	  r = dist(rng);

	// Zero skill: remove the sample drift of the draw
	const double drift = StatUtils::computeMean(nullReturns);
	for (auto& r : nullReturns)
	  r -= drift;
      }

      const MovingBlockResampler resampler(settings.blockLength);
      const rng_utils::CRNEngineProvider<> provider(key.with_tag(1));
      const SharpeRatioStatistic perPeriodSharpe(1.0);

      std::vector<double> nullMetrics;
      nullMetrics.reserve(settings.iterations);

      std::vector<double> y;
      for (std::size_t b = 0; b < settings.iterations; ++b)
	{
	  auto rng = provider.make_engine(b);
	  resampler(nullReturns, y, numPeriods, rng);
	  const double v = perPeriodSharpe(y);
	  if (std::isfinite(v))
	    nullMetrics.push_back(v);
	}

      const std::size_t failures = settings.iterations - nullMetrics.size();
      if (nullMetrics.empty() ||
	  static_cast<double>(failures) > settings.maxFailureFraction * static_cast<double>(settings.iterations))
	throw DegenerateInputException("BonferroniCorrector::bootstrapThreshold: " + std::to_string(failures) +
				       " of " + std::to_string(settings.iterations) +
				       " null resamples produced a non-finite metric");

      comparison.validIterations = nullMetrics.size();
      comparison.bootstrap = StatUtils::quantileType7(nullMetrics, 1.0 - mAdjustedAlpha);
      comparison.absoluteDifference = comparison.bootstrap - comparison.parametric;
      comparison.relativeDifference = (comparison.parametric > 0.0)
	? comparison.absoluteDifference / comparison.parametric
	: std::numeric_limits<double>::quiet_NaN();

      return comparison;
    }

    double BonferroniCorrector::appliedThreshold(double threshold) const
    {
      if (!std::isfinite(threshold))
	return mConservativeFloor;

      return std::max(mConservativeFloor, threshold);
    }

    bool BonferroniCorrector::isSignificant(double metric, double threshold) const
    {
      if (!std::isfinite(metric))
	return false;

      return metric > appliedThreshold(threshold);
    }

    double BonferroniCorrector::familyWiseErrorRate() const
    {
      return 1.0 - std::pow(1.0 - mAdjustedAlpha, static_cast<double>(mNumStrategies));
    }

    double BonferroniCorrector::expectedFalseDiscoveries() const
    {
      return mAdjustedAlpha * static_cast<double>(mNumStrategies);
    }

    StrategySetCorrection summarizeStrategySet(const BonferroniCorrector& corrector,
					       const std::vector<std::string>& strategyIds,
					       const std::vector<double>& metrics,
					       const std::vector<double>& thresholds)
    {
      if (strategyIds.size() != metrics.size() || metrics.size() != thresholds.size())
	throw std::invalid_argument("summarizeStrategySet: ids, metrics and thresholds must have equal length");

      StrategySetCorrection summary;
      summary.totalStrategies = strategyIds.size();
      summary.adjustedAlpha = corrector.getAdjustedAlpha();
      summary.expectedFalseDiscoveries = corrector.expectedFalseDiscoveries();
      summary.familyWiseErrorRate = corrector.familyWiseErrorRate();

      for (std::size_t i = 0; i < strategyIds.size(); ++i)
	{
	  if (corrector.isSignificant(metrics[i], thresholds[i]))
	    summary.significantStrategies.push_back(strategyIds[i]);
	}

      summary.significantCount = summary.significantStrategies.size();
      summary.estimatedFalseDiscoveryRate = summary.expectedFalseDiscoveries /
	static_cast<double>(std::max<std::size_t>(1, summary.significantCount));

      return summary;
    }
  } // namespace analysis
} // namespace stratvalidator
