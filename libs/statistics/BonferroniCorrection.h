// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, November 2017
//

#ifndef __BONFERRONI_CORRECTION_H
#define __BONFERRONI_CORRECTION_H 1

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stratvalidator
{
  namespace analysis
  {
    enum class ThresholdMode
    {
      Parametric,
      Bootstrap
    };

    std::string toString(ThresholdMode mode);

    // Parameters of the simulated zero-skill return process
    struct BootstrapNullSettings
    {
      std::size_t iterations = 1000;
      std::size_t blockLength = 21;
      double annualVolatility = 0.22;
      double periodsPerYear = 252.0;
      double maxFailureFraction = 0.10;
    };

    /**
     * @brief Parametric and bootstrap thresholds side by side.
     *
     * relativeDifference is (bootstrap - parametric) / parametric. A large
     * magnitude means the normal approximation does not describe the null
     * distribution of the metric for this return process.
     */
    struct ThresholdComparison
    {
      double parametric = 0.0;
      double bootstrap = 0.0;
      double absoluteDifference = 0.0;
      double relativeDifference = 0.0;
      std::size_t validIterations = 0;
      std::size_t requestedIterations = 0;
    };

    /**
     * @class BonferroniCorrector
     * @brief Family-wise error control for screening N candidate strategies.
     *
     * The per-test significance level is alpha / N. The parametric threshold
     * z(1 - alpha/(2N)) / sqrt(T) assumes the metric has null variance 1 / T;
     * the bootstrap threshold is computed on the per-period Sharpe so that
     * both thresholds share that scale and can be compared directly.
     */
    class BonferroniCorrector
    {
    public:
      static constexpr double kDefaultFamilyWiseAlpha = 0.05;
      static constexpr double kDefaultConservativeFloor = 0.5;

      /**
       * @throws std::invalid_argument if numStrategies == 0, alpha is not in
       *         (0, 1) or the floor is negative or non-finite.
       */
      BonferroniCorrector(std::size_t numStrategies,
			  double familyWiseAlpha = kDefaultFamilyWiseAlpha,
			  double conservativeFloor = kDefaultConservativeFloor);

      std::size_t getNumStrategies() const
      {
	return mNumStrategies;
      }

      double getFamilyWiseAlpha() const
      {
	return mFamilyWiseAlpha;
      }

      double getAdjustedAlpha() const
      {
	return mAdjustedAlpha;
      }

      double getConservativeFloor() const
      {
	return mConservativeFloor;
      }

      /**
       * @brief z(1 - adjusted_alpha / 2) / sqrt(T), before flooring.
       * @throws std::invalid_argument if numPeriods < 2
       */
      double parametricThreshold(std::size_t numPeriods) const;

      /**
       * @brief Empirical (1 - adjusted_alpha) quantile of the per-period
       *        Sharpe of block-resampled zero-mean normal returns.
       *
       * Null returns have per-period volatility annualVolatility /
       * sqrt(periodsPerYear). The series is drawn once, demeaned and resampled
       * settings.iterations times with a MovingBlockResampler.
       *
       * @throws std::invalid_argument if numPeriods < 2 or the settings are invalid
       * @throws DegenerateInputException if more than maxFailureFraction of the
       *         resamples give a non-finite metric
       */
      ThresholdComparison bootstrapThreshold(std::size_t numPeriods,
					     const BootstrapNullSettings& settings,
					     uint64_t seed) const;

      // max(conservative floor, threshold)
      double appliedThreshold(double threshold) const;

      // True iff metric is finite and exceeds appliedThreshold(threshold)
      bool isSignificant(double metric, double threshold) const;

      // Probability of at least one false positive among N independent tests
      double familyWiseErrorRate() const;

      double expectedFalseDiscoveries() const;

    private:
      std::size_t mNumStrategies;
      double mFamilyWiseAlpha;
      double mAdjustedAlpha;
      double mConservativeFloor;
    };

    /**
     * @brief Outcome of applying one corrector to a set of candidate metrics.
     */
    struct StrategySetCorrection
    {
      std::size_t totalStrategies = 0;
      std::size_t significantCount = 0;
      double adjustedAlpha = 0.0;
      double expectedFalseDiscoveries = 0.0;
      double estimatedFalseDiscoveryRate = 0.0;
      double familyWiseErrorRate = 0.0;
      std::vector<std::string> significantStrategies;
    };

    /**
     * @brief Summarize which of the given (id, metric, threshold) triples are
     *        significant under the corrector.
     *
     * estimatedFalseDiscoveryRate is expectedFalseDiscoveries / max(1, significantCount).
     */
    StrategySetCorrection summarizeStrategySet(const BonferroniCorrector& corrector,
					       const std::vector<std::string>& strategyIds,
					       const std::vector<double>& metrics,
					       const std::vector<double>& thresholds);
  } // namespace analysis
} // namespace stratvalidator

#endif
