#pragma once

#include <vector>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <string>

#include "RngUtils.h"
#include "StatUtils.h"
#include "StatisticalExceptions.h"
#include "BlockResamplers.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"

namespace stratvalidator
{
  namespace analysis
  {
    /**
     * @brief Percentile confidence interval from a block bootstrap.
     *
     * Given a statistic theta = sampler(x) on a return series x of length n:
     *
     *  - draw B resamples y_b of length n with the injected block Resampler,
     *  - compute theta*_b = sampler(y_b),
     *  - take type-7 empirical quantiles of {theta*_b} at (1-CL)/2 and
     *    1-(1-CL)/2.
     *
     * Non-finite replicates are discarded and counted. If more than
     * maxFailureFraction of the B replicates are discarded the run fails
     * with DegenerateInputException instead of returning an interval built
     * on a reduced sample.
     *
     * Each replicate b draws from its own engine seeded from (seed, b), so
     * the interval is identical whichever Executor runs the replicates.
     *
     * @tparam Sampler   Callable `double(const std::vector<double>&)`.
     * @tparam Resampler Provides `void operator()(x, y, m, rng) const` and `getL()`.
     * @tparam Rng       Engine type, std::mt19937_64 by default.
     * @tparam Executor  Parallel executor used by concurrency::parallel_for.
     */
    template<
      class Sampler,
      class Resampler = MovingBlockResampler,
      class Rng       = std::mt19937_64,
      class Executor  = concurrency::SingleThreadExecutor
      >
    class BlockBootstrap
    {
    public:
      struct Result
      {
	double      pointEstimate; // theta on original sample
	double      lower;
	double      upper;
	double      cl;
	std::size_t B;             // requested replicates
	std::size_t effectiveB;    // finite replicates used
	std::size_t skipped;       // non-finite replicates discarded
	std::size_t n;             // original sample size
	std::size_t L;             // block length
	double      standardError; // stddev of the finite replicates
      };

      static constexpr std::size_t kDefaultMinObservations = 100;
      static constexpr double      kDefaultMaxFailureFraction = 0.10;

    public:
      /**
       * @throws std::invalid_argument if B == 0, CL not in (0.5, 1) or the
       *         failure fraction is not in [0, 1).
       */
      BlockBootstrap(std::size_t      B,
		     double           confidenceLevel,
		     const Resampler& resampler,
		     std::size_t      minObservations = kDefaultMinObservations,
		     double           maxFailureFraction = kDefaultMaxFailureFraction)
	: m_B(B),
	  m_CL(confidenceLevel),
	  m_resampler(resampler),
	  m_minObservations(minObservations),
	  m_maxFailureFraction(maxFailureFraction),
	  m_exec(std::make_shared<Executor>())
      {
	if (m_B == 0)
	  throw std::invalid_argument("BlockBootstrap: number of replicates must be > 0");
	if (!(m_CL > 0.5 && m_CL < 1.0))
	  throw std::invalid_argument("BlockBootstrap: CL must be in (0.5,1)");
	if (!(m_maxFailureFraction >= 0.0 && m_maxFailureFraction < 1.0))
	  throw std::invalid_argument("BlockBootstrap: max failure fraction must be in [0,1)");
      }

      /**
       * @brief Run the bootstrap with a master seed.
       *
       * @throws InsufficientDataException if x has fewer than minObservations values.
       * @throws DegenerateInputException if x has no finite values, zero
       *         variance, a non-finite point estimate, or too many non-finite
       *         replicates.
       */
      Result run(const std::vector<double>& x, Sampler sampler, uint64_t seed) const
      {
	return run(x, sampler, rng_utils::CRNEngineProvider<Rng>(rng_utils::CRNKey(seed)));
      }

      template<class Provider>
      Result run(const std::vector<double>& x, Sampler sampler, const Provider& provider) const
      {
	const std::size_t n = x.size();
	if (n < m_minObservations)
	  throw InsufficientDataException("BlockBootstrap: series has " + std::to_string(n) +
					  " observations, at least " +
					  std::to_string(m_minObservations) + " required");

	if (!StatUtils::hasFiniteValue(x))
	  throw DegenerateInputException("BlockBootstrap: series contains no finite values");

	const double sd = StatUtils::computeStdDev(x);
	if (!(sd > 0.0) || !std::isfinite(sd))
	  throw DegenerateInputException("BlockBootstrap: series has zero or undefined standard deviation");

	const double thetaHat = sampler(x);
	if (!std::isfinite(thetaHat))
	  throw DegenerateInputException("BlockBootstrap: metric is not finite on the original series");

	// NaN marks skipped/invalid replicates
	std::vector<double> thetas(m_B, std::numeric_limits<double>::quiet_NaN());

	concurrency::parallel_for(static_cast<uint32_t>(m_B),
				  *m_exec,
				  [&](uint32_t b) {
				    auto rngB = provider.make_engine(b);
				    std::vector<double> y;
				    m_resampler(x, y, n, rngB);
				    const double v = sampler(y);
				    if (std::isfinite(v))
				      thetas[b] = v;
				  });

	auto it = std::remove_if(thetas.begin(), thetas.end(),
				 [](double v) { return !std::isfinite(v); });
	const std::size_t skipped = static_cast<std::size_t>(std::distance(it, thetas.end()));
	thetas.erase(it, thetas.end());

	if (static_cast<double>(skipped) > m_maxFailureFraction * static_cast<double>(m_B))
	  throw DegenerateInputException("BlockBootstrap: " + std::to_string(skipped) + " of " +
					 std::to_string(m_B) +
					 " resamples produced a non-finite metric");

	if (thetas.empty())
	  throw DegenerateInputException("BlockBootstrap: no finite resamples");

	const double alpha = 1.0 - m_CL;
	const double lb = StatUtils::quantileType7(thetas, alpha / 2.0);
	const double ub = StatUtils::quantileType7(thetas, 1.0 - alpha / 2.0);

	return Result{
	  /*pointEstimate =*/ thetaHat,
	  /*lower         =*/ lb,
	  /*upper         =*/ ub,
	  /*cl            =*/ m_CL,
	  /*B             =*/ m_B,
	  /*effectiveB    =*/ thetas.size(),
	  /*skipped       =*/ skipped,
	  /*n             =*/ n,
	  /*L             =*/ m_resampler.getL(),
	  /*standardError =*/ StatUtils::computeStdDev(thetas)
	};
      }

      std::size_t      B()         const { return m_B; }
      double           CL()        const { return m_CL; }
      const Resampler& resampler() const { return m_resampler; }

    private:
      std::size_t                       m_B;
      double                            m_CL;
      Resampler                         m_resampler;
      std::size_t                       m_minObservations;
      double                            m_maxFailureFraction;
      mutable std::shared_ptr<Executor> m_exec;
    };

  } // namespace analysis
} // namespace stratvalidator
