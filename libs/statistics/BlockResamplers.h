#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>
#include "RngUtils.h"

namespace stratvalidator
{
  namespace analysis
  {
    /**
     * @struct MovingBlockResampler
     * @brief Moving (overlapping) block bootstrap with a fixed block length L
     *        (Kunsch, 1989).
     *
     * @details
     * A series of length n has n - L + 1 overlapping blocks of L consecutive
     * observations. Each replicate is built by drawing block start positions
     * uniformly with replacement and concatenating the blocks until the
     * requested length m is reached; the final block is truncated. Serial
     * dependence inside a block is preserved, which keeps the bootstrap
     * distribution of autocorrelated returns from looking tighter than it is.
     *
     * Blocks never wrap around the end of the series. When n < L the whole
     * series is the only block.
     */
    class MovingBlockResampler
    {
    public:
      explicit MovingBlockResampler(std::size_t L = 21)
	: m_L(L)
      {
	if (m_L == 0)
	  throw std::invalid_argument("MovingBlockResampler: block length must be >= 1");
      }

      template <class Rng>
      void operator()(const std::vector<double>& x,
		      std::vector<double>&       y,
		      std::size_t                m,
		      Rng&                       rng) const
      {
	const std::size_t n = x.size();
	if (n == 0)
	  throw std::invalid_argument("MovingBlockResampler: empty sample");

	const std::size_t L = std::min(m_L, n);
	const std::size_t numBlocks = n - L + 1;

	y.resize(m);
	std::size_t pos = 0;
	while (pos < m)
	  {
	    const std::size_t start = rng_utils::get_random_index(rng, numBlocks);
	    const std::size_t k = std::min(L, m - pos);
	    std::copy_n(x.begin() + static_cast<std::ptrdiff_t>(start),
			static_cast<std::ptrdiff_t>(k),
			y.begin() + static_cast<std::ptrdiff_t>(pos));
	    pos += k;
	  }
      }

      template <class Rng>
      std::vector<double> operator()(const std::vector<double>& x, Rng& rng) const
      {
	std::vector<double> y;
	(*this)(x, y, x.size(), rng);
	return y;
      }

      std::size_t getL() const noexcept
      {
	return m_L;
      }

    private:
      std::size_t m_L;
    };
  } // namespace analysis
} // namespace stratvalidator
