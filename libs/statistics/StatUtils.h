#pragma once
#include <vector>
#include <cmath>
#include <limits>
#include <numeric>
#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/count.hpp>

namespace stratvalidator
{
  /**
   * @brief Summary of a small sample of metric values (e.g. one value per
   *        walk-forward window). The standard deviation is the unbiased
   *        (n-1) sample estimate and is 0 when count < 2.
   */
  struct DescriptiveStats
  {
    std::size_t count = 0;
    double mean = 0.0;
    double stdDev = 0.0;
    double min = 0.0;
    double max = 0.0;
  };

  /**
   * @class StatUtils
   * @brief Static helpers for descriptive statistics of per-period return series.
   */
  struct StatUtils
  {
  public:
    static double computeMean(const std::vector<double>& data)
    {
      if (data.empty())
	return 0.0;

      return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
    }

    /**
     * @brief Single-pass, numerically stable mean and (unbiased) variance via Welford.
     *        Returns {0,0} for empty; variance=0 for n<2.
     */
    static std::pair<double, double> computeMeanAndVariance(const std::vector<double>& data)
    {
      const std::size_t n = data.size();
      if (n == 0)
	return {0.0, 0.0};

      long double mean = 0.0L;
      long double m2   = 0.0L;
      std::size_t k = 0;

      for (double d : data)
	{
	  const long double x = static_cast<long double>(d);
	  ++k;
	  const long double delta  = x - mean;
	  mean += delta / static_cast<long double>(k);
	  const long double delta2 = x - mean;
	  m2 += delta * delta2;
	}

      if (k < 2)
	return {static_cast<double>(mean), 0.0};

      return {static_cast<double>(mean), static_cast<double>(m2 / static_cast<long double>(k - 1))};
    }

    static double computeStdDev(const std::vector<double>& data)
    {
      return std::sqrt(computeMeanAndVariance(data).second);
    }

    /**
     * @brief Sharpe ratio of a return series, optionally annualized.
     *
     * (mean - riskFreePerPeriod) / stddev * sqrt(periodsPerYear), with the
     * unbiased standard deviation. Unlike the ridge-regularised variant used
     * for ranking, a zero or non-finite denominator yields NaN so callers
     * can detect degenerate samples instead of receiving a silent zero.
     */
    static double sharpeRatio(const std::vector<double>& data,
			      double periodsPerYear = 1.0,
			      double riskFreePerPeriod = 0.0)
    {
      if (data.size() < 2)
	return std::numeric_limits<double>::quiet_NaN();

      auto [mean, var] = computeMeanAndVariance(data);
      const double sd = std::sqrt(var);

      if (!(sd > 0.0) || !std::isfinite(sd) || !std::isfinite(mean))
	return std::numeric_limits<double>::quiet_NaN();

      const double ann = (periodsPerYear > 1.0) ? std::sqrt(periodsPerYear) : 1.0;
      return ((mean - riskFreePerPeriod) / sd) * ann;
    }

    // (1 + mean)^periodsPerYear - 1
    static double annualizedReturn(const std::vector<double>& data, double periodsPerYear)
    {
      if (data.empty())
	return std::numeric_limits<double>::quiet_NaN();

      return std::pow(1.0 + computeMean(data), periodsPerYear) - 1.0;
    }

    /**
     * @brief Largest peak-to-trough decline of the compounded equity curve,
     *        expressed as a non-positive fraction (e.g. -0.25 for a 25% drawdown).
     */
    static double maxDrawdown(const std::vector<double>& data)
    {
      double equity = 1.0;
      double peak = 1.0;
      double worst = 0.0;

      for (double r : data)
	{
	  equity *= (1.0 + r);
	  peak = std::max(peak, equity);
	  if (peak > 0.0)
	    worst = std::min(worst, (equity - peak) / peak);
	}

      return worst;
    }

    static bool hasFiniteValue(const std::vector<double>& data)
    {
      return std::any_of(data.begin(), data.end(), [](double v) { return std::isfinite(v); });
    }

    /**
     * @brief Summary statistics via Boost.Accumulators. Non-finite values
     *        are ignored.
     */
    static DescriptiveStats summarize(const std::vector<double>& values)
    {
      using namespace boost::accumulators;

      accumulator_set<double, stats<tag::count, tag::mean, tag::variance, tag::min, tag::max>> acc;
      for (double v : values)
	{
	  if (std::isfinite(v))
	    acc(v);
	}

      DescriptiveStats result;
      result.count = static_cast<std::size_t>(count(acc));
      if (result.count == 0)
	return result;

      result.mean = mean(acc);
      result.min = (min)(acc);
      result.max = (max)(acc);

      // Boost reports the population variance
      if (result.count > 1)
	{
	  const double n = static_cast<double>(result.count);
	  result.stdDev = std::sqrt(std::max(0.0, variance(acc) * n / (n - 1.0)));
	}

      return result;
    }

    // Hyndman-Fan type-7 quantile using two nth_element passes (unsorted input).
    static double quantileType7(const std::vector<double>& s, double p)
    {
      if (s.empty())
	throw std::invalid_argument("StatUtils::quantileType7: empty input");
      if (p <= 0.0)
	return *std::min_element(s.begin(), s.end());
      if (p >= 1.0)
	return *std::max_element(s.begin(), s.end());
      if (s.size() == 1)
	return s.front();

      const double nd = static_cast<double>(s.size());
      const double h  = (nd - 1.0) * p + 1.0;
      std::size_t  i1 = static_cast<std::size_t>(std::floor(h));
      if (i1 < 1)         i1 = 1;
      if (i1 >= s.size()) i1 = s.size() - 1;
      const double frac = h - static_cast<double>(i1);

      std::vector<double> w(s.begin(), s.end());
      std::nth_element(w.begin(),
		       w.begin() + static_cast<std::ptrdiff_t>(i1 - 1),
		       w.end());
      const double x0 = w[i1 - 1];

      // After the first pass every element right of i1-1 is >= x0, so the
      // next order statistic is the minimum of that tail
      const double x1 = *std::min_element(w.begin() + static_cast<std::ptrdiff_t>(i1), w.end());

      return x0 + (x1 - x0) * frac;
    }
  };
}
