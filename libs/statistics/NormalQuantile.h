#pragma once

#include <array>
#include <cmath>
#include <stdexcept>

namespace stratvalidator
{
  namespace analysis
  {
    namespace detail
    {
      template <std::size_t N>
      inline double horner(const std::array<double, N>& coeffs, double x)
      {
        double acc = 0.0;
        for (double c : coeffs)
          acc = acc * x + c;
        return acc;
      }

      /**
       * @brief Standard normal cumulative distribution function, Phi(z).
       */
      inline double compute_normal_cdf(double z) noexcept
      {
        return 0.5 * std::erfc(-z * 0.7071067811865475244);
      }

      /**
       * @brief Inverse of the standard normal CDF.
       *
       * Acklam's rational approximation followed by one Halley refinement
       * step against std::erfc, which brings the result to near machine
       * precision including the far tails needed for Bonferroni-adjusted
       * alphas (p close to 1 - 1e-6).
       *
       * @throws std::domain_error if p is not in (0, 1)
       */
      inline double compute_normal_quantile(double p)
      {
        if (!(p > 0.0 && p < 1.0))
          throw std::domain_error("compute_normal_quantile: probability p must be in (0, 1)");

        if (p == 0.5)
          return 0.0;

        static constexpr std::array<double, 6> a = {
          -3.969683028665376e+01,  2.209460984245205e+02, -2.759285104469687e+02,
           1.383577518672690e+02, -3.066479806614716e+01,  2.506628277459239e+00 };
        static constexpr std::array<double, 6> b = {
          -5.447609879822406e+01,  1.615858368580409e+02, -1.556989798598866e+02,
           6.680131188771972e+01, -1.328068155288572e+01,  1.0 };
        static constexpr std::array<double, 6> c = {
          -7.784894002430226e-03, -3.223964580411365e-01, -2.400758277161838e+00,
          -2.549732539343734e+00,  4.374664141464968e+00,  2.938163982698783e+00 };
        static constexpr std::array<double, 5> d = {
           7.784695709041462e-03,  3.224671290700398e-01,  2.445134137142996e+00,
           3.754408661907416e+00,  1.0 };

        constexpr double pLow = 0.02425;

        double x;
        if (p < pLow)
          {
            const double q = std::sqrt(-2.0 * std::log(p));
            x = horner(c, q) / horner(d, q);
          }
        else if (p <= 1.0 - pLow)
          {
            const double q = p - 0.5;
            const double r = q * q;
            x = q * horner(a, r) / horner(b, r);
          }
        else
          {
            const double q = std::sqrt(-2.0 * std::log1p(-p));
            x = -horner(c, q) / horner(d, q);
          }

        // Halley step
        const double e = compute_normal_cdf(x) - p;
        const double u = e * 2.50662827463100050242 * std::exp(0.5 * x * x); // sqrt(2*pi)
        return x - u / (1.0 + 0.5 * x * u);
      }

      // z such that P(-z < Z < z) = confidenceLevel
      inline double compute_normal_critical_value(double confidenceLevel)
      {
        if (!(confidenceLevel > 0.0 && confidenceLevel < 1.0))
          throw std::domain_error("compute_normal_critical_value: confidence level must be in (0, 1)");

        return compute_normal_quantile(1.0 - (1.0 - confidenceLevel) / 2.0);
      }
    } // namespace detail
  } // namespace analysis
} // namespace stratvalidator
