#pragma once

#include <functional>
#include <vector>
#include "StatUtils.h"

namespace stratvalidator
{
  /**
   * @brief Maps a per-period return series to a scalar risk-adjusted metric.
   *        Returns NaN when the sample cannot support the metric.
   */
  using MetricFunction = std::function<double(const std::vector<double>&)>;

  // Trading periods per year for daily bars
  constexpr double kTradingDaysPerYear = 252.0;

  /**
   * @brief Sharpe ratio statistic with optional annualization.
   *
   * periodsPerYear == 1 gives the per-period Sharpe, which is the scale
   * used by the parametric significance threshold z / sqrt(T).
   */
  class SharpeRatioStatistic
  {
  public:
    explicit SharpeRatioStatistic(double periodsPerYear = kTradingDaysPerYear,
				  double riskFreePerPeriod = 0.0)
      : m_periodsPerYear(periodsPerYear),
	m_riskFreePerPeriod(riskFreePerPeriod)
    {}

    double operator()(const std::vector<double>& returns) const
    {
      return StatUtils::sharpeRatio(returns, m_periodsPerYear, m_riskFreePerPeriod);
    }

    double getPeriodsPerYear() const
    {
      return m_periodsPerYear;
    }

  private:
    double m_periodsPerYear;
    double m_riskFreePerPeriod;
  };

  inline MetricFunction makeAnnualizedSharpeMetric(double periodsPerYear = kTradingDaysPerYear)
  {
    return SharpeRatioStatistic(periodsPerYear);
  }

  inline MetricFunction makePerPeriodSharpeMetric()
  {
    return SharpeRatioStatistic(1.0);
  }
}
