#include "TestUtils.h"
#include <cmath>
#include <random>
#include <stdexcept>

using namespace boost::gregorian;
using namespace stratvalidator;

std::vector<date> makeBusinessDays(const date& firstDate, std::size_t count)
{
  std::vector<date> dates;
  dates.reserve(count);

  date current = firstDate;
  while (dates.size() < count)
    {
      const auto dow = current.day_of_week().as_number();
      if (dow != Saturday && dow != Sunday)
        dates.push_back(current);

      current += days(1);
    }

  return dates;
}

ReturnSeries makeReturnSeries(const std::vector<double>& returns, const date& firstDate)
{
  return ReturnSeries(makeBusinessDays(firstDate, returns.size()), returns);
}

ReturnSeries makeNormalReturnSeries(std::size_t count,
                                    double mean,
                                    double stddev,
                                    std::uint64_t seed,
                                    const date& firstDate)
{
  std::mt19937_64 rng(seed);
  std::normal_distribution<double> dist(mean, stddev);

  std::vector<double> returns(count);
  for (auto& r : returns)
    r = dist(rng);

  return makeReturnSeries(returns, firstDate);
}

std::vector<double> makeReturnsWithMoments(std::size_t count, double mean, double stddev)
{
  if (count < 2)
    throw std::invalid_argument("makeReturnsWithMoments: count must be >= 2");

  std::vector<double> deviations(count);
  for (std::size_t i = 0; i < count; ++i)
    deviations[i] = (i % 2 == 0) ? 1.0 : -1.0;

  // Odd counts need the deviations re-centred
  double centre = 0.0;
  for (double d : deviations)
    centre += d;
  centre /= static_cast<double>(count);

  double ss = 0.0;
  for (auto& d : deviations)
    {
      d -= centre;
      ss += d * d;
    }

  const double scale = stddev / std::sqrt(ss / static_cast<double>(count - 1));

  std::vector<double> out(count);
  for (std::size_t i = 0; i < count; ++i)
    out[i] = mean + deviations[i] * scale;

  return out;
}
