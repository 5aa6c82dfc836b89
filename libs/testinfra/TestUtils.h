#ifndef __STRATVALIDATOR_TEST_UTILS_H
#define __STRATVALIDATOR_TEST_UTILS_H 1

#include <cstddef>
#include <cstdint>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "ReturnSeries.h"

// Consecutive weekdays starting at (or after) firstDate
std::vector<boost::gregorian::date> makeBusinessDays(const boost::gregorian::date& firstDate,
                                                     std::size_t count);

stratvalidator::ReturnSeries makeReturnSeries(const std::vector<double>& returns,
                                              const boost::gregorian::date& firstDate =
                                                boost::gregorian::date(2015, 1, 2));

// i.i.d. normal returns with a fixed seed
stratvalidator::ReturnSeries makeNormalReturnSeries(std::size_t count,
                                                    double mean,
                                                    double stddev,
                                                    std::uint64_t seed,
                                                    const boost::gregorian::date& firstDate =
                                                      boost::gregorian::date(2015, 1, 2));

// Returns whose sample mean and sample standard deviation are exactly
// mean and stddev (alternating +/- deviations, rescaled)
std::vector<double> makeReturnsWithMoments(std::size_t count, double mean, double stddev);

#endif
