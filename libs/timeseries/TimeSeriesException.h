// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIMESERIES_EXCEPTION_H
#define __TIMESERIES_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace stratvalidator
{
  class TimeSeriesException : public std::runtime_error
  {
  public:
    TimeSeriesException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~TimeSeriesException() = default;
  };

  // Construction of a ReturnSeries from malformed input (unsorted or
  // duplicate dates, mismatched lengths).
  class ReturnSeriesException : public TimeSeriesException
  {
  public:
      explicit ReturnSeriesException(const std::string& msg)
        : TimeSeriesException(msg) {}
  };

  class ReturnSeriesDataNotFoundException : public TimeSeriesException
  {
  public:
      explicit ReturnSeriesDataNotFoundException(const std::string& msg)
        : TimeSeriesException(msg) {}
  };

  class ReturnSeriesOffsetOutOfRangeException : public TimeSeriesException
  {
  public:
      explicit ReturnSeriesOffsetOutOfRangeException(const std::string& msg)
        : TimeSeriesException(msg) {}
  };

} // namespace stratvalidator

#endif // __TIMESERIES_EXCEPTION_H
