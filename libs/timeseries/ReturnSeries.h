// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RETURN_SERIES_H
#define __RETURN_SERIES_H 1

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PeriodBounds.h"
#include "TimeSeriesException.h"

namespace stratvalidator
{
  class ReturnEntry
  {
  public:
    ReturnEntry(const boost::gregorian::date& date, double value)
      : mDate(date),
	mValue(value)
    {}

    const boost::gregorian::date& getDate() const
    {
      return mDate;
    }

    double getValue() const
    {
      return mValue;
    }

  private:
    boost::gregorian::date mDate;
    double mValue;
  };

  /**
   * @brief Immutable, chronologically ordered sequence of per-period returns.
   *
   * Dates are strictly ascending and unique. Gaps between dates are tolerated.
   * Every slicing operation returns a new series; nothing mutates an existing
   * one after construction.
   */
  class ReturnSeries
  {
  public:
    using ConstDateIterator = std::vector<boost::gregorian::date>::const_iterator;

    ReturnSeries() = default;

    explicit ReturnSeries(const std::vector<ReturnEntry>& entries);

    ReturnSeries(std::vector<boost::gregorian::date> dates, std::vector<double> returns);

    ReturnSeries(const ReturnSeries&) = default;
    ReturnSeries& operator=(const ReturnSeries&) = default;
    ReturnSeries(ReturnSeries&&) noexcept = default;
    ReturnSeries& operator=(ReturnSeries&&) noexcept = default;

    std::size_t size() const
    {
      return mReturns.size();
    }

    bool empty() const
    {
      return mReturns.empty();
    }

    const std::vector<double>& getReturns() const
    {
      return mReturns;
    }

    const std::vector<boost::gregorian::date>& getDates() const
    {
      return mDates;
    }

    const boost::gregorian::date& getDate(std::size_t index) const;
    double getReturn(std::size_t index) const;
    ReturnEntry getEntry(std::size_t index) const;

    const boost::gregorian::date& getFirstDate() const;
    const boost::gregorian::date& getLastDate() const;

    /**
     * @brief Bounds spanning the first and last dates of the series.
     * @throws ReturnSeriesDataNotFoundException if the series has fewer than 2 entries.
     */
    PeriodBounds getBounds() const;

    /**
     * @brief Half-open index range [first, second) of the entries that fall
     *        inside the inclusive bounds. Empty ranges have first == second.
     */
    std::pair<std::size_t, std::size_t> getIndexRange(const PeriodBounds& bounds) const;

    std::size_t countInRange(const PeriodBounds& bounds) const;

    // Entries whose dates fall inside the inclusive bounds
    ReturnSeries slice(const PeriodBounds& bounds) const;

    // Entries at indices [beginIndex, endIndex)
    ReturnSeries slice(std::size_t beginIndex, std::size_t endIndex) const;

    // Bounds covering the entries at indices [beginIndex, endIndex)
    PeriodBounds boundsForIndexRange(std::size_t beginIndex, std::size_t endIndex) const;

  private:
    void validateChronology() const;

  private:
    std::vector<boost::gregorian::date> mDates;
    std::vector<double> mReturns;
  };
}

#endif
