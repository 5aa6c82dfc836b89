// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ReturnSeries.h"
#include <algorithm>
#include <iterator>

namespace stratvalidator
{
  using boost::gregorian::date;
  using boost::gregorian::to_iso_extended_string;

  ReturnSeries::ReturnSeries(const std::vector<ReturnEntry>& entries)
    : mDates(),
      mReturns()
  {
    mDates.reserve(entries.size());
    mReturns.reserve(entries.size());

    for (const auto& entry : entries)
      {
	mDates.push_back(entry.getDate());
	mReturns.push_back(entry.getValue());
      }

    validateChronology();
  }

  ReturnSeries::ReturnSeries(std::vector<date> dates, std::vector<double> returns)
    : mDates(std::move(dates)),
      mReturns(std::move(returns))
  {
    if (mDates.size() != mReturns.size())
      throw ReturnSeriesException("ReturnSeries: number of dates (" + std::to_string(mDates.size()) +
				  ") does not match number of returns (" +
				  std::to_string(mReturns.size()) + ")");

    validateChronology();
  }

  void ReturnSeries::validateChronology() const
  {
    for (std::size_t i = 0; i < mDates.size(); ++i)
      {
	if (mDates[i].is_special())
	  throw ReturnSeriesException("ReturnSeries: invalid date at position " + std::to_string(i));

	if (i > 0 && !(mDates[i - 1] < mDates[i]))
	  throw ReturnSeriesException("ReturnSeries: dates must be strictly ascending, found " +
				      to_iso_extended_string(mDates[i]) + " after " +
				      to_iso_extended_string(mDates[i - 1]));
      }
  }

  const date& ReturnSeries::getDate(std::size_t index) const
  {
    if (index >= mDates.size())
      throw ReturnSeriesOffsetOutOfRangeException("ReturnSeries::getDate - index " + std::to_string(index) +
						  " out of range for series of size " +
						  std::to_string(mDates.size()));
    return mDates[index];
  }

  double ReturnSeries::getReturn(std::size_t index) const
  {
    if (index >= mReturns.size())
      throw ReturnSeriesOffsetOutOfRangeException("ReturnSeries::getReturn - index " + std::to_string(index) +
						  " out of range for series of size " +
						  std::to_string(mReturns.size()));
    return mReturns[index];
  }

  ReturnEntry ReturnSeries::getEntry(std::size_t index) const
  {
    return ReturnEntry(getDate(index), getReturn(index));
  }

  const date& ReturnSeries::getFirstDate() const
  {
    if (mDates.empty())
      throw ReturnSeriesDataNotFoundException("ReturnSeries::getFirstDate - series is empty");

    return mDates.front();
  }

  const date& ReturnSeries::getLastDate() const
  {
    if (mDates.empty())
      throw ReturnSeriesDataNotFoundException("ReturnSeries::getLastDate - series is empty");

    return mDates.back();
  }

  PeriodBounds ReturnSeries::getBounds() const
  {
    if (mDates.size() < 2)
      throw ReturnSeriesDataNotFoundException("ReturnSeries::getBounds - at least two entries are required");

    return PeriodBounds(mDates.front(), mDates.back());
  }

  std::pair<std::size_t, std::size_t> ReturnSeries::getIndexRange(const PeriodBounds& bounds) const
  {
    auto first = std::lower_bound(mDates.begin(), mDates.end(), bounds.getStartDate());
    auto last = std::upper_bound(first, mDates.end(), bounds.getEndDate());

    return { static_cast<std::size_t>(std::distance(mDates.begin(), first)),
	     static_cast<std::size_t>(std::distance(mDates.begin(), last)) };
  }

  std::size_t ReturnSeries::countInRange(const PeriodBounds& bounds) const
  {
    auto range = getIndexRange(bounds);
    return range.second - range.first;
  }

  ReturnSeries ReturnSeries::slice(const PeriodBounds& bounds) const
  {
    auto range = getIndexRange(bounds);
    return slice(range.first, range.second);
  }

  ReturnSeries ReturnSeries::slice(std::size_t beginIndex, std::size_t endIndex) const
  {
    if (beginIndex > endIndex || endIndex > mDates.size())
      throw ReturnSeriesOffsetOutOfRangeException("ReturnSeries::slice - invalid index range [" +
						  std::to_string(beginIndex) + ", " +
						  std::to_string(endIndex) + ") for series of size " +
						  std::to_string(mDates.size()));

    ReturnSeries result;
    result.mDates.assign(mDates.begin() + static_cast<std::ptrdiff_t>(beginIndex),
			 mDates.begin() + static_cast<std::ptrdiff_t>(endIndex));
    result.mReturns.assign(mReturns.begin() + static_cast<std::ptrdiff_t>(beginIndex),
			   mReturns.begin() + static_cast<std::ptrdiff_t>(endIndex));
    return result;
  }

  PeriodBounds ReturnSeries::boundsForIndexRange(std::size_t beginIndex, std::size_t endIndex) const
  {
    if (endIndex > mDates.size() || endIndex < beginIndex + 2)
      throw ReturnSeriesOffsetOutOfRangeException("ReturnSeries::boundsForIndexRange - range [" +
						  std::to_string(beginIndex) + ", " +
						  std::to_string(endIndex) +
						  ") must hold at least two entries of a series of size " +
						  std::to_string(mDates.size()));

    return PeriodBounds(mDates[beginIndex], mDates[endIndex - 1]);
  }
}
