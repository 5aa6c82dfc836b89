// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PERIOD_BOUNDS_H
#define __PERIOD_BOUNDS_H 1

#include <cstddef>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/functional/hash.hpp>

namespace stratvalidator
{
  class PeriodBoundsException : public std::runtime_error
  {
  public:
  PeriodBoundsException(const std::string& msg)
    : std::runtime_error(msg)
      {}

    ~PeriodBoundsException()
      {}
  };

  /**
   * @brief A contiguous, inclusive range of calendar dates [start, end].
   *
   * Used for train/validation/test partitions, walk-forward windows and
   * baseline evaluation horizons. The start date must be strictly before
   * the end date.
   */
  class PeriodBounds
  {
  public:
    PeriodBounds(const boost::gregorian::date& startDate, const boost::gregorian::date& endDate)
      : mStartDate(startDate),
	mEndDate(endDate)
    {
      if (startDate.is_special() || endDate.is_special())
	throw PeriodBoundsException ("PeriodBounds::PeriodBounds - dates must be valid calendar dates");

      if (!(startDate < endDate))
	throw PeriodBoundsException ("PeriodBounds::PeriodBounds - start date " +
				     boost::gregorian::to_iso_extended_string(startDate) +
				     " must occur before end date " +
				     boost::gregorian::to_iso_extended_string(endDate));
    }

    PeriodBounds(const PeriodBounds&) = default;
    PeriodBounds& operator=(const PeriodBounds&) = default;
    ~PeriodBounds() noexcept = default;

    const boost::gregorian::date& getStartDate() const
    {
      return mStartDate;
    }

    const boost::gregorian::date& getEndDate() const
    {
      return mEndDate;
    }

    bool contains(const boost::gregorian::date& d) const
    {
      return (d >= mStartDate) && (d <= mEndDate);
    }

    // True when the two ranges share at least one calendar date
    bool overlaps(const PeriodBounds& other) const
    {
      return !(mEndDate < other.mStartDate || other.mEndDate < mStartDate);
    }

    // True when this range ends strictly before other begins
    bool precedes(const PeriodBounds& other) const
    {
      return mEndDate < other.mStartDate;
    }

    long getCalendarDays() const
    {
      return (mEndDate - mStartDate).days() + 1;
    }

    std::string toString() const
    {
      return boost::gregorian::to_iso_extended_string(mStartDate) + " to " +
	boost::gregorian::to_iso_extended_string(mEndDate);
    }

  private:
    boost::gregorian::date mStartDate;
    boost::gregorian::date mEndDate;
  };

  inline bool operator==(const PeriodBounds& lhs, const PeriodBounds& rhs)
  {
    return (lhs.getStartDate() == rhs.getStartDate()) && (lhs.getEndDate() == rhs.getEndDate());
  }

  inline bool operator!=(const PeriodBounds& lhs, const PeriodBounds& rhs)
  {
    return !(lhs == rhs);
  }

  // Orders by start date, then end date
  inline bool operator<(const PeriodBounds& lhs, const PeriodBounds& rhs)
  {
    if (lhs.getStartDate() != rhs.getStartDate())
      return lhs.getStartDate() < rhs.getStartDate();

    return lhs.getEndDate() < rhs.getEndDate();
  }

  inline std::ostream& operator<<(std::ostream& os, const PeriodBounds& bounds)
  {
    return os << bounds.toString();
  }

  // Found by boost::hash through ADL
  inline std::size_t hash_value(const PeriodBounds& bounds)
  {
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<long>(bounds.getStartDate().day_number()));
    boost::hash_combine(seed, static_cast<long>(bounds.getEndDate().day_number()));
    return seed;
  }
}

namespace std
{
  template <>
  struct hash<stratvalidator::PeriodBounds>
  {
    std::size_t operator()(const stratvalidator::PeriodBounds& bounds) const
    {
      return stratvalidator::hash_value(bounds);
    }
  };
}

#endif
