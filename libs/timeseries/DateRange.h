// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __DATE_RANGE_H
#define __DATE_RANGE_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time.hpp>

namespace regime_backtest
{
  class DateRangeException : public std::runtime_error
  {
  public:
  DateRangeException(const std::string& msg)
    : std::runtime_error(msg)
      {}

    ~DateRangeException()
      {}
  };

  // Inclusive range of calendar dates
  class DateRange
  {
  public:
    DateRange(const boost::gregorian::date& firstDate, const boost::gregorian::date& lastDate)
      : mFirstDate(firstDate),
	mLastDate(lastDate)
    {
      if (firstDate.is_special() || lastDate.is_special())
	throw DateRangeException ("DateRange::DateRange - dates must be valid calendar dates");

      if (lastDate < firstDate)
	throw DateRangeException ("DateRange::DateRange - Second date cannot occur before first date");
    }

    DateRange(const DateRange&) = default;
    DateRange& operator=(const DateRange&) = default;
    ~DateRange() noexcept = default;

    boost::gregorian::date getFirstDate() const
    {
      return mFirstDate;
    }

    boost::gregorian::date getLastDate() const
    {
      return mLastDate;
    }

    bool contains(const boost::gregorian::date& aDate) const
    {
      return (aDate >= mFirstDate) && (aDate <= mLastDate);
    }

  private:
    boost::gregorian::date mFirstDate;
    boost::gregorian::date mLastDate;
  };

  inline bool operator==(const DateRange& lhs, const DateRange& rhs)
    {
      return ((lhs.getFirstDate() == rhs.getFirstDate()) &&
	      (lhs.getLastDate() == rhs.getLastDate()));
    }

  inline bool operator!=(const DateRange& lhs, const DateRange& rhs)
    {
      return !(lhs == rhs);
    }

  /**
   * @brief Builds the inclusive range covering [startDate, endDate), the
   * convention used by market data vendors where the end date is exclusive.
   */
  inline DateRange createHalfOpenDateRange(const boost::gregorian::date& startDate,
					   const boost::gregorian::date& endDate)
  {
    if (!(startDate < endDate))
      throw DateRangeException("createHalfOpenDateRange - start date must be before end date");

    return DateRange(startDate, endDate - boost::gregorian::days(1));
  }
}

#endif
