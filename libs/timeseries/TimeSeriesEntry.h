// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TIMESERIES_ENTRY_H
#define __TIMESERIES_ENTRY_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time.hpp>
#include "BoostDateHelper.h"
#include "DecimalConstants.h"
#include "number.h"

namespace regime_backtest
{
  //
  // class TimeSeriesEntryException
  //

  class TimeSeriesEntryException : public std::domain_error
  {
  public:
    TimeSeriesEntryException(const std::string msg)
      : std::domain_error(msg)
    {}

    ~TimeSeriesEntryException()
    {}

  };

  //
  // class ClosePriceEntry
  //
  // One trading day of a daily close series.
  //

  template <class Decimal> class ClosePriceEntry
  {
  public:
    ClosePriceEntry (const TimeSeriesDate& entryDate,
		     const Decimal& closePrice) :
      mDate(entryDate),
      mClose(closePrice)
    {
      if (entryDate.is_special())
	throw TimeSeriesEntryException ("ClosePriceEntry: entry date is not a valid calendar date");

      if (closePrice <= DecimalConstants<Decimal>::DecimalZero)
	throw TimeSeriesEntryException ("ClosePriceEntry: close of " + num::toString (closePrice) +
					" on " + toIsoDateString (entryDate) + " must be positive");
    }

    ClosePriceEntry (const ClosePriceEntry<Decimal>& rhs) = default;
    ClosePriceEntry<Decimal>& operator=(const ClosePriceEntry<Decimal>& rhs) = default;

    ~ClosePriceEntry()
    {}

    const TimeSeriesDate& getDate() const
    {
      return mDate;
    }

    const Decimal& getClose() const
    {
      return mClose;
    }

  private:
    TimeSeriesDate mDate;
    Decimal mClose;
  };

  template <class Decimal>
  bool operator==(const ClosePriceEntry<Decimal>& lhs, const ClosePriceEntry<Decimal>& rhs)
  {
    return (lhs.getDate() == rhs.getDate()) && (lhs.getClose() == rhs.getClose());
  }

  template <class Decimal>
  bool operator!=(const ClosePriceEntry<Decimal>& lhs, const ClosePriceEntry<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
