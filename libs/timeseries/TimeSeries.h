// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TIMESERIES_H
#define __TIMESERIES_H 1

#include <iostream>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "TimeSeriesEntry.h"
#include "TimeSeriesException.h"
#include "TimeFrame.h"
#include "DateRange.h"

namespace regime_backtest
{
  /**
   * @class ClosePriceSeries
   * @brief Ordered daily close prices for a single security.
   *
   * Entries are kept in a contiguous vector in strictly increasing date order,
   * one entry per trading day. Indicators and position strategies address the
   * series by bar index, so index i of any derived series refers to the same
   * trading day as index i of this series.
   *
   * @tparam Decimal Numeric type used for prices (e.g., num::DefaultNumber).
   */
  template <class Decimal>
  class ClosePriceSeries
  {
  public:
    typedef typename std::vector<ClosePriceEntry<Decimal>>::const_iterator ConstRandomAccessIterator;

    explicit ClosePriceSeries (TimeFrame::Duration timeFrame = TimeFrame::DAILY)
      : mEntries(),
	mTimeFrame(timeFrame)
    {}

    ClosePriceSeries (TimeFrame::Duration timeFrame, unsigned long numElements)
      : mEntries(),
	mTimeFrame(timeFrame)
    {
      mEntries.reserve(numElements);
    }

    ClosePriceSeries(const ClosePriceSeries<Decimal>& rhs) = default;
    ClosePriceSeries(ClosePriceSeries<Decimal>&& rhs) noexcept = default;
    ClosePriceSeries<Decimal>& operator=(const ClosePriceSeries<Decimal>& rhs) = default;
    ClosePriceSeries<Decimal>& operator=(ClosePriceSeries<Decimal>&& rhs) noexcept = default;

    /**
     * @brief Appends an entry to the end of the series.
     * @throws TimeSeriesException if the entry does not fall strictly after
     *         the current last date.
     */
    void addEntry (const ClosePriceEntry<Decimal>& entry)
    {
      if (!mEntries.empty() && !(mEntries.back().getDate() < entry.getDate()))
	throw TimeSeriesException ("ClosePriceSeries:addEntry: entry for " +
				   toIsoDateString (entry.getDate()) +
				   " does not follow last date " +
				   toIsoDateString (mEntries.back().getDate()));

      mEntries.push_back (entry);
    }

    void addEntry (const TimeSeriesDate& entryDate, const Decimal& closePrice)
    {
      addEntry (ClosePriceEntry<Decimal>(entryDate, closePrice));
    }

    TimeFrame::Duration getTimeFrame() const
    {
      return mTimeFrame;
    }

    unsigned long getNumEntries() const
    {
      return mEntries.size();
    }

    bool isEmpty() const
    {
      return mEntries.empty();
    }

    const ClosePriceEntry<Decimal>& getEntry (unsigned long index) const
    {
      validateIndex (index);
      return mEntries[index];
    }

    const Decimal& getClose (unsigned long index) const
    {
      return getEntry(index).getClose();
    }

    const TimeSeriesDate& getDate (unsigned long index) const
    {
      return getEntry(index).getDate();
    }

    TimeSeriesDate getFirstDate() const
    {
      if (mEntries.empty())
	throw TimeSeriesDataNotFoundException ("ClosePriceSeries:getFirstDate: no entries in time series");

      return mEntries.front().getDate();
    }

    TimeSeriesDate getLastDate() const
    {
      if (mEntries.empty())
	throw TimeSeriesDataNotFoundException ("ClosePriceSeries:getLastDate: no entries in time series");

      return mEntries.back().getDate();
    }

    std::vector<Decimal> getClosesAsVector() const
    {
      std::vector<Decimal> closes;
      closes.reserve (mEntries.size());

      for (const auto& entry : mEntries)
	closes.push_back (entry.getClose());

      return closes;
    }

    std::vector<TimeSeriesDate> getDatesAsVector() const
    {
      std::vector<TimeSeriesDate> dates;
      dates.reserve (mEntries.size());

      for (const auto& entry : mEntries)
	dates.push_back (entry.getDate());

      return dates;
    }

    /**
     * @brief Returns a copy of the entries whose dates fall inside range.
     */
    ClosePriceSeries<Decimal> createSubSeries (const DateRange& range) const
    {
      ClosePriceSeries<Decimal> subSeries (mTimeFrame);

      for (const auto& entry : mEntries)
	{
	  if (range.contains (entry.getDate()))
	    subSeries.addEntry (entry);
	}

      return subSeries;
    }

    ConstRandomAccessIterator beginRandomAccess() const
    {
      return mEntries.begin();
    }

    ConstRandomAccessIterator endRandomAccess() const
    {
      return mEntries.end();
    }

  private:
    void validateIndex (unsigned long index) const
    {
      if (index >= mEntries.size())
	throw TimeSeriesOffsetOutOfRangeException ("ClosePriceSeries: index " + std::to_string(index) +
						   " outside bounds of time series of size " +
						   std::to_string(mEntries.size()));
    }

  private:
    std::vector<ClosePriceEntry<Decimal>> mEntries;
    TimeFrame::Duration mTimeFrame;
  };

  template <class Decimal>
  bool operator==(const ClosePriceSeries<Decimal>& lhs, const ClosePriceSeries<Decimal>& rhs)
  {
    if (lhs.getNumEntries() != rhs.getNumEntries() ||
	lhs.getTimeFrame() != rhs.getTimeFrame())
      return false;

    for (unsigned long i = 0; i < lhs.getNumEntries(); ++i)
      {
	if (lhs.getEntry(i) != rhs.getEntry(i))
	  return false;
      }

    return true;
  }

  template <class Decimal>
  bool operator!=(const ClosePriceSeries<Decimal>& lhs, const ClosePriceSeries<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

  template <class Decimal>
  std::ostream& operator<<(std::ostream& os, const ClosePriceSeries<Decimal>& series)
  {
    os << "Date,Close" << std::endl;
    for (auto it = series.beginRandomAccess(); it != series.endRandomAccess(); ++it)
      os << toIsoDateString (it->getDate()) << "," << num::toString (it->getClose()) << std::endl;

    return os;
  }
}

#endif
