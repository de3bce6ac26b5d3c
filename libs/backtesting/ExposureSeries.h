// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __EXPOSURE_SERIES_H
#define __EXPOSURE_SERIES_H 1

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "TimeSeries.h"
#include "TimeSeriesException.h"
#include "DecimalConstants.h"

namespace regime_backtest
{
  /**
   * @class ExposureSeries
   * @brief Exposure to hold over each bar of a close series.
   *
   * exposure[t] is the fraction of equity (possibly above 1 when levered)
   * held from close[t-1] to close[t]. The value is therefore known at the
   * close of bar t-1, which is what removes lookahead.
   *
   * Instances are built from same bar decisions with fromSameBarDecisions(),
   * the one place where the one bar lag is applied.
   */
  template <class Decimal>
  class ExposureSeries
  {
  public:
    /**
     * @brief Shifts decisions taken at the close of each bar forward by one
     * bar. exposure[0] is zero and the last decision is dropped.
     *
     * @throws TimeSeriesException if decisions is not aligned with close.
     */
    static ExposureSeries<Decimal> fromSameBarDecisions (const ClosePriceSeries<Decimal>& close,
							 const std::vector<Decimal>& decisions)
    {
      if (decisions.size() != close.getNumEntries())
	throw TimeSeriesException ("ExposureSeries::fromSameBarDecisions: " + std::to_string (decisions.size()) +
				   " decisions for " + std::to_string (close.getNumEntries()) + " bars");

      std::vector<Decimal> exposure (decisions.size(), DecimalConstants<Decimal>::DecimalZero);
      for (std::size_t t = 1; t < decisions.size(); ++t)
	exposure[t] = decisions[t - 1];

      return ExposureSeries<Decimal> (close.getDatesAsVector(), std::move (exposure));
    }

    /**
     * @brief Wraps exposures that are already lagged, e.g. read back from a
     * previous run.
     *
     * @throws TimeSeriesException if exposure is not aligned with close.
     */
    static ExposureSeries<Decimal> fromLaggedExposure (const ClosePriceSeries<Decimal>& close,
						       const std::vector<Decimal>& exposure)
    {
      if (exposure.size() != close.getNumEntries())
	throw TimeSeriesException ("ExposureSeries::fromLaggedExposure: " + std::to_string (exposure.size()) +
				   " exposures for " + std::to_string (close.getNumEntries()) + " bars");

      return ExposureSeries<Decimal> (close.getDatesAsVector(), exposure);
    }

    // Constant exposure on every bar, used for the buy and hold benchmark
    static ExposureSeries<Decimal> constant (const ClosePriceSeries<Decimal>& close, const Decimal& value)
    {
      return ExposureSeries<Decimal> (close.getDatesAsVector(),
				      std::vector<Decimal> (close.getNumEntries(), value));
    }

    ExposureSeries (const ExposureSeries<Decimal>& rhs) = default;
    ExposureSeries (ExposureSeries<Decimal>&& rhs) = default;
    ExposureSeries<Decimal>& operator=(const ExposureSeries<Decimal>& rhs) = default;
    ExposureSeries<Decimal>& operator=(ExposureSeries<Decimal>&& rhs) = default;

    std::size_t getNumEntries() const
    {
      return mExposure.size();
    }

    const Decimal& getExposure (std::size_t index) const
    {
      validateIndex (index);
      return mExposure[index];
    }

    const TimeSeriesDate& getDate (std::size_t index) const
    {
      validateIndex (index);
      return mDates[index];
    }

    const std::vector<Decimal>& getExposures() const
    {
      return mExposure;
    }

    const std::vector<TimeSeriesDate>& getDates() const
    {
      return mDates;
    }

    /**
     * @brief Number of bars carrying each distinct exposure value.
     */
    std::map<Decimal, unsigned long> getValueCounts() const
    {
      std::map<Decimal, unsigned long> counts;
      for (const auto& value : mExposure)
	counts[value]++;

      return counts;
    }

    Decimal getAverageExposure() const
    {
      if (mExposure.empty())
	return DecimalConstants<Decimal>::DecimalZero;

      Decimal sum (DecimalConstants<Decimal>::DecimalZero);
      for (const auto& value : mExposure)
	sum += value;

      return sum / Decimal (static_cast<int>(mExposure.size()));
    }

    // Share of bars with a strictly positive exposure
    double getFractionInvested() const
    {
      if (mExposure.empty())
	return 0.0;

      unsigned long invested = std::count_if (mExposure.begin(), mExposure.end(),
					      [](const Decimal& value) {
						return value > DecimalConstants<Decimal>::DecimalZero;
					      });

      return static_cast<double>(invested) / static_cast<double>(mExposure.size());
    }

    Decimal getMaxExposure() const
    {
      if (mExposure.empty())
	return DecimalConstants<Decimal>::DecimalZero;

      return *std::max_element (mExposure.begin(), mExposure.end());
    }

  private:
    ExposureSeries (std::vector<TimeSeriesDate> dates, std::vector<Decimal> exposure)
      : mDates(std::move (dates)),
	mExposure(std::move (exposure))
    {}

    void validateIndex (std::size_t index) const
    {
      if (index >= mExposure.size())
	throw TimeSeriesOffsetOutOfRangeException ("ExposureSeries: index " + std::to_string (index) +
						   " outside bounds of series of size " +
						   std::to_string (mExposure.size()));
    }

  private:
    std::vector<TimeSeriesDate> mDates;
    std::vector<Decimal> mExposure;
  };
}

#endif
