// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __CRASH_REGIME_DETECTOR_H
#define __CRASH_REGIME_DETECTOR_H 1

#include <vector>
#include "TimeSeries.h"
#include "TimeSeriesIndicators.h"
#include "DecimalConstants.h"
#include "StrategyConfiguration.h"

namespace regime_backtest
{
  /**
   * @class CrashRegimeDetector
   * @brief Flags the bars on which crash mode is active.
   *
   * A bar k is a trigger when its five bar return is defined and at or below
   * -crashWeekDrop. Crash mode is then active on bars k+1 through
   * k+crashHoldDays inclusive; the trigger bar itself is not affected.
   * Overlapping windows merge.
   */
  template <class Decimal>
  class CrashRegimeDetector
  {
  public:
    static constexpr unsigned int WeeklyReturnPeriod = 5;

    CrashRegimeDetector (const Decimal& crashWeekDrop, unsigned int crashHoldDays)
      : mCrashWeekDrop(crashWeekDrop),
	mCrashHoldDays(crashHoldDays)
    {
      if (crashWeekDrop <= DecimalConstants<Decimal>::DecimalZero)
	throw StrategyConfigurationException ("CrashRegimeDetector: crashWeekDrop must be positive");

      if (crashHoldDays == 0)
	throw StrategyConfigurationException ("CrashRegimeDetector: crashHoldDays must be greater than zero");
    }

    std::vector<bool> computeTriggerDays (const ClosePriceSeries<Decimal>& close) const
    {
      IndicatorSeries<Decimal> weeklyReturn = RocSeries (close, WeeklyReturnPeriod);
      std::vector<bool> triggers (weeklyReturn.size(), false);
      const Decimal threshold (-mCrashWeekDrop);

      for (std::size_t t = 0; t < weeklyReturn.size(); ++t)
	triggers[t] = weeklyReturn[t] && (*weeklyReturn[t] <= threshold);

      return triggers;
    }

    // Single forward pass with a countdown of the remaining active bars
    std::vector<bool> computeActiveDays (const ClosePriceSeries<Decimal>& close) const
    {
      std::vector<bool> triggers = computeTriggerDays (close);
      std::vector<bool> active (triggers.size(), false);
      unsigned int remaining = 0;

      for (std::size_t t = 0; t < triggers.size(); ++t)
	{
	  if (remaining > 0)
	    {
	      active[t] = true;
	      --remaining;
	    }

	  if (triggers[t])
	    remaining = mCrashHoldDays;
	}

      return active;
    }

    const Decimal& getCrashWeekDrop() const
    {
      return mCrashWeekDrop;
    }

    unsigned int getCrashHoldDays() const
    {
      return mCrashHoldDays;
    }

  private:
    Decimal mCrashWeekDrop;
    unsigned int mCrashHoldDays;
  };
}

#endif
