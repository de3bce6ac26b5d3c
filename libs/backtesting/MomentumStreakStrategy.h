// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MOMENTUM_STREAK_STRATEGY_H
#define __MOMENTUM_STREAK_STRATEGY_H 1

#include <string>
#include <vector>
#include <boost/format.hpp>
#include "TimeSeries.h"
#include "TimeSeriesIndicators.h"
#include "DecimalConstants.h"
#include "PositionStrategy.h"
#include "StrategyConfiguration.h"
#include "StreakTracker.h"

namespace regime_backtest
{
  /**
   * @class MomentumStreakStrategy
   * @brief Holds long while lookback momentum is positive and falls back to
   *        the consecutive reversal rule otherwise.
   *
   * Same as the regime switching engine without crash mode and without
   * leverage; exposure is always 0 or 1.
   */
  template <class Decimal>
  class MomentumStreakStrategy : public PositionStrategy<Decimal>
  {
  public:
    MomentumStreakStrategy (unsigned int lookback = 50, unsigned int downDays = 2, unsigned int upDays = 1)
      : PositionStrategy<Decimal>("Momentum Else Streak"),
	mLookback(lookback),
	mDownDays(downDays),
	mUpDays(upDays)
    {
      if (lookback == 0)
	throw StrategyConfigurationException ("MomentumStreakStrategy: lookback must be greater than zero");

      if (downDays == 0 || upDays == 0)
	throw StrategyConfigurationException ("MomentumStreakStrategy: streak lengths must be greater than zero");
    }

    MomentumStreakStrategy (const MomentumStreakStrategy<Decimal>& rhs) = default;
    MomentumStreakStrategy<Decimal>& operator=(const MomentumStreakStrategy<Decimal>& rhs) = default;

    ~MomentumStreakStrategy()
    {}

    unsigned int getLookback() const
    {
      return mLookback;
    }

    std::string getParameterTag() const
    {
      return (boost::format ("momstreak_mom%1%_d%2%_u%3%") % mLookback % mDownDays % mUpDays).str();
    }

    std::vector<Decimal> computeSameBarDecisions (const ClosePriceSeries<Decimal>& close) const
    {
      IndicatorSeries<Decimal> momentum = RocSeries (close, mLookback);
      IndicatorSeries<Decimal> dailyReturn = PercentChangeSeries (close);
      std::vector<Decimal> decisions (close.getNumEntries(), DecimalConstants<Decimal>::DecimalZero);
      StreakTracker state;

      for (std::size_t t = 1; t < decisions.size(); ++t)
	{
	  if (isDefinedAndPositive (momentum[t]))
	    state.forceLong();
	  else if (dailyReturn[t])
	    {
	      state.recordReturn (*dailyReturn[t]);
	      state.applyThresholds (mDownDays, mUpDays);
	    }

	  if (state.isInPosition())
	    decisions[t] = DecimalConstants<Decimal>::DecimalOne;
	}

      return decisions;
    }

  private:
    unsigned int mLookback;
    unsigned int mDownDays;
    unsigned int mUpDays;
  };
}

#endif
