// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __CONSECUTIVE_REVERSAL_STRATEGY_H
#define __CONSECUTIVE_REVERSAL_STRATEGY_H 1

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
   * @class ConsecutiveReversalStrategy
   * @brief Enters after downDays consecutive down closes and exits after
   *        upDays consecutive up closes. Exposure is 0 or 1.
   */
  template <class Decimal>
  class ConsecutiveReversalStrategy : public PositionStrategy<Decimal>
  {
  public:
    ConsecutiveReversalStrategy (unsigned int downDays = 2, unsigned int upDays = 1)
      : PositionStrategy<Decimal>("Consecutive Reversal"),
	mDownDays(downDays),
	mUpDays(upDays)
    {
      if (downDays == 0 || upDays == 0)
	throw StrategyConfigurationException ("ConsecutiveReversalStrategy: streak lengths must be greater than zero");
    }

    ConsecutiveReversalStrategy (const ConsecutiveReversalStrategy<Decimal>& rhs) = default;
    ConsecutiveReversalStrategy<Decimal>& operator=(const ConsecutiveReversalStrategy<Decimal>& rhs) = default;

    ~ConsecutiveReversalStrategy()
    {}

    unsigned int getDownDays() const
    {
      return mDownDays;
    }

    unsigned int getUpDays() const
    {
      return mUpDays;
    }

    std::string getParameterTag() const
    {
      return (boost::format ("streak_d%1%_u%2%") % mDownDays % mUpDays).str();
    }

    std::vector<Decimal> computeSameBarDecisions (const ClosePriceSeries<Decimal>& close) const
    {
      IndicatorSeries<Decimal> dailyReturn = PercentChangeSeries (close);
      std::vector<Decimal> decisions (close.getNumEntries(), DecimalConstants<Decimal>::DecimalZero);
      StreakTracker state;

      for (std::size_t t = 1; t < decisions.size(); ++t)
	{
	  if (dailyReturn[t])
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
    unsigned int mDownDays;
    unsigned int mUpDays;
  };
}

#endif
