// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __SMA_CROSSOVER_STRATEGY_H
#define __SMA_CROSSOVER_STRATEGY_H 1

#include <string>
#include <vector>
#include <boost/format.hpp>
#include "TimeSeries.h"
#include "TimeSeriesIndicators.h"
#include "DecimalConstants.h"
#include "PositionStrategy.h"
#include "StrategyConfiguration.h"

namespace regime_backtest
{
  /**
   * @class SmaCrossoverStrategy
   * @brief Long while the fast moving average is above the slow one.
   *
   * Flat whenever either average is still undefined.
   */
  template <class Decimal>
  class SmaCrossoverStrategy : public PositionStrategy<Decimal>
  {
  public:
    SmaCrossoverStrategy (unsigned int fastPeriod, unsigned int slowPeriod)
      : PositionStrategy<Decimal>("SMA Crossover"),
	mFastPeriod(fastPeriod),
	mSlowPeriod(slowPeriod)
    {
      if (fastPeriod == 0)
	throw StrategyConfigurationException ("SmaCrossoverStrategy: fast period must be greater than zero");

      if (fastPeriod >= slowPeriod)
	throw StrategyConfigurationException ("SmaCrossoverStrategy: fast period " + std::to_string (fastPeriod) +
					      " must be less than slow period " + std::to_string (slowPeriod));
    }

    SmaCrossoverStrategy (const SmaCrossoverStrategy<Decimal>& rhs) = default;
    SmaCrossoverStrategy<Decimal>& operator=(const SmaCrossoverStrategy<Decimal>& rhs) = default;

    ~SmaCrossoverStrategy()
    {}

    unsigned int getFastPeriod() const
    {
      return mFastPeriod;
    }

    unsigned int getSlowPeriod() const
    {
      return mSlowPeriod;
    }

    std::string getParameterTag() const
    {
      return (boost::format ("sma_f%1%_s%2%") % mFastPeriod % mSlowPeriod).str();
    }

    std::vector<Decimal> computeSameBarDecisions (const ClosePriceSeries<Decimal>& close) const
    {
      IndicatorSeries<Decimal> smaFast = SimpleMovingAverageSeries (close, mFastPeriod);
      IndicatorSeries<Decimal> smaSlow = SimpleMovingAverageSeries (close, mSlowPeriod);

      std::vector<Decimal> decisions (close.getNumEntries(), DecimalConstants<Decimal>::DecimalZero);
      for (std::size_t t = 1; t < decisions.size(); ++t)
	{
	  if (smaFast[t] && smaSlow[t] && (*smaFast[t] > *smaSlow[t]))
	    decisions[t] = DecimalConstants<Decimal>::DecimalOne;
	}

      return decisions;
    }

  private:
    unsigned int mFastPeriod;
    unsigned int mSlowPeriod;
  };
}

#endif
