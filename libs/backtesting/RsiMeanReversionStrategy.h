// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __RSI_MEAN_REVERSION_STRATEGY_H
#define __RSI_MEAN_REVERSION_STRATEGY_H 1

#include <string>
#include <vector>
#include <boost/format.hpp>
#include "TimeSeries.h"
#include "TimeSeriesIndicators.h"
#include "DecimalConstants.h"
#include "number.h"
#include "PositionStrategy.h"
#include "StrategyConfiguration.h"

namespace regime_backtest
{
  /**
   * @class RsiMeanReversionStrategy
   * @brief Buys oversold and sells overbought readings of the RSI.
   *
   * A flat strategy goes long when RSI drops below buyBelow; a long strategy
   * goes flat when RSI rises above sellAbove. Between the thresholds, and on
   * bars where RSI is undefined, the previous position is held.
   */
  template <class Decimal>
  class RsiMeanReversionStrategy : public PositionStrategy<Decimal>
  {
  public:
    RsiMeanReversionStrategy (unsigned int period = 14,
			      const Decimal& buyBelow = DecimalConstants<Decimal>::DefaultRsiBuyBelow,
			      const Decimal& sellAbove = DecimalConstants<Decimal>::DefaultRsiSellAbove)
      : PositionStrategy<Decimal>("RSI Mean Reversion"),
	mPeriod(period),
	mBuyBelow(buyBelow),
	mSellAbove(sellAbove)
    {
      if (period == 0)
	throw StrategyConfigurationException ("RsiMeanReversionStrategy: period must be greater than zero");

      requireRsiLevel (buyBelow, "buy threshold");
      requireRsiLevel (sellAbove, "sell threshold");

      if (buyBelow > sellAbove)
	throw StrategyConfigurationException ("RsiMeanReversionStrategy: buy threshold " + num::toString (buyBelow) +
					      " is above sell threshold " + num::toString (sellAbove));
    }

    RsiMeanReversionStrategy (const RsiMeanReversionStrategy<Decimal>& rhs) = default;
    RsiMeanReversionStrategy<Decimal>& operator=(const RsiMeanReversionStrategy<Decimal>& rhs) = default;

    ~RsiMeanReversionStrategy()
    {}

    unsigned int getPeriod() const
    {
      return mPeriod;
    }

    const Decimal& getBuyBelow() const
    {
      return mBuyBelow;
    }

    const Decimal& getSellAbove() const
    {
      return mSellAbove;
    }

    std::string getParameterTag() const
    {
      return (boost::format ("rsi_p%1%_b%2%_s%3%")
	      % mPeriod
	      % static_cast<int>(num::to_double (mBuyBelow))
	      % static_cast<int>(num::to_double (mSellAbove))).str();
    }

    std::vector<Decimal> computeSameBarDecisions (const ClosePriceSeries<Decimal>& close) const
    {
      IndicatorSeries<Decimal> rsi = RsiSeries (close, mPeriod);
      std::vector<Decimal> decisions (close.getNumEntries(), DecimalConstants<Decimal>::DecimalZero);
      bool inPosition = false;

      for (std::size_t t = 1; t < decisions.size(); ++t)
	{
	  if (rsi[t])
	    {
	      if (!inPosition && *rsi[t] < mBuyBelow)
		inPosition = true;
	      else if (inPosition && *rsi[t] > mSellAbove)
		inPosition = false;
	    }

	  if (inPosition)
	    decisions[t] = DecimalConstants<Decimal>::DecimalOne;
	}

      return decisions;
    }

  private:
    static void requireRsiLevel (const Decimal& level, const char *name)
    {
      if (level < DecimalConstants<Decimal>::DecimalZero || level > DecimalConstants<Decimal>::DecimalOneHundred)
	throw StrategyConfigurationException (std::string ("RsiMeanReversionStrategy: ") + name + " " +
					      num::toString (level) + " is outside [0, 100]");
    }

  private:
    unsigned int mPeriod;
    Decimal mBuyBelow;
    Decimal mSellAbove;
  };
}

#endif
