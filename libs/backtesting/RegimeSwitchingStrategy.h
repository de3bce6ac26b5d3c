// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REGIME_SWITCHING_STRATEGY_H
#define __REGIME_SWITCHING_STRATEGY_H 1

#include <string>
#include <vector>
#include <boost/format.hpp>
#include "TimeSeries.h"
#include "TimeSeriesIndicators.h"
#include "DecimalConstants.h"
#include "number.h"
#include "PositionStrategy.h"
#include "StrategyConfiguration.h"
#include "StreakTracker.h"
#include "CrashRegimeDetector.h"

namespace regime_backtest
{
  /**
   * @class RegimeSwitchingStrategy
   * @brief Momentum override on top of streak based mean reversion, with a
   *        crash mode that tightens the streak thresholds.
   *
   * On each bar t >= 1:
   * - Outside crash mode with positive momentum the strategy is forced long
   *   at exposure 1 and both streaks are cleared.
   * - Otherwise the streaks are updated with the daily return and the entry
   *   and exit thresholds of the current regime are applied.
   * - The position is then scaled by downLeverage when momentum is not
   *   positive, unless crash mode is active and leverage is disabled there.
   *
   * Undefined momentum counts as not positive. An undefined daily return
   * leaves the streak state untouched.
   */
  template <class Decimal>
  class RegimeSwitchingStrategy : public PositionStrategy<Decimal>
  {
  public:
    explicit RegimeSwitchingStrategy (const RegimeSwitchingParameters<Decimal>& parameters)
      : PositionStrategy<Decimal>("Regime Switching"),
	mParameters(parameters),
	mCrashDetector(parameters.getCrashWeekDrop(), parameters.getCrashHoldDays())
    {}

    RegimeSwitchingStrategy (const RegimeSwitchingStrategy<Decimal>& rhs) = default;
    RegimeSwitchingStrategy<Decimal>& operator=(const RegimeSwitchingStrategy<Decimal>& rhs) = default;

    ~RegimeSwitchingStrategy()
    {}

    const RegimeSwitchingParameters<Decimal>& getParameters() const
    {
      return mParameters;
    }

    std::string getParameterTag() const
    {
      int dropPercent = static_cast<int>(num::to_double (mParameters.getCrashWeekDrop() *
							  DecimalConstants<Decimal>::DecimalOneHundred));

      return (boost::format ("mom%1%_d%2%_u%3%_cr%4%w_ch%5%_cd%6%_cu%7%_lev%8$.2f")
	      % mParameters.getLookback()
	      % mParameters.getDownDays()
	      % mParameters.getUpDays()
	      % dropPercent
	      % mParameters.getCrashHoldDays()
	      % mParameters.getCrashDownDays()
	      % mParameters.getCrashUpDays()
	      % num::to_double (mParameters.getDownLeverage())).str();
    }

    std::vector<Decimal> computeSameBarDecisions (const ClosePriceSeries<Decimal>& close) const
    {
      const std::size_t n = close.getNumEntries();
      const Decimal zero (DecimalConstants<Decimal>::DecimalZero);
      const Decimal one (DecimalConstants<Decimal>::DecimalOne);

      std::vector<Decimal> decisions (n, zero);
      if (n == 0)
	return decisions;

      IndicatorSeries<Decimal> momentum = RocSeries (close, mParameters.getLookback());
      IndicatorSeries<Decimal> dailyReturn = PercentChangeSeries (close);
      std::vector<bool> crashActive = mCrashDetector.computeActiveDays (close);

      StreakTracker state;

      for (std::size_t t = 1; t < n; ++t)
	{
	  const bool inCrash = crashActive[t];
	  const bool momIsPositive = isDefinedAndPositive (momentum[t]);

	  if (!inCrash && momIsPositive)
	    {
	      state.forceLong();
	      decisions[t] = one;
	      continue;
	    }

	  const unsigned int downThreshold = inCrash ? mParameters.getCrashDownDays() : mParameters.getDownDays();
	  const unsigned int upThreshold = inCrash ? mParameters.getCrashUpDays() : mParameters.getUpDays();

	  if (dailyReturn[t])
	    {
	      state.recordReturn (*dailyReturn[t]);
	      state.applyThresholds (downThreshold, upThreshold);
	    }

	  Decimal leverage (one);
	  if (!momIsPositive)
	    {
	      leverage = mParameters.getDownLeverage();
	      if (mParameters.isLeverageDisabledInCrash() && inCrash)
		leverage = one;
	    }

	  decisions[t] = state.isInPosition() ? leverage : zero;
	}

      return decisions;
    }

  private:
    RegimeSwitchingParameters<Decimal> mParameters;
    CrashRegimeDetector<Decimal> mCrashDetector;
  };
}

#endif
