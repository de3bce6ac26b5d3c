// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __STRATEGY_CONFIGURATION_H
#define __STRATEGY_CONFIGURATION_H 1

#include <stdexcept>
#include <string>
#include "DecimalConstants.h"
#include "number.h"

namespace regime_backtest
{
  class StrategyConfigurationException : public std::runtime_error
  {
  public:
    StrategyConfigurationException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~StrategyConfigurationException()
    {}
  };

  /**
   * @class RegimeSwitchingParameters
   * @brief Immutable parameter set for the regime switching position engine.
   *
   * - lookback: momentum lookback in bars.
   * - downDays / upDays: streak lengths that enter / exit a position in the
   *   normal regime.
   * - crashWeekDrop: a five bar return at or below -crashWeekDrop triggers
   *   crash mode.
   * - crashHoldDays: number of bars crash mode stays active after a trigger.
   * - crashDownDays / crashUpDays: streak lengths used while in crash mode.
   * - downLeverage: exposure multiplier used when momentum is not positive.
   * - disableLeverageInCrash: caps exposure at 1 while crash mode is active.
   *
   * All invariants are checked in the constructor.
   */
  template <class Decimal>
  class RegimeSwitchingParameters
  {
  public:
    RegimeSwitchingParameters (unsigned int lookback = 50,
			       unsigned int downDays = 2,
			       unsigned int upDays = 1,
			       const Decimal& crashWeekDrop = DecimalConstants<Decimal>::DefaultCrashWeekDrop,
			       unsigned int crashHoldDays = 5,
			       unsigned int crashDownDays = 1,
			       unsigned int crashUpDays = 1,
			       const Decimal& downLeverage = DecimalConstants<Decimal>::DefaultDownLeverage,
			       bool disableLeverageInCrash = true)
      : mLookback(lookback),
	mDownDays(downDays),
	mUpDays(upDays),
	mCrashWeekDrop(crashWeekDrop),
	mCrashHoldDays(crashHoldDays),
	mCrashDownDays(crashDownDays),
	mCrashUpDays(crashUpDays),
	mDownLeverage(downLeverage),
	mDisableLeverageInCrash(disableLeverageInCrash)
    {
      requirePositive (lookback, "lookback");
      requirePositive (downDays, "downDays");
      requirePositive (upDays, "upDays");
      requirePositive (crashHoldDays, "crashHoldDays");
      requirePositive (crashDownDays, "crashDownDays");
      requirePositive (crashUpDays, "crashUpDays");

      if (crashWeekDrop <= DecimalConstants<Decimal>::DecimalZero)
	throw StrategyConfigurationException ("RegimeSwitchingParameters: crashWeekDrop must be positive, got " +
					      num::toString (crashWeekDrop));

      if (downLeverage <= DecimalConstants<Decimal>::DecimalZero)
	throw StrategyConfigurationException ("RegimeSwitchingParameters: downLeverage must be positive, got " +
					      num::toString (downLeverage));
    }

    RegimeSwitchingParameters (const RegimeSwitchingParameters<Decimal>& rhs) = default;
    RegimeSwitchingParameters<Decimal>& operator=(const RegimeSwitchingParameters<Decimal>& rhs) = default;

    unsigned int getLookback() const
    {
      return mLookback;
    }

    unsigned int getDownDays() const
    {
      return mDownDays;
    }

    unsigned int getUpDays() const
    {
      return mUpDays;
    }

    const Decimal& getCrashWeekDrop() const
    {
      return mCrashWeekDrop;
    }

    unsigned int getCrashHoldDays() const
    {
      return mCrashHoldDays;
    }

    unsigned int getCrashDownDays() const
    {
      return mCrashDownDays;
    }

    unsigned int getCrashUpDays() const
    {
      return mCrashUpDays;
    }

    const Decimal& getDownLeverage() const
    {
      return mDownLeverage;
    }

    bool isLeverageDisabledInCrash() const
    {
      return mDisableLeverageInCrash;
    }

  private:
    static void requirePositive (unsigned int value, const char *name)
    {
      if (value == 0)
	throw StrategyConfigurationException (std::string ("RegimeSwitchingParameters: ") + name +
					      " must be greater than zero");
    }

  private:
    unsigned int mLookback;
    unsigned int mDownDays;
    unsigned int mUpDays;
    Decimal mCrashWeekDrop;
    unsigned int mCrashHoldDays;
    unsigned int mCrashDownDays;
    unsigned int mCrashUpDays;
    Decimal mDownLeverage;
    bool mDisableLeverageInCrash;
  };
}

#endif
