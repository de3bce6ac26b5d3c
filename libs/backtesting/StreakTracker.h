// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __STREAK_TRACKER_H
#define __STREAK_TRACKER_H 1

#include "DecimalConstants.h"

namespace regime_backtest
{
  /**
   * @class StreakTracker
   * @brief Mutable state of a streak based mean reversion walk.
   *
   * Tracks the current run of down closes, the current run of up closes and
   * whether the walk is holding a position. A flat tracker goes long after
   * downDays consecutive down closes; a long tracker goes flat after upDays
   * consecutive up closes.
   *
   * One instance is created per strategy invocation and never shared.
   */
  class StreakTracker
  {
  public:
    StreakTracker()
      : mInPosition(false),
	mDownStreak(0),
	mUpStreak(0)
    {}

    // Extends the streaks with one daily return
    template <class Decimal>
    void recordReturn (const Decimal& dailyReturn)
    {
      if (dailyReturn < DecimalConstants<Decimal>::DecimalZero)
	{
	  ++mDownStreak;
	  mUpStreak = 0;
	}
      else if (dailyReturn > DecimalConstants<Decimal>::DecimalZero)
	{
	  ++mUpStreak;
	  mDownStreak = 0;
	}
      else
	resetStreaks();
    }

    void resetStreaks()
    {
      mDownStreak = 0;
      mUpStreak = 0;
    }

    void forceLong()
    {
      mInPosition = true;
      resetStreaks();
    }

    /**
     * @brief Applies the entry/exit transition for the given thresholds.
     *
     * Entry is checked first so that a single call changes the position at
     * most once.
     */
    void applyThresholds (unsigned int downDays, unsigned int upDays)
    {
      if (!mInPosition && mDownStreak >= downDays)
	mInPosition = true;
      else if (mInPosition && mUpStreak >= upDays)
	mInPosition = false;
    }

    bool isInPosition() const
    {
      return mInPosition;
    }

    int positionFlag() const
    {
      return mInPosition ? 1 : 0;
    }

    unsigned int getDownStreak() const
    {
      return mDownStreak;
    }

    unsigned int getUpStreak() const
    {
      return mUpStreak;
    }

  private:
    bool mInPosition;
    unsigned int mDownStreak;
    unsigned int mUpStreak;
  };
}

#endif
