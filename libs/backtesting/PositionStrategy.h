// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __POSITION_STRATEGY_H
#define __POSITION_STRATEGY_H 1

#include <string>
#include <vector>
#include "TimeSeries.h"
#include "ExposureSeries.h"
#include "StrategyConfiguration.h"

namespace regime_backtest
{
  /**
   * @class PositionStrategy
   * @brief Base class for rule based strategies that map a close series to
   *        an exposure series.
   *
   * Responsibilities:
   * - Derived classes implement computeSameBarDecisions(), a forward walk
   *   that decides at the close of each bar what to hold from then on.
   * - computeExposure() lags those decisions by one bar so that the exposure
   *   applied to bar t only depends on closes up to t-1.
   *
   * Strategies are immutable after construction. All walk state is local to
   * a single computeExposure() call, so one instance can be reused across
   * series.
   */
  template <class Decimal>
  class PositionStrategy
  {
  public:
    explicit PositionStrategy (const std::string& strategyName)
      : mStrategyName(strategyName)
    {}

    PositionStrategy (const PositionStrategy<Decimal>& rhs) = default;
    PositionStrategy<Decimal>& operator=(const PositionStrategy<Decimal>& rhs) = default;

    virtual ~PositionStrategy()
    {}

    const std::string& getStrategyName() const
    {
      return mStrategyName;
    }

    /**
     * @brief Short parameter summary used to name output files,
     * e.g. "sma_f20_s50".
     */
    virtual std::string getParameterTag() const = 0;

    ExposureSeries<Decimal> computeExposure (const ClosePriceSeries<Decimal>& close) const
    {
      return ExposureSeries<Decimal>::fromSameBarDecisions (close, computeSameBarDecisions (close));
    }

    /**
     * @brief Decision taken at the close of each bar. Same length as close;
     * decision[0] is always zero.
     */
    virtual std::vector<Decimal> computeSameBarDecisions (const ClosePriceSeries<Decimal>& close) const = 0;

  private:
    std::string mStrategyName;
  };
}

#endif
