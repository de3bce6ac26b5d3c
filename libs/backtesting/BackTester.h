// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __BACKTESTER_H
#define __BACKTESTER_H 1

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <boost/date_time.hpp>
#include "number.h"
#include "BoostDateHelper.h"
#include "DecimalConstants.h"
#include "TimeSeries.h"
#include "ExposureSeries.h"

namespace regime_backtest
{
  class BackTesterException : public std::runtime_error
  {
  public:
    BackTesterException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~BackTesterException()
    {}

  };

  /**
   * @class BacktestResult
   * @brief Per bar output of a simulation, aligned with the close series.
   *
   * - positions: exposure held over each bar.
   * - returns: net strategy return of each bar after fees.
   * - fees: fee charged on each bar.
   * - equity: growth of one unit of capital, cumulative product of 1 + return.
   */
  template <class Decimal>
  class BacktestResult
  {
  public:
    BacktestResult (std::vector<TimeSeriesDate> dates,
		    std::vector<Decimal> positions,
		    std::vector<Decimal> returns,
		    std::vector<Decimal> fees,
		    std::vector<Decimal> equity)
      : mDates(std::move (dates)),
	mPositions(std::move (positions)),
	mReturns(std::move (returns)),
	mFees(std::move (fees)),
	mEquity(std::move (equity))
    {
      const std::size_t n = mDates.size();
      if (mPositions.size() != n || mReturns.size() != n || mFees.size() != n || mEquity.size() != n)
	throw BackTesterException ("BacktestResult: component series must have the same length");
    }

    BacktestResult (const BacktestResult<Decimal>& rhs) = default;
    BacktestResult (BacktestResult<Decimal>&& rhs) = default;
    BacktestResult<Decimal>& operator=(const BacktestResult<Decimal>& rhs) = default;
    BacktestResult<Decimal>& operator=(BacktestResult<Decimal>&& rhs) = default;

    std::size_t getNumEntries() const
    {
      return mDates.size();
    }

    const std::vector<TimeSeriesDate>& getDates() const
    {
      return mDates;
    }

    const std::vector<Decimal>& getPositions() const
    {
      return mPositions;
    }

    const std::vector<Decimal>& getReturns() const
    {
      return mReturns;
    }

    const std::vector<Decimal>& getFees() const
    {
      return mFees;
    }

    const std::vector<Decimal>& getEquity() const
    {
      return mEquity;
    }

    Decimal getFinalEquity() const
    {
      if (mEquity.empty())
	throw BackTesterException ("BacktestResult:getFinalEquity: empty result");

      return mEquity.back();
    }

  private:
    std::vector<TimeSeriesDate> mDates;
    std::vector<Decimal> mPositions;
    std::vector<Decimal> mReturns;
    std::vector<Decimal> mFees;
    std::vector<Decimal> mEquity;
  };

  /**
   * @class ExposureBackTester
   * @brief Simulates holding a given exposure over a close series with a
   *        flat fee proportional to turnover.
   *
   * For t >= 1:
   *   turnover[t] = |pos[t] - pos[t-1]|
   *   fee[t]      = feeBps / 10000 * turnover[t]
   *   ret[t]      = pos[t] * (close[t] / close[t-1] - 1) - fee[t]
   *   equity[t]   = equity[t-1] * (1 + ret[t])
   *
   * Bar 0 has no return, no fee and equity 1. Equity is not floored, so a
   * levered position can drive it to or below zero.
   *
   * Thread Safety:
   * - Instances hold only the fee and can be shared between threads.
   */
  template <class Decimal>
  class ExposureBackTester
  {
  public:
    explicit ExposureBackTester (const Decimal& feeBasisPoints = DecimalConstants<Decimal>::DefaultFeeBasisPoints)
      : mFeeBasisPoints(feeBasisPoints),
	mFeeRate(feeBasisPoints / DecimalConstants<Decimal>::BasisPointsPerUnit)
    {
      if (feeBasisPoints < DecimalConstants<Decimal>::DecimalZero)
	throw BackTesterException ("ExposureBackTester: fee of " + num::toString (feeBasisPoints) +
				   " basis points cannot be negative");
    }

    ExposureBackTester (const ExposureBackTester<Decimal>& rhs) = default;
    ExposureBackTester<Decimal>& operator=(const ExposureBackTester<Decimal>& rhs) = default;

    ~ExposureBackTester()
    {}

    const Decimal& getFeeBasisPoints() const
    {
      return mFeeBasisPoints;
    }

    /**
     * @throws BackTesterException if exposure is not aligned with close in
     *         length or dates.
     */
    BacktestResult<Decimal> backtest (const ClosePriceSeries<Decimal>& close,
				      const ExposureSeries<Decimal>& exposure) const
    {
      const std::size_t n = close.getNumEntries();

      if (exposure.getNumEntries() != n)
	throw BackTesterException ("ExposureBackTester::backtest: exposure has " +
				   std::to_string (exposure.getNumEntries()) + " bars but close has " +
				   std::to_string (n));

      std::vector<TimeSeriesDate> dates = close.getDatesAsVector();
      for (std::size_t t = 0; t < n; ++t)
	{
	  if (exposure.getDate (t) != dates[t])
	    throw BackTesterException ("ExposureBackTester::backtest: exposure date " +
				       toIsoDateString (exposure.getDate (t)) + " does not match close date " +
				       toIsoDateString (dates[t]));
	}

      const Decimal zero (DecimalConstants<Decimal>::DecimalZero);
      const Decimal one (DecimalConstants<Decimal>::DecimalOne);

      std::vector<Decimal> positions (exposure.getExposures());
      std::vector<Decimal> returns (n, zero);
      std::vector<Decimal> fees (n, zero);
      std::vector<Decimal> equity (n, one);

      for (std::size_t t = 1; t < n; ++t)
	{
	  Decimal dailyReturn = (close.getClose (t) / close.getClose (t - 1)) - one;
	  Decimal turnover = num::abs (positions[t] - positions[t - 1]);

	  fees[t] = mFeeRate * turnover;
	  returns[t] = (positions[t] * dailyReturn) - fees[t];
	  equity[t] = equity[t - 1] * (one + returns[t]);
	}

      return BacktestResult<Decimal> (std::move (dates), std::move (positions), std::move (returns),
				      std::move (fees), std::move (equity));
    }

    /**
     * @brief Benchmark of holding the asset on every bar without fees, so
     * equity[t] equals close[t] / close[0].
     */
    static BacktestResult<Decimal> buyAndHold (const ClosePriceSeries<Decimal>& close)
    {
      ExposureBackTester<Decimal> frictionless (DecimalConstants<Decimal>::DecimalZero);
      return frictionless.backtest (close, ExposureSeries<Decimal>::constant (close,
									     DecimalConstants<Decimal>::DecimalOne));
    }

  private:
    Decimal mFeeBasisPoints;
    Decimal mFeeRate;
  };
}

#endif
