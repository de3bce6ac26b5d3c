// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __PERFORMANCE_SUMMARY_H
#define __PERFORMANCE_SUMMARY_H 1

#include <cmath>
#include <limits>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include <boost/format.hpp>
#include "BackTester.h"
#include "TimeFrame.h"
#include "Annualizer.h"
#include "StatUtils.h"
#include "number.h"

namespace regime_backtest
{
  /**
   * @class PerformanceSummary
   * @brief Headline risk and return statistics of one simulation.
   *
   * - CAGR: (end / start)^(1 / years) - 1 where years is the calendar span
   *   of the result divided by 365.25.
   * - Vol (ann.): sample standard deviation of daily returns times sqrt(252).
   * - Sharpe: sqrt(252) * mean / stddev of daily returns with a zero risk
   *   free rate.
   * - Max Drawdown: most negative equity / running peak - 1.
   * - Trades: integer part of the total absolute change in exposure.
   * - Win Rate (active days): share of bars with non-zero exposure that had
   *   a strictly positive return.
   *
   * Undefined metrics are NaN.
   */
  class PerformanceSummary
  {
  public:
    static constexpr double DaysPerYear = 365.25;

    PerformanceSummary(double cagr, double annualizedVolatility, double sharpe,
		       double maxDrawdown, long trades, double winRate)
      : mCagr(cagr),
	mAnnualizedVolatility(annualizedVolatility),
	mSharpe(sharpe),
	mMaxDrawdown(maxDrawdown),
	mTrades(trades),
	mWinRate(winRate)
    {}

    template <class Decimal>
    static PerformanceSummary fromBacktest(const BacktestResult<Decimal>& result,
					   TimeFrame::Duration timeFrame = TimeFrame::DAILY)
    {
      const double periodsPerYear = computeAnnualizationFactor(timeFrame);
      const auto& returns = result.getReturns();

      return PerformanceSummary(computeCagr(result),
				StatUtils<Decimal>::computeSampleStdDev(returns) * std::sqrt(periodsPerYear),
				StatUtils<Decimal>::computeSharpeRatio(returns, 0.0, periodsPerYear),
				StatUtils<Decimal>::computeMaxDrawdown(result.getEquity()),
				computeTrades(result.getPositions()),
				computeWinRate(result.getPositions(), returns));
    }

    template <class Decimal>
    static double computeCagr(const BacktestResult<Decimal>& result)
    {
      const std::size_t n = result.getNumEntries();
      if (n < 2)
	return std::numeric_limits<double>::quiet_NaN();

      const auto& dates = result.getDates();
      const long days = (dates.back() - dates.front()).days();
      const double start = num::to_double(result.getEquity().front());
      const double end = num::to_double(result.getEquity().back());

      if (days <= 0 || start <= 0.0)
	return std::numeric_limits<double>::quiet_NaN();

      const double years = static_cast<double>(days) / DaysPerYear;
      return std::pow(end / start, 1.0 / years) - 1.0;
    }

    template <class Decimal>
    static long computeTrades(const std::vector<Decimal>& positions)
    {
      double turnover = 0.0;
      for (std::size_t t = 1; t < positions.size(); ++t)
	turnover += std::fabs(num::to_double(positions[t]) - num::to_double(positions[t - 1]));

      // absorbs rounding in the double sum before truncation
      return static_cast<long>(turnover + 1e-9);
    }

    template <class Decimal>
    static double computeWinRate(const std::vector<Decimal>& positions,
				 const std::vector<Decimal>& returns)
    {
      unsigned long activeDays = 0;
      unsigned long winningDays = 0;

      for (std::size_t t = 0; t < positions.size() && t < returns.size(); ++t)
	{
	  if (positions[t] == DecimalConstants<Decimal>::DecimalZero)
	    continue;

	  ++activeDays;
	  if (returns[t] > DecimalConstants<Decimal>::DecimalZero)
	    ++winningDays;
	}

      if (activeDays == 0)
	return std::numeric_limits<double>::quiet_NaN();

      return static_cast<double>(winningDays) / static_cast<double>(activeDays);
    }

    double getCagr() const
    {
      return mCagr;
    }

    double getAnnualizedVolatility() const
    {
      return mAnnualizedVolatility;
    }

    double getSharpe() const
    {
      return mSharpe;
    }

    double getMaxDrawdown() const
    {
      return mMaxDrawdown;
    }

    long getTrades() const
    {
      return mTrades;
    }

    double getWinRate() const
    {
      return mWinRate;
    }

    static std::string formatValue(double value)
    {
      if (std::isnan(value))
	return "nan";

      return (boost::format("%0.4f") % value).str();
    }

    /**
     * @brief Prints one column per named summary, one row per metric.
     */
    static void writeTable(std::ostream& os,
			   const std::vector<std::pair<std::string, PerformanceSummary>>& columns)
    {
      os << (boost::format("%-24s") % "");
      for (const auto& column : columns)
	os << (boost::format("%14s") % column.first);
      os << std::endl;

      writeRow(os, "CAGR", columns, [](const PerformanceSummary& s) { return formatValue(s.getCagr()); });
      writeRow(os, "Vol (ann.)", columns,
	       [](const PerformanceSummary& s) { return formatValue(s.getAnnualizedVolatility()); });
      writeRow(os, "Sharpe", columns, [](const PerformanceSummary& s) { return formatValue(s.getSharpe()); });
      writeRow(os, "Max Drawdown", columns,
	       [](const PerformanceSummary& s) { return formatValue(s.getMaxDrawdown()); });
      writeRow(os, "Trades", columns,
	       [](const PerformanceSummary& s) { return std::to_string(s.getTrades()); });
      writeRow(os, "Win Rate (active days)", columns,
	       [](const PerformanceSummary& s) { return formatValue(s.getWinRate()); });
    }

  private:
    template <class Formatter>
    static void writeRow(std::ostream& os, const std::string& label,
			 const std::vector<std::pair<std::string, PerformanceSummary>>& columns,
			 Formatter format)
    {
      os << (boost::format("%-24s") % label);
      for (const auto& column : columns)
	os << (boost::format("%14s") % format(column.second));
      os << std::endl;
    }

  private:
    double mCagr;
    double mAnnualizedVolatility;
    double mSharpe;
    double mMaxDrawdown;
    long mTrades;
    double mWinRate;
  };
}

#endif
