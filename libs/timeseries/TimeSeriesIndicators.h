// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TIME_SERIES_INDICATORS_H
#define __TIME_SERIES_INDICATORS_H 1

#include <stdexcept>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "TimeSeries.h"
#include "DecimalConstants.h"

namespace regime_backtest
{
  /**
   * @brief Indicator values aligned index-for-index with a ClosePriceSeries.
   *
   * A slot holds boost::none where the indicator is undefined, typically
   * because there is not yet enough history at that bar.
   */
  template <class Decimal>
  using IndicatorSeries = std::vector<boost::optional<Decimal>>;

  /**
   * @brief Calculates the fractional rate of change over a specified period.
   *
   * value[t] = close[t] / close[t - period] - 1
   *
   * The result has the same length as the input. Slots t < period are
   * undefined.
   *
   * @tparam Decimal The numeric type used in the time series.
   * @param series The input close series.
   * @param period The lookback period in bars.
   * @return An IndicatorSeries aligned with series.
   * @throws std::domain_error if period is zero.
   */
  template <class Decimal>
  IndicatorSeries<Decimal> RocSeries (const ClosePriceSeries<Decimal>& series, unsigned int period)
  {
    if (period == 0)
      throw std::domain_error ("RocSeries: period must be greater than zero");

    const unsigned long n = series.getNumEntries();
    IndicatorSeries<Decimal> result (n);

    for (unsigned long t = period; t < n; ++t)
      {
	const Decimal& lookBackValue = series.getClose (t - period);
	result[t] = (series.getClose (t) / lookBackValue) - DecimalConstants<Decimal>::DecimalOne;
      }

    return result;
  }

  /**
   * @brief One bar percent change, close[t] / close[t-1] - 1. Undefined at t = 0.
   */
  template <class Decimal>
  IndicatorSeries<Decimal> PercentChangeSeries (const ClosePriceSeries<Decimal>& series)
  {
    return RocSeries (series, 1);
  }

  /**
   * @brief Simple moving average of the close over period bars.
   *
   * Defined from t = period - 1 onwards. Uses a running sum so the whole
   * series is evaluated in a single pass.
   *
   * @throws std::domain_error if period is zero.
   */
  template <class Decimal>
  IndicatorSeries<Decimal> SimpleMovingAverageSeries (const ClosePriceSeries<Decimal>& series,
						      unsigned int period)
  {
    if (period == 0)
      throw std::domain_error ("SimpleMovingAverageSeries: period must be greater than zero");

    const unsigned long n = series.getNumEntries();
    IndicatorSeries<Decimal> result (n);
    const Decimal divisor (static_cast<int>(period));
    Decimal runningSum (DecimalConstants<Decimal>::DecimalZero);

    for (unsigned long t = 0; t < n; ++t)
      {
	runningSum += series.getClose (t);
	if (t >= period)
	  runningSum -= series.getClose (t - period);

	if (t + 1 >= period)
	  result[t] = runningSum / divisor;
      }

    return result;
  }

  /**
   * @brief Relative Strength Index using simple rolling averages of gains
   * and losses over the last period price changes.
   *
   * RSI = 100 - 100 / (1 + avgGain / avgLoss)
   *
   * The first price change is at t = 1, so the first defined value is at
   * t = period. When avgLoss is zero the RSI is 100 if there were gains and
   * undefined if the price did not move at all over the window.
   *
   * @throws std::domain_error if period is zero.
   */
  template <class Decimal>
  IndicatorSeries<Decimal> RsiSeries (const ClosePriceSeries<Decimal>& series, unsigned int period)
  {
    if (period == 0)
      throw std::domain_error ("RsiSeries: period must be greater than zero");

    const unsigned long n = series.getNumEntries();
    IndicatorSeries<Decimal> result (n);

    const Decimal zero (DecimalConstants<Decimal>::DecimalZero);
    const Decimal hundred (DecimalConstants<Decimal>::DecimalOneHundred);
    const Decimal divisor (static_cast<int>(period));

    std::vector<Decimal> gains (n, zero);
    std::vector<Decimal> losses (n, zero);

    Decimal gainSum (zero);
    Decimal lossSum (zero);

    for (unsigned long t = 1; t < n; ++t)
      {
	Decimal delta = series.getClose (t) - series.getClose (t - 1);
	if (delta > zero)
	  gains[t] = delta;
	else if (delta < zero)
	  losses[t] = -delta;

	gainSum += gains[t];
	lossSum += losses[t];

	if (t > period)
	  {
	    gainSum -= gains[t - period];
	    lossSum -= losses[t - period];
	  }

	if (t < period)
	  continue;

	Decimal avgGain = gainSum / divisor;
	Decimal avgLoss = lossSum / divisor;

	if (avgLoss == zero)
	  {
	    if (avgGain > zero)
	      result[t] = hundred;
	    continue;
	  }

	Decimal relativeStrength = avgGain / avgLoss;
	result[t] = hundred - (hundred / (DecimalConstants<Decimal>::DecimalOne + relativeStrength));
      }

    return result;
  }

  /**
   * @brief Returns true only when the slot is defined and strictly positive.
   * Comparisons against an undefined value evaluate as false.
   */
  template <class Decimal>
  bool isDefinedAndPositive (const boost::optional<Decimal>& value)
  {
    return value && (*value > DecimalConstants<Decimal>::DecimalZero);
  }
}

#endif
