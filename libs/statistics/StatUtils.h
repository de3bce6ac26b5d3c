#pragma once
#include <vector>
#include <cmath>
#include <limits>
#include <algorithm>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include "DecimalConstants.h"
#include "number.h"

namespace regime_backtest
{
  using boost::accumulators::accumulator_set;
  using boost::accumulators::stats;
  namespace tag = boost::accumulators::tag;

  /**
   * @class StatUtils
   * @brief Static helpers for summary statistics of return and equity
   *        series. Inputs are Decimal; results are double.
   * @tparam Decimal The numeric type of the series.
   */
  template<class Decimal>
  struct StatUtils
  {
  public:
    static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

    static inline std::vector<double> toDoubles(const std::vector<Decimal>& data)
    {
      std::vector<double> out;
      out.reserve(data.size());
      for (const auto& value : data)
	out.push_back(num::to_double(value));

      return out;
    }

    /**
     * @brief Arithmetic mean. NaN for an empty series.
     */
    static double computeMean(const std::vector<Decimal>& data)
    {
      if (data.empty())
	return NaN;

      accumulator_set<double, stats<tag::mean>> meanStats;
      for (const auto& value : data)
	meanStats(num::to_double(value));

      return boost::accumulators::mean(meanStats);
    }

    /**
     * @brief Unbiased sample variance (divides by n - 1). NaN when fewer
     * than two observations are available.
     */
    static double computeSampleVariance(const std::vector<Decimal>& data)
    {
      const std::size_t n = data.size();
      if (n < 2)
	return NaN;

      accumulator_set<double, stats<tag::variance>> varianceStats;
      for (const auto& value : data)
	varianceStats(num::to_double(value));

      // Boost.Accumulators reports the population variance
      const double populationVariance = boost::accumulators::variance(varianceStats);
      return populationVariance * static_cast<double>(n) / static_cast<double>(n - 1);
    }

    static double computeSampleStdDev(const std::vector<Decimal>& data)
    {
      const double variance = computeSampleVariance(data);
      if (std::isnan(variance))
	return NaN;

      return std::sqrt(std::max(variance, 0.0));
    }

    /**
     * @brief Annualized Sharpe ratio of per bar returns.
     *
     *   excess[t] = returns[t] - riskFreeAnnual / periodsPerYear
     *   sharpe    = sqrt(periodsPerYear) * mean(excess) / stddev(excess)
     *
     * NaN when the standard deviation is zero or undefined.
     */
    static double computeSharpeRatio(const std::vector<Decimal>& returns,
				     double riskFreeAnnual,
				     double periodsPerYear)
    {
      if (returns.size() < 2)
	return NaN;

      const double riskFreePerPeriod = riskFreeAnnual / periodsPerYear;

      accumulator_set<double, stats<tag::mean, tag::variance>> excessStats;
      for (const auto& value : returns)
	excessStats(num::to_double(value) - riskFreePerPeriod);

      const double n = static_cast<double>(returns.size());
      const double sampleVariance = boost::accumulators::variance(excessStats) * n / (n - 1.0);
      if (std::isnan(sampleVariance) || sampleVariance <= 0.0)
	return NaN;

      return std::sqrt(periodsPerYear) * boost::accumulators::mean(excessStats) / std::sqrt(sampleVariance);
    }

    /**
     * @brief Most negative value of equity / running peak - 1. Zero for a
     * series that never falls below its peak; NaN for an empty series.
     */
    static double computeMaxDrawdown(const std::vector<Decimal>& equity)
    {
      if (equity.empty())
	return NaN;

      double peak = num::to_double(equity.front());
      double maxDrawdown = 0.0;

      for (const auto& value : equity)
	{
	  const double current = num::to_double(value);
	  peak = std::max(peak, current);

	  const double drawdown = (current / peak) - 1.0;
	  maxDrawdown = std::min(maxDrawdown, drawdown);
	}

      return maxDrawdown;
    }
  };
}
