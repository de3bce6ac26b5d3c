#ifndef __ANNUALIZER_H
#define __ANNUALIZER_H

#include <stdexcept>
#include "TimeFrame.h"

namespace regime_backtest
{
  /**
   * @brief Number of bars per year for a bar time frame.
   *
   * @param timeFrame The time frame of the data (e.g., DAILY, WEEKLY).
   * @param trading_days_per_year Number of trading days per year (default 252).
   */
  inline double computeAnnualizationFactor(TimeFrame::Duration timeFrame,
                                           double trading_days_per_year = 252.0)
  {
    switch (timeFrame)
      {
      case TimeFrame::DAILY:
        if (!(trading_days_per_year > 0.0))
          throw std::invalid_argument("computeAnnualizationFactor: trading days per year must be positive.");
        return trading_days_per_year;

      case TimeFrame::WEEKLY:
        return 52.0;

      case TimeFrame::MONTHLY:
        return 12.0;

      case TimeFrame::QUARTERLY:
        return 4.0;

      case TimeFrame::YEARLY:
        return 1.0;

      default:
        throw std::invalid_argument("Unsupported time frame for annualization.");
      }
  }

  /**
   * @brief Convenience helper: annualization factor of a series' time frame.
   */
  template <class SeriesT>
  inline double computeAnnualizationFactor(const SeriesT& series)
  {
    return computeAnnualizationFactor(series.getTimeFrame());
  }
}

#endif
