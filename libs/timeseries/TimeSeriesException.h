// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TIMESERIES_EXCEPTION_H
#define __TIMESERIES_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace regime_backtest
{
  class TimeSeriesException : public std::runtime_error
  {
  public:
    TimeSeriesException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~TimeSeriesException() = default;
  };

  class TimeSeriesDataAccessException : public TimeSeriesException
  {
  public:
      explicit TimeSeriesDataAccessException(const std::string& msg)
        : TimeSeriesException(msg) {}
  };

  class TimeSeriesDataNotFoundException : public TimeSeriesDataAccessException
  {
  public:
      explicit TimeSeriesDataNotFoundException(const std::string& msg)
        : TimeSeriesDataAccessException(msg) {}
  };

  class TimeSeriesOffsetOutOfRangeException : public TimeSeriesDataAccessException
  {
  public:
      explicit TimeSeriesOffsetOutOfRangeException(const std::string& msg)
        : TimeSeriesDataAccessException(msg) {}
  };

  // Raised when a data provider returns no rows or rows that cannot be
  // interpreted as a daily close series.
  class TimeSeriesDataAvailabilityException : public TimeSeriesException
  {
  public:
      explicit TimeSeriesDataAvailabilityException(const std::string& msg)
        : TimeSeriesException(msg) {}
  };

} // namespace regime_backtest

#endif // __TIMESERIES_EXCEPTION_H
