#pragma once

#include <string>
#include "BacktestConfiguration.h"
#include "TimeSeries.h"

namespace regimebt
{

/**
 * @brief Produces the daily close series a run works on.
 *
 * Reads --data-file when given, otherwise downloads from --data-source
 * through a temporary CSV file. The result is restricted to [start, end).
 */
class PriceDataLoader
{
public:
    explicit PriceDataLoader(const BacktestConfiguration& config);

    /**
     * @throws regime_backtest::TimeSeriesDataAvailabilityException if no
     *         closes fall inside the requested range.
     */
    regime_backtest::ClosePriceSeries<Num> loadPriceSeries() const;

    static regime_backtest::ClosePriceSeries<Num> readCsvFile(const std::string& fileName);

private:
    regime_backtest::ClosePriceSeries<Num> loadFromDataSource() const;

private:
    const BacktestConfiguration& mConfig;
};

} // namespace regimebt
