#pragma once

#include <ostream>
#include <string>
#include "number.h"
#include "BackTester.h"
#include "ExposureSeries.h"
#include "TimeSeries.h"

namespace regimebt
{
namespace reporting
{

using Num = num::DefaultNumber;

/**
 * @brief Console report of one backtest run.
 *
 * All output goes to the stream passed in, which in the application is the
 * tee that also feeds the run log.
 */
class BacktestReporter
{
public:
    /**
     * @brief Print the strategy, ticker and covered period.
     * @param os Output stream
     * @param strategyName Display name of the strategy
     * @param ticker Ticker symbol
     * @param series Close series the run used
     */
    static void writeRunHeader(std::ostream& os,
                               const std::string& strategyName,
                               const std::string& ticker,
                               const regime_backtest::ClosePriceSeries<Num>& series);

    /**
     * @brief Print the metrics table with the strategy and the buy & hold
     * benchmark side by side.
     */
    static void writeSummaryTable(std::ostream& os,
                                  const regime_backtest::BacktestResult<Num>& strategy,
                                  const regime_backtest::BacktestResult<Num>& buyAndHold);

    // Exposure value counts, average, fraction invested and maximum
    static void writeExposureDiagnostics(std::ostream& os,
                                         const regime_backtest::ExposureSeries<Num>& exposure);

    static void writeSavedFiles(std::ostream& os,
                                const std::string& csvFileName,
                                const std::string& plotFileName);
};

} // namespace reporting
} // namespace regimebt
