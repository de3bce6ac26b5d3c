#include "BacktestReporter.h"
#include <utility>
#include <vector>
#include <boost/format.hpp>
#include "BoostDateHelper.h"
#include "PerformanceSummary.h"

using namespace regime_backtest;

namespace regimebt
{
namespace reporting
{

void BacktestReporter::writeRunHeader(std::ostream& os,
                                      const std::string& strategyName,
                                      const std::string& ticker,
                                      const ClosePriceSeries<Num>& series)
{
    os << "Strategy: " << strategyName << " | Ticker: " << ticker << std::endl;
    os << "Period: " << toIsoDateString(series.getFirstDate()) << " to "
       << toIsoDateString(series.getLastDate())
       << " (" << series.getNumEntries() << " bars)" << std::endl;
}

void BacktestReporter::writeSummaryTable(std::ostream& os,
                                         const BacktestResult<Num>& strategy,
                                         const BacktestResult<Num>& buyAndHold)
{
    std::vector<std::pair<std::string, PerformanceSummary>> columns;
    columns.emplace_back("Strategy", PerformanceSummary::fromBacktest(strategy));
    columns.emplace_back("Buy & Hold", PerformanceSummary::fromBacktest(buyAndHold));

    os << std::endl;
    PerformanceSummary::writeTable(os, columns);
    os << std::endl;
}

void BacktestReporter::writeExposureDiagnostics(std::ostream& os,
                                                const ExposureSeries<Num>& exposure)
{
    os << "Exposure value counts:" << std::endl;
    for (const auto& entry : exposure.getValueCounts())
        os << "  " << num::toString(entry.first) << ": " << entry.second << std::endl;

    os << "Average exposure: " << num::toString(exposure.getAverageExposure()) << std::endl;
    os << "Fraction invested: " << (boost::format("%0.4f") % exposure.getFractionInvested()) << std::endl;
    os << "Max exposure: " << num::toString(exposure.getMaxExposure()) << std::endl;
}

void BacktestReporter::writeSavedFiles(std::ostream& os,
                                       const std::string& csvFileName,
                                       const std::string& plotFileName)
{
    os << "Saved CSV -> " << csvFileName << std::endl;
    os << "Saved plot -> " << plotFileName << std::endl;
}

} // namespace reporting
} // namespace regimebt
