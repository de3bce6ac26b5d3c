#include <string>
#include <iostream>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <cpptrace/from_current.hpp>
#include "number.h"
#include "BackTester.h"
#include "BacktestCsvWriter.h"
#include "ExposureSeries.h"
#include "PositionStrategy.h"
#include "TimeSeries.h"
#include "BacktestConfiguration.h"
#include "CommandLineParser.h"
#include "PriceDataLoader.h"
#include "StrategyFactory.h"
#include "reporting/BacktestReporter.h"
#include "reporting/EquityCurvePlotter.h"
#include "utils/OutputUtils.h"

using namespace regime_backtest;
using namespace regimebt;
using namespace regimebt::reporting;
using namespace regimebt::utils;

namespace
{

void runBacktest(const BacktestConfiguration& config)
{
    std::shared_ptr<PositionStrategy<Num>> strategy = StrategyFactory::createStrategy(config);

    const std::string runTag = createRunTag(config.getTicker(), strategy->getParameterTag(),
                                            config.getStartDate(), config.getEndDate());
    const std::string outputDir = config.getOutputDirectory();
    const std::string logFileName = createOutputFileName(outputDir, runTag, "_run.log");
    const std::string csvFileName = createOutputFileName(outputDir, runTag, "_backtest.csv");
    const std::string plotFileName = createOutputFileName(outputDir, runTag, "_equity_curve.svg");

    std::ofstream logFile(logFileName);
    if (!logFile.is_open())
        throw std::runtime_error("Cannot open log file " + logFileName);
    TeeStream runLog(std::cout, logFile);

    PriceDataLoader loader(config);
    ClosePriceSeries<Num> closeSeries = loader.loadPriceSeries();

    BacktestReporter::writeRunHeader(runLog, strategy->getStrategyName(), config.getTicker(), closeSeries);

    ExposureSeries<Num> exposure = strategy->computeExposure(closeSeries);
    if (config.isDebug())
        BacktestReporter::writeExposureDiagnostics(runLog, exposure);

    ExposureBackTester<Num> backTester(config.getFeeBasisPoints());
    BacktestResult<Num> result = backTester.backtest(closeSeries, exposure);
    BacktestResult<Num> benchmark = ExposureBackTester<Num>::buyAndHold(closeSeries);

    BacktestReporter::writeSummaryTable(runLog, result, benchmark);

    BacktestCsvWriter<Num> csvWriter(csvFileName, closeSeries, result);
    csvWriter.writeFile();

    EquityCurvePlotter plotter;
    plotter.writeSvgFile(plotFileName, result, benchmark, runTag);

    BacktestReporter::writeSavedFiles(runLog, csvFileName, plotFileName);
    runLog.flush();
}

}

int main(int argc, char **argv)
{
    bool debug = false;

    CPPTRACE_TRY
    {
        CommandLineParser parser;
        std::optional<BacktestConfiguration> config = parser.parseCommandLineArgs(argc, argv);
        if (!config)
            return 0;

        debug = config->isDebug();
        runBacktest(*config);
    }
    CPPTRACE_CATCH(const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        if (debug)
            cpptrace::from_current_exception().print();
        return 1;
    }

    return 0;
}
