#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "BacktestConfiguration.h"
#include "PriceDataLoader.h"
#include "DataSourceReader.h"
#include "TimeSeriesException.h"
#include "BackTester.h"
#include "ExposureSeries.h"
#include "reporting/BacktestReporter.h"
#include "reporting/EquityCurvePlotter.h"
#include "utils/OutputUtils.h"
#include "TestUtils.h"

using namespace regimebt;
using namespace regimebt::reporting;
using namespace regime_backtest;
using boost::gregorian::date;

TEST_CASE("PriceDataLoader restricts a data file to the half-open range", "[PriceDataLoader]") {
    std::string fileName = writeTemporaryFile("prices.csv",
                                              "Date,Close\n"
                                              "2023-12-29,99.0\n"
                                              "2024-01-02,100.0\n"
                                              "2024-01-03,101.0\n"
                                              "2024-01-04,102.0\n");

    BacktestConfiguration config(BacktestConfiguration::OptionMap{
        {"data-file", fileName}, {"start", "2024-01-01"}, {"end", "2024-01-04"}});

    PriceDataLoader loader(config);
    ClosePriceSeries<Num> series = loader.loadPriceSeries();

    REQUIRE(series.getNumEntries() == 2);
    REQUIRE(series.getFirstDate() == date(2024, 1, 2));
    REQUIRE(series.getLastDate() == date(2024, 1, 3));

    BacktestConfiguration outside(BacktestConfiguration::OptionMap{
        {"data-file", fileName}, {"start", "2025-01-01"}, {"end", "2025-02-01"}});
    PriceDataLoader emptyLoader(outside);
    REQUIRE_THROWS_AS(emptyLoader.loadPriceSeries(), TimeSeriesDataAvailabilityException);

    removeTemporaryFile(fileName);
}

TEST_CASE("Finnhub downloads need an API configuration file", "[PriceDataLoader]") {
    BacktestConfiguration config(BacktestConfiguration::OptionMap{{"data-source", "finnhub"}});
    PriceDataLoader loader(config);
    REQUIRE_THROWS_AS(loader.loadPriceSeries(), DataSourceReaderException);
}

TEST_CASE("BacktestReporter output", "[BacktestReporter]") {
    ClosePriceSeries<Num> series(createClosePriceSeries(std::vector<std::string>{"100", "98", "96", "94", "99", "101"},
                                                        date(2024, 1, 2)));
    ExposureSeries<Num> exposure =
        ExposureSeries<Num>::fromLaggedExposure(series, createDecimals({"0", "0", "0", "1.3", "1.3", "0"}));
    ExposureBackTester<Num> backTester;
    BacktestResult<Num> result = backTester.backtest(series, exposure);
    BacktestResult<Num> benchmark = ExposureBackTester<Num>::buyAndHold(series);

    std::ostringstream os;
    BacktestReporter::writeRunHeader(os, "Regime Switching", "SPY", series);
    BacktestReporter::writeSummaryTable(os, result, benchmark);
    BacktestReporter::writeExposureDiagnostics(os, exposure);
    BacktestReporter::writeSavedFiles(os, "out/a.csv", "out/a.svg");

    const std::string report = os.str();
    REQUIRE(report.find("Strategy: Regime Switching | Ticker: SPY") != std::string::npos);
    REQUIRE(report.find("Period: 2024-01-02 to 2024-01-09") != std::string::npos);
    REQUIRE(report.find("Buy & Hold") != std::string::npos);
    REQUIRE(report.find("Win Rate (active days)") != std::string::npos);
    REQUIRE(report.find("Fraction invested: 0.3333") != std::string::npos);
    REQUIRE(report.find("Saved CSV -> out/a.csv") != std::string::npos);
    REQUIRE(report.find("Saved plot -> out/a.svg") != std::string::npos);
}

TEST_CASE("EquityCurvePlotter writes a labelled SVG chart", "[EquityCurvePlotter]") {
    ClosePriceSeries<Num> series(createClosePriceSeries(std::vector<std::string>{"100", "110", "99", "121"}));
    BacktestResult<Num> benchmark = ExposureBackTester<Num>::buyAndHold(series);
    ExposureBackTester<Num> backTester;
    BacktestResult<Num> result =
        backTester.backtest(series, ExposureSeries<Num>::constant(series, createDecimal("0")));

    std::filesystem::path outputDir = std::filesystem::temp_directory_path() / "regimebt_plot_test";
    std::string plotFileName = utils::createOutputFileName(outputDir.string(), "SPY_<tag>", "_equity_curve.svg");
    REQUIRE(std::filesystem::exists(outputDir));

    EquityCurvePlotter plotter;
    plotter.writeSvgFile(plotFileName, result, benchmark, "SPY_<tag>");

    std::ifstream svgFile(plotFileName);
    std::stringstream contents;
    contents << svgFile.rdbuf();
    const std::string svg = contents.str();

    REQUIRE(svg.find("<svg") != std::string::npos);
    REQUIRE(svg.find("Equity Curve - SPY_&lt;tag&gt;") != std::string::npos);
    REQUIRE(svg.find(">Date<") != std::string::npos);
    REQUIRE(svg.find("Growth of $1") != std::string::npos);
    REQUIRE(svg.find("Buy &amp; Hold") != std::string::npos);
    REQUIRE(svg.find("<polyline") != std::string::npos);
    REQUIRE(svg.find("</svg>") != std::string::npos);

    std::filesystem::remove_all(outputDir);

    REQUIRE(EquityCurvePlotter::escapeXml("a&b<\"c\">") == "a&amp;b&lt;&quot;c&quot;&gt;");
    REQUIRE_THROWS_AS(EquityCurvePlotter(50, 50), std::invalid_argument);

    ClosePriceSeries<Num> other(createClosePriceSeries(std::vector<std::string>{"100", "110", "99", "121"},
                                                       date(2024, 3, 1)));
    REQUIRE_THROWS_AS(plotter.writeSvgFile(plotFileName, result, ExposureBackTester<Num>::buyAndHold(other), "x"),
                      std::runtime_error);
}
