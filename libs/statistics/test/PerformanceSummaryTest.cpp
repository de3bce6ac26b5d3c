#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <sstream>
#include <utility>
#include <vector>
#include "PerformanceSummary.h"
#include "BackTester.h"
#include "TestUtils.h"

using namespace regime_backtest;
using Catch::Approx;

TEST_CASE("PerformanceSummary trades count whole units of turnover", "[PerformanceSummary]")
{
    // turnover 1 + 0 + 1 + 1.3 = 3.3
    REQUIRE(PerformanceSummary::computeTrades(createDecimals({"0", "1", "1", "0", "1.3"})) == 3);
    REQUIRE(PerformanceSummary::computeTrades(createDecimals({"0", "1", "0"})) == 2);
    REQUIRE(PerformanceSummary::computeTrades(createDecimals({"1", "1", "1"})) == 0);
    REQUIRE(PerformanceSummary::computeTrades(std::vector<DecimalType>()) == 0);
}

TEST_CASE("PerformanceSummary win rate uses active days only", "[PerformanceSummary]")
{
    std::vector<DecimalType> positions(createDecimals({"0", "1", "1", "0", "1.3"}));
    std::vector<DecimalType> returns(createDecimals({"0", "0.01", "-0.02", "0.05", "0"}));

    // active days 1, 2 and 4; only day 1 wins
    REQUIRE(PerformanceSummary::computeWinRate(positions, returns) == Approx(1.0 / 3.0));

    std::vector<DecimalType> flat(createDecimals({"0", "0"}));
    REQUIRE(std::isnan(PerformanceSummary::computeWinRate(flat, createDecimals({"0", "0.01"}))));
}

TEST_CASE("PerformanceSummary from a backtest", "[PerformanceSummary]")
{
    SeriesType series(createClosePriceSeries(std::vector<std::string>{"100", "110", "99", "121"},
                                             boost::gregorian::date(2024, 1, 2)));
    BacktestResult<DecimalType> benchmark = ExposureBackTester<DecimalType>::buyAndHold(series);

    PerformanceSummary summary = PerformanceSummary::fromBacktest(benchmark);

    // 2024-01-02 to 2024-01-05 is three calendar days
    const double expectedCagr = std::pow(1.21, PerformanceSummary::DaysPerYear / 3.0) - 1.0;
    REQUIRE(summary.getCagr() == Approx(expectedCagr));

    std::vector<DecimalType> returns(benchmark.getReturns());
    const double sd = StatUtils<DecimalType>::computeSampleStdDev(returns);
    REQUIRE(summary.getAnnualizedVolatility() == Approx(sd * std::sqrt(252.0)));
    REQUIRE(summary.getSharpe() == Approx(StatUtils<DecimalType>::computeSharpeRatio(returns, 0.0, 252.0)));
    REQUIRE(summary.getMaxDrawdown() == Approx(-0.1));
    REQUIRE(summary.getTrades() == 0);
    REQUIRE(summary.getWinRate() == Approx(0.5));
}

TEST_CASE("PerformanceSummary of a single bar is undefined", "[PerformanceSummary]")
{
    SeriesType series(createClosePriceSeries(std::vector<std::string>{"100"}));
    PerformanceSummary summary =
        PerformanceSummary::fromBacktest(ExposureBackTester<DecimalType>::buyAndHold(series));

    REQUIRE(std::isnan(summary.getCagr()));
    REQUIRE(std::isnan(summary.getAnnualizedVolatility()));
    REQUIRE(std::isnan(summary.getSharpe()));
    REQUIRE(summary.getMaxDrawdown() == Approx(0.0));
}

TEST_CASE("PerformanceSummary table layout", "[PerformanceSummary]")
{
    REQUIRE(PerformanceSummary::formatValue(0.123456) == "0.1235");
    REQUIRE(PerformanceSummary::formatValue(std::nan("")) == "nan");

    std::vector<std::pair<std::string, PerformanceSummary>> columns;
    columns.emplace_back("Strategy", PerformanceSummary(0.1, 0.2, 0.5, -0.3, 12, std::nan("")));
    columns.emplace_back("Buy & Hold", PerformanceSummary(0.08, 0.18, 0.44, -0.55, 0, 0.54));

    std::ostringstream os;
    PerformanceSummary::writeTable(os, columns);

    std::vector<std::string> lines;
    std::istringstream is(os.str());
    std::string line;
    while (std::getline(is, line))
        lines.push_back(line);

    REQUIRE(lines.size() == 7);
    REQUIRE(lines[0].find("Strategy") != std::string::npos);
    REQUIRE(lines[0].find("Buy & Hold") != std::string::npos);
    REQUIRE(lines[1].rfind("CAGR", 0) == 0);
    REQUIRE(lines[1].find("0.1000") != std::string::npos);
    REQUIRE(lines[2].rfind("Vol (ann.)", 0) == 0);
    REQUIRE(lines[3].rfind("Sharpe", 0) == 0);
    REQUIRE(lines[4].rfind("Max Drawdown", 0) == 0);
    REQUIRE(lines[4].find("-0.5500") != std::string::npos);
    REQUIRE(lines[5].rfind("Trades", 0) == 0);
    REQUIRE(lines[5].find("12") != std::string::npos);
    REQUIRE(lines[6].rfind("Win Rate (active days)", 0) == 0);
    REQUIRE(lines[6].find("nan") != std::string::npos);
}
