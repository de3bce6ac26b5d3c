#include <catch2/catch_test_macros.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "CommandLineParser.h"
#include "BacktestConfiguration.h"
#include "BoostDateHelper.h"
#include "TestUtils.h"

using namespace regimebt;
using boost::gregorian::date;

namespace
{
    std::optional<BacktestConfiguration> parseArgs(const std::vector<std::string>& args)
    {
        std::vector<const char*> argv;
        argv.push_back("regimebt");
        for (const auto& arg : args)
            argv.push_back(arg.c_str());

        CommandLineParser parser;
        return parser.parseCommandLineArgs(static_cast<int>(argv.size()), argv.data());
    }
}

TEST_CASE("Defaults apply without arguments", "[CommandLineParser]") {
    std::optional<BacktestConfiguration> config = parseArgs({});
    REQUIRE(config);

    REQUIRE(config->getTicker() == "SPY");
    REQUIRE(config->getStartDate() == date(2005, 1, 1));
    REQUIRE(config->getEndDate() == date(2024, 12, 31));
    REQUIRE(config->getFeeBasisPoints() == createDecimal("2.0"));
    REQUIRE(config->getStrategyName() == "regime");
    REQUIRE(config->getLookback() == 50);
    REQUIRE(config->getDownDays() == 2);
    REQUIRE(config->getUpDays() == 1);
    REQUIRE(config->getCrashWeekDrop() == createDecimal("0.08"));
    REQUIRE(config->getCrashHoldDays() == 5);
    REQUIRE(config->getCrashDownDays() == 1);
    REQUIRE(config->getCrashUpDays() == 1);
    REQUIRE(config->getDownLeverage() == createDecimal("1.3"));
    REQUIRE_FALSE(config->isLeverageAllowedInCrash());
    REQUIRE(config->getFastPeriod() == 20);
    REQUIRE(config->getSlowPeriod() == 50);
    REQUIRE(config->getRsiPeriod() == 14);
    REQUIRE(config->getRsiBuyBelow() == createDecimal("30"));
    REQUIRE(config->getRsiSellAbove() == createDecimal("70"));
    REQUIRE_FALSE(config->hasDataFile());
    REQUIRE(config->getDataSource() == "yahoo");
    REQUIRE_FALSE(config->hasApiConfigFile());
    REQUIRE(config->getOutputDirectory() == "outputs");
    REQUIRE_FALSE(config->isDebug());

    regime_backtest::DateRange range = config->getDateRange();
    REQUIRE(range.getLastDate() == date(2024, 12, 30));
}

TEST_CASE("Command line values and flags", "[CommandLineParser]") {
    std::optional<BacktestConfiguration> config = parseArgs({
        "--ticker", "qqq", "--start", "20100104", "--end", "2020-06-30",
        "--fee-bps", "5", "--down-days", "3", "--crash-week-drop", "0.1",
        "--down-leverage", "1.5", "--allow-leverage-in-crash", "--debug",
        "--strategy", "SMA", "--fast", "10", "--slow", "40",
        "--data-file", "prices.csv", "--output-dir", "results"});
    REQUIRE(config);

    REQUIRE(config->getTicker() == "QQQ");
    REQUIRE(config->getStartDate() == date(2010, 1, 4));
    REQUIRE(config->getEndDate() == date(2020, 6, 30));
    REQUIRE(config->getFeeBasisPoints() == createDecimal("5"));
    REQUIRE(config->getDownDays() == 3);
    REQUIRE(config->getCrashWeekDrop() == createDecimal("0.1"));
    REQUIRE(config->getDownLeverage() == createDecimal("1.5"));
    REQUIRE(config->isLeverageAllowedInCrash());
    REQUIRE(config->isDebug());
    REQUIRE(config->getStrategyName() == "sma");
    REQUIRE(config->getFastPeriod() == 10);
    REQUIRE(config->getSlowPeriod() == 40);
    REQUIRE(config->hasDataFile());
    REQUIRE(config->getDataFile() == "prices.csv");
    REQUIRE(config->getOutputDirectory() == "results");
}

TEST_CASE("Help returns no configuration", "[CommandLineParser]") {
    REQUIRE_FALSE(parseArgs({"--help"}));
    REQUIRE_FALSE(parseArgs({"-h"}));
    REQUIRE_FALSE(parseArgs({"--ticker", "SPY", "--help"}));
}

TEST_CASE("Usage lists every option with its default", "[CommandLineParser]") {
    std::ostringstream os;
    CommandLineParser::displayUsage(os);
    const std::string usage = os.str();

    REQUIRE(usage.find("Usage: regimebt [options]") != std::string::npos);
    for (const auto& entry : BacktestConfiguration::getDefaultValues())
        REQUIRE(usage.find("--" + entry.first) != std::string::npos);
    REQUIRE(usage.find("--allow-leverage-in-crash") != std::string::npos);
    REQUIRE(usage.find("--config") != std::string::npos);
    REQUIRE(usage.find("(=SPY)") != std::string::npos);
    REQUIRE(usage.find("(=50)") != std::string::npos);
}

TEST_CASE("Largest whole number option value is accepted", "[CommandLineParser]") {
    std::optional<BacktestConfiguration> config = parseArgs({"--crash-hold-days", "4294967295"});
    REQUIRE(config);
    REQUIRE(config->getCrashHoldDays() == 4294967295u);
}

TEST_CASE("Invalid command lines are rejected", "[CommandLineParser]") {
    REQUIRE_THROWS_AS(parseArgs({"--no-such-option", "1"}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"SPY"}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"--ticker"}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"--lookback", "fifty"}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"--lookback", "-5"}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"--lookback=-5"}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"--lookback", "5000000000"}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"--down-days", "4294967296"}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"--fee-bps", "two"}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"--start", "01/02/2005"}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"--start", "2024-01-01", "--end", "2023-01-01"}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"--start", "2024-01-01", "--end", "2024-01-01"}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"--strategy", "martingale"}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"--ticker", " "}), BacktestConfigurationException);
    REQUIRE_THROWS_AS(parseArgs({"--config", "/nonexistent/regimebt.csv"}), BacktestConfigurationException);
}

TEST_CASE("Configuration file values are overridden by the command line", "[CommandLineParser]") {
    std::string fileName = writeTemporaryFile("regimebt.csv",
                                              "Parameter,Value\n"
                                              "# comment rows are skipped,\n"
                                              "ticker,IWM\n"
                                              "lookback,100\n"
                                              "--up-days,2\n"
                                              "Debug,true\n"
                                              "allow-leverage-in-crash,false\n");

    std::optional<BacktestConfiguration> config = parseArgs({"--config", fileName, "--lookback", "20"});
    REQUIRE(config);
    REQUIRE(config->getTicker() == "IWM");
    REQUIRE(config->getLookback() == 20);
    REQUIRE(config->getUpDays() == 2);
    REQUIRE(config->isDebug());
    REQUIRE_FALSE(config->isLeverageAllowedInCrash());

    BacktestConfiguration::OptionMap options = CommandLineParser::readConfigurationFile(fileName);
    REQUIRE(options.at("lookback") == "100");
    REQUIRE(options.count("# comment rows are skipped") == 0);

    removeTemporaryFile(fileName);
}

TEST_CASE("Unknown configuration file parameters are rejected", "[CommandLineParser]") {
    std::string fileName = writeTemporaryFile("regimebt.csv", "Parameter,Value\nleverage,2\n");
    REQUIRE_THROWS_AS(parseArgs({"--config", fileName}), BacktestConfigurationException);
    removeTemporaryFile(fileName);

    std::string negative = writeTemporaryFile("regimebt.csv", "Parameter,Value\nlookback,-5\n");
    REQUIRE_THROWS_AS(parseArgs({"--config", negative}), BacktestConfigurationException);
    removeTemporaryFile(negative);

    std::string tooLarge = writeTemporaryFile("regimebt.csv", "Parameter,Value\nup-days,5000000000\n");
    REQUIRE_THROWS_AS(parseArgs({"--config", tooLarge}), BacktestConfigurationException);
    removeTemporaryFile(tooLarge);

    std::string badHeader = writeTemporaryFile("regimebt.csv", "Name,Setting\nticker,SPY\n");
    REQUIRE_THROWS_AS(CommandLineParser::readConfigurationFile(badHeader), BacktestConfigurationException);
    removeTemporaryFile(badHeader);
}
