#include "CommandLineParser.h"
#include <fstream>
#include <iostream>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"

namespace po = boost::program_options;

namespace regimebt
{

namespace
{
    std::string defaultText(const std::string& key)
    {
        return BacktestConfiguration::getDefaultValues().at(key);
    }

    long defaultCount(const std::string& key)
    {
        return boost::lexical_cast<long>(defaultText(key));
    }

    bool isFlagOption(const std::string& name)
    {
        return name == "allow-leverage-in-crash" || name == "debug";
    }

    bool isFalseText(const std::string& text)
    {
        std::string value = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));
        return value == "false" || value == "0" || value == "no";
    }
}

CommandLineParser::CommandLineParser()
    : mDescription(createOptionsDescription())
{
}

po::options_description CommandLineParser::createOptionsDescription()
{
    po::options_description data("Data");
    data.add_options()
        ("ticker", po::value<std::string>()->default_value(defaultText("ticker")), "Ticker symbol")
        ("start", po::value<std::string>()->default_value(defaultText("start")),
         "First date, inclusive (YYYY-MM-DD or YYYYMMDD)")
        ("end", po::value<std::string>()->default_value(defaultText("end")), "Last date, exclusive")
        ("data-file", po::value<std::string>(), "Read closes from a CSV file instead of downloading")
        ("data-source", po::value<std::string>()->default_value(defaultText("data-source")), "yahoo or finnhub")
        ("api-config", po::value<std::string>(), "CSV file with Source,Token columns for finnhub");

    // Decimal options stay text so they convert exactly to the fixed point type
    po::options_description strategy("Strategy");
    strategy.add_options()
        ("strategy", po::value<std::string>()->default_value(defaultText("strategy")),
         "regime, sma, rsi, streak or momentum-streak")
        ("lookback", po::value<long>()->default_value(defaultCount("lookback")), "Momentum lookback in days")
        ("down-days", po::value<long>()->default_value(defaultCount("down-days")),
         "Buy after this many down days in a row")
        ("up-days", po::value<long>()->default_value(defaultCount("up-days")),
         "Sell after this many up days in a row")
        ("crash-week-drop", po::value<std::string>()->default_value(defaultText("crash-week-drop")),
         "Crash mode when the 5 day return <= -X")
        ("crash-hold-days", po::value<long>()->default_value(defaultCount("crash-hold-days")),
         "Days crash mode stays active")
        ("crash-down-days", po::value<long>()->default_value(defaultCount("crash-down-days")),
         "Buy streak during crash mode")
        ("crash-up-days", po::value<long>()->default_value(defaultCount("crash-up-days")),
         "Sell streak during crash mode")
        ("down-leverage", po::value<std::string>()->default_value(defaultText("down-leverage")),
         "Exposure when momentum <= 0 and long")
        ("allow-leverage-in-crash", po::bool_switch(), "Also apply leverage during crash mode")
        ("fast", po::value<long>()->default_value(defaultCount("fast")), "Fast SMA period")
        ("slow", po::value<long>()->default_value(defaultCount("slow")), "Slow SMA period")
        ("rsi-period", po::value<long>()->default_value(defaultCount("rsi-period")), "RSI period")
        ("rsi-buy-below", po::value<std::string>()->default_value(defaultText("rsi-buy-below")),
         "RSI entry level")
        ("rsi-sell-above", po::value<std::string>()->default_value(defaultText("rsi-sell-above")),
         "RSI exit level");

    po::options_description output("Backtest and output");
    output.add_options()
        ("fee-bps", po::value<std::string>()->default_value(defaultText("fee-bps")),
         "Fee in basis points per unit of turnover")
        ("output-dir", po::value<std::string>()->default_value(defaultText("output-dir")),
         "Directory for CSV, plot and log")
        ("config", po::value<std::string>(), "Parameter,Value CSV file with any of the options above")
        ("debug", po::bool_switch(), "Print exposure diagnostics and stack traces")
        ("help,h", "Show this message");

    po::options_description desc("Options");
    desc.add(data).add(strategy).add(output);
    return desc;
}

std::optional<BacktestConfiguration> CommandLineParser::parseCommandLineArgs(int argc, const char* const* argv)
{
    po::variables_map vm;

    try {
        po::store(po::parse_command_line(argc, argv, mDescription), vm);

        if (vm.count("help")) {
            displayUsage(std::cout);
            return std::nullopt;
        }

        // Stored second, so values already given on the command line are kept
        if (vm.count("config")) {
            const std::string configFileName = vm["config"].as<std::string>();
            std::vector<std::string> fileArguments = toArguments(readConfigurationFile(configFileName));

            po::store(po::command_line_parser(fileArguments).options(mDescription).run(), vm);
        }

        po::notify(vm);
    }
    catch (const po::error& e) {
        displayUsage(std::cerr);
        throw BacktestConfigurationException(e.what());
    }

    return BacktestConfiguration(toOptionMap(vm));
}

BacktestConfiguration::OptionMap CommandLineParser::readConfigurationFile(const std::string& fileName)
{
    std::ifstream probe(fileName);
    if (!probe.is_open())
        throw BacktestConfigurationException("Cannot open configuration file: " + fileName);
    probe.close();

    BacktestConfiguration::OptionMap options;

    try {
        io::CSVReader<2, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '\"'>> csvConfigFile(fileName);
        csvConfigFile.read_header(io::ignore_extra_column, "Parameter", "Value");

        std::string parameter, value;
        while (csvConfigFile.read_row(parameter, value)) {
            if (parameter.empty() || boost::algorithm::starts_with(parameter, "#"))
                continue;

            options[normalizeOptionName(parameter)] = value;
        }
    }
    catch (const io::error::base& e) {
        throw BacktestConfigurationException("Error reading configuration file " + fileName + ": " + e.what());
    }

    return options;
}

void CommandLineParser::displayUsage(std::ostream& os)
{
    os << "Usage: regimebt [options]\n\n"
       << createOptionsDescription() << std::endl;
}

std::string CommandLineParser::normalizeOptionName(const std::string& name)
{
    std::string normalized = boost::algorithm::trim_copy(name);
    while (boost::algorithm::starts_with(normalized, "-"))
        normalized.erase(0, 1);

    return boost::algorithm::to_lower_copy(normalized);
}

std::vector<std::string> CommandLineParser::toArguments(const BacktestConfiguration::OptionMap& options)
{
    std::vector<std::string> arguments;

    for (const auto& entry : options) {
        // A flag set to a false value in the file means the flag is off
        if (isFlagOption(entry.first)) {
            if (!isFalseText(entry.second))
                arguments.push_back("--" + entry.first);
            continue;
        }

        arguments.push_back("--" + entry.first + "=" + entry.second);
    }

    return arguments;
}

BacktestConfiguration::OptionMap CommandLineParser::toOptionMap(const po::variables_map& vm)
{
    BacktestConfiguration::OptionMap options;

    for (const auto& entry : vm) {
        const std::string& name = entry.first;
        const po::variable_value& value = entry.second;

        if (name == "help" || name == "config" || value.empty())
            continue;

        if (const auto* text = boost::any_cast<std::string>(&value.value()))
            options[name] = *text;
        else if (const auto* count = boost::any_cast<long>(&value.value()))
            options[name] = std::to_string(*count);
        else if (const auto* flag = boost::any_cast<bool>(&value.value())) {
            if (*flag)
                options[name] = "true";
        }
    }

    return options;
}

} // namespace regimebt
