#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "BacktestConfiguration.h"

namespace regimebt
{

/**
 * @brief Turns command line arguments into a BacktestConfiguration.
 *
 * Options are declared with Boost.ProgramOptions. --config names a two column
 * CSV file (header Parameter,Value) whose entries use the same option names
 * without dashes; options given on the command line override the file.
 */
class CommandLineParser
{
public:
    CommandLineParser();
    ~CommandLineParser() = default;

    /**
     * @brief Parse the arguments. Returns an empty optional after printing
     * usage when --help is given.
     *
     * @throws BacktestConfigurationException on unknown options, missing
     *         values or an unreadable configuration file.
     */
    std::optional<BacktestConfiguration> parseCommandLineArgs(int argc, const char* const* argv);

    /**
     * @brief Read option values from a Parameter,Value CSV file.
     */
    static BacktestConfiguration::OptionMap readConfigurationFile(const std::string& fileName);

    static void displayUsage(std::ostream& os);

private:
    static boost::program_options::options_description createOptionsDescription();
    static std::string normalizeOptionName(const std::string& name);
    static std::vector<std::string> toArguments(const BacktestConfiguration::OptionMap& options);
    static BacktestConfiguration::OptionMap toOptionMap(const boost::program_options::variables_map& vm);

private:
    boost::program_options::options_description mDescription;
};

} // namespace regimebt
