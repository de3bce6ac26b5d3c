#pragma once

#include <streambuf>
#include <ostream>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace regimebt
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * This class allows writing to two different stream buffers simultaneously,
 * useful for logging to both console and file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    /**
     * @brief Construct a TeeBuf with two target stream buffers
     * @param sb1 First stream buffer to write to
     * @param sb2 Second stream buffer to write to
     */
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Name shared by all files of one run,
 * e.g. "SPY_mom50_d2_u1_cr8w_ch5_cd1_cu1_lev1.30_2005-01-01_to_2024-12-31".
 * @param tickerSymbol Upper case ticker
 * @param parameterTag Parameter summary of the strategy
 */
std::string createRunTag(const std::string& tickerSymbol,
                         const std::string& parameterTag,
                         const boost::gregorian::date& startDate,
                         const boost::gregorian::date& endDate);

/**
 * @brief Path of an output file inside outputDirectory, creating the
 * directory when needed.
 * @param suffix Appended to the run tag, e.g. "_backtest.csv"
 */
std::string createOutputFileName(const std::string& outputDirectory,
                                 const std::string& runTag,
                                 const std::string& suffix);

} // namespace utils
} // namespace regimebt
