#include "OutputUtils.h"
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <boost/format.hpp>

namespace regimebt
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string createRunTag(const std::string& tickerSymbol,
                         const std::string& parameterTag,
                         const boost::gregorian::date& startDate,
                         const boost::gregorian::date& endDate)
{
    return (boost::format("%1%_%2%_%3%_to_%4%")
            % tickerSymbol
            % parameterTag
            % boost::gregorian::to_iso_extended_string(startDate)
            % boost::gregorian::to_iso_extended_string(endDate)).str();
}

std::string createOutputFileName(const std::string& outputDirectory,
                                 const std::string& runTag,
                                 const std::string& suffix)
{
    std::error_code ec;
    std::filesystem::create_directories(outputDirectory, ec);
    if (ec)
        throw std::runtime_error("Cannot create output directory " + outputDirectory + ": " + ec.message());

    return (std::filesystem::path(outputDirectory) / (runTag + suffix)).string();
}

} // namespace utils
} // namespace regimebt
