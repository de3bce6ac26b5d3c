#include <fstream>
#include <stdexcept>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include "TestUtils.h"
#include "DecimalConstants.h"

using namespace regime_backtest;
using namespace boost::gregorian;

DecimalType createDecimal (const std::string& valueString)
{
  return num::fromString<DecimalType> (valueString);
}

std::vector<DecimalType> createDecimals (const std::vector<std::string>& valueStrings)
{
  std::vector<DecimalType> values;
  values.reserve (valueStrings.size());

  for (const auto& valueString : valueStrings)
    values.push_back (createDecimal (valueString));

  return values;
}

SeriesType createClosePriceSeries (const std::vector<std::string>& closes,
				   const date& firstDate)
{
  SeriesType series;
  TimeSeriesDate currentDate (isWeekday (firstDate) ? firstDate : boost_next_weekday (firstDate));

  for (const auto& close : closes)
    {
      series.addEntry (currentDate, createDecimal (close));
      currentDate = boost_next_weekday (currentDate);
    }

  return series;
}

SeriesType createClosePriceSeries (const std::vector<double>& closes,
				   const date& firstDate)
{
  std::vector<std::string> closeStrings;
  closeStrings.reserve (closes.size());

  for (double close : closes)
    closeStrings.push_back ((boost::format ("%0.6f") % close).str());

  return createClosePriceSeries (closeStrings, firstDate);
}

std::string writeTemporaryFile (const std::string& baseName, const std::string& contents)
{
  boost::filesystem::path filePath = boost::filesystem::temp_directory_path() /
    boost::filesystem::unique_path ("%%%%-%%%%-" + baseName);

  std::ofstream file (filePath.string());
  if (!file.is_open())
    throw std::runtime_error ("writeTemporaryFile: cannot create " + filePath.string());

  file << contents;
  return filePath.string();
}

void removeTemporaryFile (const std::string& fileName)
{
  boost::system::error_code ec;
  boost::filesystem::remove (fileName, ec);
}
