// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __CSVREADER_H
#define __CSVREADER_H 1

#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/date_time.hpp>
#include "TimeSeries.h"
#include "TimeSeriesException.h"
#include "DecimalConstants.h"
#include "number.h"
#include "csv.h"

namespace regime_backtest
{
  template <class Decimal>
  class TimeSeriesCsvReader
  {
  public:
    TimeSeriesCsvReader (const std::string& fileName, TimeFrame::Duration timeFrame = TimeFrame::DAILY)
      : mFileName (fileName),
	mTimeSeries(std::make_shared<ClosePriceSeries<Decimal>> (timeFrame))
    {
      // ensure file exists (all readers inherit this check)
      std::ifstream fin(mFileName);
      if (!fin.is_open())
	throw TimeSeriesDataAccessException("Cannot open file: " + mFileName);
    }

    TimeSeriesCsvReader(const TimeSeriesCsvReader& rhs) = default;
    TimeSeriesCsvReader& operator=(const TimeSeriesCsvReader &rhs) = default;

    virtual ~TimeSeriesCsvReader()
    {}

    const std::string& getFileName() const
    {
      return mFileName;
    }

    TimeFrame::Duration getTimeFrame() const
    {
      return mTimeSeries->getTimeFrame();
    }

    std::shared_ptr<ClosePriceSeries<Decimal>> getTimeSeries()
    {
      return mTimeSeries;
    }

    virtual void readFile() = 0;

  protected:
    void addEntry (const ClosePriceEntry<Decimal>& entry)
    {
      mTimeSeries->addEntry(entry);
    }

  private:
    std::string mFileName;
    std::shared_ptr<ClosePriceSeries<Decimal>> mTimeSeries;
  };

  /**
   * @class ClosePriceCsvReader
   * @brief Reads a daily close series from any CSV file with a header row.
   *
   * Header names are matched ignoring case and surrounding whitespace. The
   * date column is "Date" (or "Datetime"); the close column is "Adj Close"
   * when the file has one, otherwise "Close". Other columns are ignored.
   *
   * Rows whose close is empty, "null" or "nan" are skipped with a warning.
   * Duplicate dates are an error. Rows may appear in any order; the series
   * is built in ascending date order.
   */
  template <class Decimal>
  class ClosePriceCsvReader : public TimeSeriesCsvReader<Decimal>
  {
  public:
    ClosePriceCsvReader (const std::string& fileName, TimeFrame::Duration timeFrame = TimeFrame::DAILY)
      : TimeSeriesCsvReader<Decimal> (fileName, timeFrame),
	mDateColumnName(),
	mCloseColumnName(),
	mNumSkippedRows(0)
    {}

    ClosePriceCsvReader(const ClosePriceCsvReader& rhs) = default;
    ClosePriceCsvReader& operator=(const ClosePriceCsvReader &rhs) = default;

    ~ClosePriceCsvReader()
    {}

    void readFile()
    {
      locateColumns();

      io::CSVReader<2, io::trim_chars<' ', '\t', '\r'>, io::double_quote_escape<',','\"'>>
	csvFile (this->getFileName());

      csvFile.read_header(io::ignore_extra_column, mDateColumnName, mCloseColumnName);

      std::map<TimeSeriesDate, Decimal> closesByDate;
      std::string dateStamp;
      std::string closeString;

      while (csvFile.read_row(dateStamp, closeString))
	{
	  if (isMissingValue (closeString))
	    {
	      ++mNumSkippedRows;
	      std::cout << "ClosePriceCsvReader: skipping row dated " << dateStamp
			<< " with missing close in " << this->getFileName() << std::endl;
	      continue;
	    }

	  TimeSeriesDate entryDate;
	  try
	    {
	      entryDate = parseDateString (dateStamp);
	    }
	  catch (const std::invalid_argument& e)
	    {
	      throw TimeSeriesDataAvailabilityException ("ClosePriceCsvReader: " + std::string(e.what()) +
							 " in file " + this->getFileName());
	    }

	  Decimal closePrice = num::fromString<Decimal>(closeString);

	  auto inserted = closesByDate.insert (std::make_pair (entryDate, closePrice));
	  if (!inserted.second)
	    throw TimeSeriesException ("ClosePriceCsvReader: duplicate date " + toIsoDateString (entryDate) +
				       " in file " + this->getFileName());
	}

      if (closesByDate.empty())
	throw TimeSeriesDataAvailabilityException ("ClosePriceCsvReader: no usable rows in file " +
						   this->getFileName());

      for (const auto& dateAndClose : closesByDate)
	this->addEntry (ClosePriceEntry<Decimal> (dateAndClose.first, dateAndClose.second));
    }

    const std::string& getCloseColumnName() const
    {
      return mCloseColumnName;
    }

    unsigned long getNumSkippedRows() const
    {
      return mNumSkippedRows;
    }

  private:
    static std::string normalizeHeaderName (const std::string& name)
    {
      std::string cleaned = boost::algorithm::trim_copy (name);
      boost::algorithm::trim_if (cleaned, boost::algorithm::is_any_of ("\""));
      boost::algorithm::trim (cleaned);
      return cleaned;
    }

    static bool isMissingValue (const std::string& value)
    {
      std::string trimmed = boost::algorithm::trim_copy (value);
      return trimmed.empty() ||
	boost::algorithm::iequals (trimmed, "null") ||
	boost::algorithm::iequals (trimmed, "nan");
    }

    // Picks the spelling of the date and close columns exactly as they
    // appear in the header so that io::CSVReader can match them.
    void locateColumns()
    {
      std::ifstream headerStream (this->getFileName());
      std::string headerLine;

      if (!std::getline (headerStream, headerLine))
	throw TimeSeriesDataAvailabilityException ("ClosePriceCsvReader: file " + this->getFileName() +
						   " is empty");

      std::vector<std::string> columns;
      boost::algorithm::split (columns, headerLine, boost::algorithm::is_any_of (","));

      std::string dateColumn, closeColumn, adjCloseColumn;
      for (const auto& rawName : columns)
	{
	  std::string name = normalizeHeaderName (rawName);

	  if (dateColumn.empty() &&
	      (boost::algorithm::iequals (name, "Date") || boost::algorithm::iequals (name, "Datetime")))
	    dateColumn = name;
	  else if (boost::algorithm::iequals (name, "Adj Close"))
	    adjCloseColumn = name;
	  else if (boost::algorithm::iequals (name, "Close"))
	    closeColumn = name;
	}

      if (dateColumn.empty())
	throw TimeSeriesDataAvailabilityException ("ClosePriceCsvReader: no Date column in file " +
						   this->getFileName());

      if (adjCloseColumn.empty() && closeColumn.empty())
	throw TimeSeriesDataAvailabilityException ("ClosePriceCsvReader: no Close or Adj Close column in file " +
						   this->getFileName());

      mDateColumnName = dateColumn;
      mCloseColumnName = adjCloseColumn.empty() ? closeColumn : adjCloseColumn;
    }

  private:
    std::string mDateColumnName;
    std::string mCloseColumnName;
    unsigned long mNumSkippedRows;
  };
}

#endif
