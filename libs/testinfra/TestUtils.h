#ifndef __REGIME_TEST_UTILS_H
#define __REGIME_TEST_UTILS_H 1

#include <string>
#include <vector>

#include <boost/date_time.hpp>
#include "number.h"
#include "BoostDateHelper.h"
#include "TimeSeries.h"

typedef dec::decimal<7> DecimalType;
typedef regime_backtest::ClosePriceSeries<DecimalType> SeriesType;

DecimalType createDecimal (const std::string& valueString);

std::vector<DecimalType> createDecimals (const std::vector<std::string>& valueStrings);

// Close series on consecutive weekdays starting at firstDate
SeriesType createClosePriceSeries (const std::vector<std::string>& closes,
				   const boost::gregorian::date& firstDate = boost::gregorian::date (2024, 1, 2));

SeriesType createClosePriceSeries (const std::vector<double>& closes,
				   const boost::gregorian::date& firstDate = boost::gregorian::date (2024, 1, 2));

// Writes contents to a fresh file in the system temp directory and returns its path
std::string writeTemporaryFile (const std::string& baseName, const std::string& contents);

void removeTemporaryFile (const std::string& fileName);

#endif
