// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __BACKTEST_CSVWRITER_H
#define __BACKTEST_CSVWRITER_H 1

#include <fstream>
#include <string>
#include "TimeSeries.h"
#include "BackTester.h"
#include "BoostDateHelper.h"
#include "number.h"

namespace regime_backtest
{
  /**
   * @brief Writes one row per bar of a simulation:
   * Date,close,exposure,strategy_return,equity
   *
   * Dates are written in ISO format.
   */
  template <class Decimal>
  class BacktestCsvWriter
  {
  public:
    /**
     * @throws BackTesterException if the close series and the result are not
     *         aligned, or the file cannot be created.
     */
    BacktestCsvWriter(const std::string& fileName,
		      const ClosePriceSeries<Decimal>& close,
		      const BacktestResult<Decimal>& result)
      : mFileName(fileName),
	mCsvFile(fileName),
	mClose(close),
	mResult(result)
    {
      if (!mCsvFile.is_open())
	throw BackTesterException ("BacktestCsvWriter: unable to open " + fileName + " for writing");

      if (close.getNumEntries() != result.getNumEntries())
	throw BackTesterException ("BacktestCsvWriter: close series and backtest result have different lengths");
    }

    BacktestCsvWriter(const BacktestCsvWriter& rhs) = delete;
    BacktestCsvWriter& operator=(const BacktestCsvWriter& rhs) = delete;

    ~BacktestCsvWriter() = default;

    void writeFile()
    {
      mCsvFile << "Date,close,exposure,strategy_return,equity" << std::endl;

      const auto& positions = mResult.getPositions();
      const auto& returns = mResult.getReturns();
      const auto& equity = mResult.getEquity();

      for (std::size_t t = 0; t < mResult.getNumEntries(); ++t)
	{
	  mCsvFile << toIsoDateString (mClose.getDate (t)) << ","
		   << num::toString (mClose.getClose (t)) << ","
		   << num::toString (positions[t]) << ","
		   << num::toString (returns[t]) << ","
		   << num::toString (equity[t]) << "\n";
	}

      mCsvFile.flush();
      if (!mCsvFile)
	throw BackTesterException ("BacktestCsvWriter: error writing " + mFileName);
    }

  private:
    std::string mFileName;
    std::ofstream mCsvFile;
    const ClosePriceSeries<Decimal>& mClose;
    const BacktestResult<Decimal>& mResult;
  };
}

#endif
