#include <catch2/catch_test_macros.hpp>
#include "TimeSeriesEntry.h"
#include "BoostDateHelper.h"
#include "TestUtils.h"

using namespace regime_backtest;
using namespace boost::gregorian;

TEST_CASE ("ClosePriceEntry operations", "[ClosePriceEntry]")
{
  date refDate1 (2016, Jan, 4);
  date refDate2 (2016, Jan, 5);

  DecimalType closePrice1 (createDecimal ("201.02"));
  DecimalType closePrice2 (createDecimal ("203.87"));

  ClosePriceEntry<DecimalType> entry1 (refDate1, closePrice1);
  ClosePriceEntry<DecimalType> entry2 (refDate2, closePrice2);
  ClosePriceEntry<DecimalType> entry3 (refDate1, closePrice1);

  SECTION ("Getters return construction values")
    {
      REQUIRE (entry1.getDate() == refDate1);
      REQUIRE (entry1.getClose() == closePrice1);
      REQUIRE (entry2.getDate() == refDate2);
      REQUIRE (entry2.getClose() == closePrice2);
    }

  SECTION ("Equality compares date and close")
    {
      REQUIRE (entry1 == entry3);
      REQUIRE_FALSE (entry1 != entry3);
      REQUIRE (entry1 != entry2);

      ClosePriceEntry<DecimalType> sameDateOtherClose (refDate1, closePrice2);
      REQUIRE (entry1 != sameDateOtherClose);
    }

  SECTION ("Copies compare equal")
    {
      ClosePriceEntry<DecimalType> copied (entry2);
      REQUIRE (copied == entry2);
    }
}

TEST_CASE ("ClosePriceEntry rejects invalid values", "[ClosePriceEntry]")
{
  date refDate (2016, Jan, 4);

  REQUIRE_THROWS_AS (ClosePriceEntry<DecimalType> (refDate, createDecimal ("0.0")),
		     TimeSeriesEntryException);
  REQUIRE_THROWS_AS (ClosePriceEntry<DecimalType> (refDate, createDecimal ("-5.25")),
		     TimeSeriesEntryException);
  REQUIRE_THROWS_AS (ClosePriceEntry<DecimalType> (date (boost::date_time::not_a_date_time),
						   createDecimal ("10.0")),
		     TimeSeriesEntryException);
}
