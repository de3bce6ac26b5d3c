#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <rapidjson/document.h>
#include "DataSourceReader.h"
#include "TestUtils.h"

using namespace regime_backtest;
using boost::gregorian::date;

namespace
{
  // Exposes the response handling of the readers without any network access
  class TestableYahooReader : public YahooFinanceReader
  {
  public:
    using YahooFinanceReader::buildDataFetchUri;
    using YahooFinanceReader::validApiResponse;
    using YahooFinanceReader::getCsvRow;
    using YahooFinanceReader::getJsonArraySize;
  };

  class TestableFinnhubReader : public FinnhubIOReader
  {
  public:
    TestableFinnhubReader() : FinnhubIOReader ("abc123")
    {}

    using FinnhubIOReader::buildDataFetchUri;
    using FinnhubIOReader::validApiResponse;
    using FinnhubIOReader::getCsvRow;
    using FinnhubIOReader::getJsonArraySize;
  };

  rapidjson::Document parseJson (const std::string& text)
  {
    rapidjson::Document document;
    document.Parse (text.c_str());
    REQUIRE_FALSE (document.HasParseError());
    return document;
  }
}

TEST_CASE ("YahooFinanceReader request and response handling", "[DataSourceReader]")
{
  TestableYahooReader reader;
  REQUIRE (reader.getSourceName() == "yahoo");

  SECTION ("URI uses epoch seconds with an exclusive end")
    {
      std::string uri = reader.buildDataFetchUri ("SPY", date (2024, 1, 2), date (2024, 1, 3));
      REQUIRE (uri.find ("/chart/SPY?") != std::string::npos);
      REQUIRE (uri.find ("period1=1704153600") != std::string::npos);
      REQUIRE (uri.find ("period2=1704240000") != std::string::npos);
      REQUIRE (uri.find ("interval=1d") != std::string::npos);
    }

  SECTION ("Adjusted closes are preferred and null closes dropped")
    {
      rapidjson::Document json = parseJson (
	"{\"chart\":{\"error\":null,\"result\":[{"
	"\"timestamp\":[1704153600,1704240000,1704326400],"
	"\"indicators\":{\"quote\":[{\"close\":[470.0,468.0,467.0]}],"
	"\"adjclose\":[{\"adjclose\":[460.5,null,458.25]}]}}]}}");

      REQUIRE (reader.validApiResponse (json));
      REQUIRE (reader.getJsonArraySize (json) == 3);
      REQUIRE (reader.getCsvRow (json, 0) == "2024-01-02,460.500000");
      REQUIRE (reader.getCsvRow (json, 1).empty());
      REQUIRE (reader.getCsvRow (json, 2) == "2024-01-04,458.250000");
    }

  SECTION ("Raw closes are used without adjclose")
    {
      rapidjson::Document json = parseJson (
	"{\"chart\":{\"result\":[{\"timestamp\":[1704153600],"
	"\"indicators\":{\"quote\":[{\"close\":[470.0]}]}}]}}");

      REQUIRE (reader.validApiResponse (json));
      REQUIRE (reader.getCsvRow (json, 0) == "2024-01-02,470.000000");
    }

  SECTION ("Error responses are rejected")
    {
      rapidjson::Document withError = parseJson (
	"{\"chart\":{\"error\":{\"code\":\"Not Found\"},\"result\":null}}");
      REQUIRE_FALSE (reader.validApiResponse (withError));

      rapidjson::Document emptyResult = parseJson ("{\"chart\":{\"result\":[]}}");
      REQUIRE_FALSE (reader.validApiResponse (emptyResult));

      rapidjson::Document noChart = parseJson ("{\"status\":\"ok\"}");
      REQUIRE_FALSE (reader.validApiResponse (noChart));
    }
}

TEST_CASE ("FinnhubIOReader request and response handling", "[DataSourceReader]")
{
  TestableFinnhubReader reader;
  REQUIRE (reader.getSourceName() == "finnhub");

  std::string uri = reader.buildDataFetchUri ("QQQ", date (2024, 1, 2), date (2024, 1, 3));
  REQUIRE (uri.find ("symbol=QQQ") != std::string::npos);
  REQUIRE (uri.find ("from=1704153600") != std::string::npos);
  REQUIRE (uri.find ("to=1704239999") != std::string::npos);
  REQUIRE (uri.find ("token=abc123") != std::string::npos);

  rapidjson::Document json = parseJson ("{\"s\":\"ok\",\"c\":[400.25,401.0],\"t\":[1704153600,1704240000]}");
  REQUIRE (reader.validApiResponse (json));
  REQUIRE (reader.getJsonArraySize (json) == 2);
  REQUIRE (reader.getCsvRow (json, 1) == "2024-01-03,401.000000");

  rapidjson::Document noData = parseJson ("{\"s\":\"no_data\"}");
  REQUIRE_FALSE (reader.validApiResponse (noData));
}

TEST_CASE ("DataSourceReaderFactory", "[DataSourceReader]")
{
  REQUIRE (DataSourceReaderFactory::getDataSourceReader ("Yahoo", "")->getSourceName() == "yahoo");
  REQUIRE (DataSourceReaderFactory::getDataSourceReader ("finnhub", "key")->getSourceName() == "finnhub");
  REQUIRE_THROWS_AS (DataSourceReaderFactory::getDataSourceReader ("bloomberg", ""), DataSourceReaderException);

  REQUIRE (DataSourceReaderFactory::requiresApiToken ("finnhub"));
  REQUIRE_FALSE (DataSourceReaderFactory::requiresApiToken ("yahoo"));

  SECTION ("Tokens are read from a Source,Token file")
    {
      std::string fileName = writeTemporaryFile ("api.csv", "Source,Token\nyahoo,unused\nFinnhub,tok42\n");

      REQUIRE (DataSourceReaderFactory::getApiTokenFromFile (fileName, "finnhub") == "tok42");
      REQUIRE_THROWS_AS (DataSourceReaderFactory::getApiTokenFromFile (fileName, "polygon"),
			 DataSourceReaderException);

      removeTemporaryFile (fileName);
    }

  SECTION ("Temporary file name without download")
    {
      std::shared_ptr<DataSourceReader> reader = DataSourceReaderFactory::getDataSourceReader ("yahoo", "");
      std::string fileName = reader->createTemporaryFile ("SPY", DateRange (date (2024, 1, 2), date (2024, 1, 31)),
							  false);
      REQUIRE (fileName.find ("SPY_yahoo_Daily.csv") != std::string::npos);
    }
}
