#ifndef __DATAREADER_H
#define __DATAREADER_H 1

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/date_time.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <curl/curl.h>
#include <rapidjson/document.h>
#include "DateRange.h"
#include "BoostDateHelper.h"
#include "csv.h"

namespace regime_backtest
{
  class DataSourceReaderException : public std::runtime_error
  {
  public:
  DataSourceReaderException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~DataSourceReaderException()
      {}
  };

  /*
   * Base class for remote daily price sources. A download is converted to a
   * temporary CSV file with a "Date,Close" header which is then read by
   * ClosePriceCsvReader like any local file.
   */
  class DataSourceReader
  {
  public:
    explicit DataSourceReader(const std::string& APIToken) : mApiKey(APIToken)
    {}

    virtual ~DataSourceReader()
    {}

    virtual std::string getSourceName() const = 0;

    /*
     * Builds the request URI for the date range, downloads the candles to a
     * temporary CSV file and returns the file name. When performDownload is
     * false only the file name is returned.
     */
    std::string createTemporaryFile(const std::string& ticker,
				    const DateRange& dateRangeToCollect,
				    bool performDownload)
    {
      std::string uri = buildDataFetchUri(ticker, dateRangeToCollect.getFirstDate(),
					  dateRangeToCollect.getLastDate() + boost::gregorian::days(1));
      std::string filename = getFilename(ticker);

      if (!performDownload)
        return filename;

      rapidjson::Document jsonDocument = getJson(uri);

      if (!validApiResponse(jsonDocument))
        throw DataSourceReaderException("No data returned from " + getSourceName() +
					" for ticker " + ticker);

      std::ofstream csvFile(filename);
      if (!csvFile.is_open())
	throw DataSourceReaderException("Unable to create temporary file " + filename);

      tempFilenames.push_back(filename);
      csvFile << "Date,Close" << std::endl;

      rapidjson::SizeType resultSize = getJsonArraySize(jsonDocument);
      for (rapidjson::SizeType idx = 0; idx != resultSize; idx++)
	{
	  std::string row = getCsvRow(jsonDocument, idx);
	  if (!row.empty())
	    csvFile << row << "\n";
	}

      csvFile.close();
      return filename;
    }

    /*
     * Removes the temporary files created by createTemporaryFile.
     */
    void destroyFiles()
    {
      for (auto it = tempFilenames.begin(); it != tempFilenames.end(); it++)
	{
	  if (std::remove((*it).c_str()) != 0)
	    std::cout << "DataSourceReader: unable to remove temporary file " << *it << std::endl;
	}

      tempFilenames.clear();
    }

  protected:
    const std::string mApiKey;
    std::vector<std::string> tempFilenames;

    virtual std::string buildDataFetchUri(const std::string& ticker,
					  boost::gregorian::date startDate,
					  boost::gregorian::date endDateExclusive) = 0;
    virtual bool validApiResponse(rapidjson::Document& jsonDocument) = 0;
    // Returns an empty string for a candle without a usable close
    virtual std::string getCsvRow(rapidjson::Document& jsonDocument, rapidjson::SizeType idx) = 0;
    virtual rapidjson::SizeType getJsonArraySize(rapidjson::Document& jsonDocument) = 0;

    time_t timestampFromDate(boost::gregorian::date aDate)
    {
      boost::posix_time::ptime epoch(boost::gregorian::date(1970,1,1));
      boost::posix_time::ptime midnight(aDate, boost::posix_time::time_duration(0, 0, 0));
      boost::posix_time::time_duration::sec_type secs = (midnight - epoch).total_seconds();

      return time_t(secs);
    }

    std::string csvRowFor(int64_t timestamp, double closePrice)
    {
      boost::posix_time::ptime time = boost::posix_time::from_time_t(static_cast<time_t>(timestamp));
      return (boost::format("%1%,%2$.6f") % toIsoDateString(time.date()) % closePrice).str();
    }

  private:
    static size_t jsonWriteCallback(void *ptr, size_t size, size_t nmemb, std::string* data)
    {
      data->append((char*)ptr, size*nmemb);
      return size*nmemb;
    }

    std::string getFilename(const std::string& ticker)
    {
      boost::filesystem::path tempDir = boost::filesystem::temp_directory_path();
      std::string name = (boost::format("%1%_%2%_Daily.csv") % ticker % getSourceName()).str();
      return (tempDir / name).string();
    }

    rapidjson::Document getJson(const std::string& uri)
    {
      std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
      if (!curl)
	throw DataSourceReaderException("Unable to initialize libcurl");

      std::string buffer;

      curl_easy_setopt(curl.get(), CURLOPT_URL, uri.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, jsonWriteCallback);
      curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
      curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
      curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
      curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "Mozilla/5.0 (regimebt)");

      CURLcode result = curl_easy_perform(curl.get());
      if (result != CURLE_OK)
	throw DataSourceReaderException(getSourceName() + " request failed: " +
					std::string(curl_easy_strerror(result)));

      long httpCode = 0;
      curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);
      if (httpCode != 200)
	throw DataSourceReaderException(getSourceName() + " request returned HTTP status " +
					boost::lexical_cast<std::string>(httpCode));

      rapidjson::Document document;
      document.Parse(buffer.c_str());
      if (document.HasParseError() || !document.IsObject())
	throw DataSourceReaderException(getSourceName() + " returned a response that is not a JSON object");

      return document;
    }

  };

  /*
   * Data reader for the Yahoo Finance chart API. No token is needed.
   */
  class YahooFinanceReader : public DataSourceReader
  {
  public:
    YahooFinanceReader() : DataSourceReader("")
    {}

    std::string getSourceName() const
    {
      return "yahoo";
    }

  protected:
    std::string buildDataFetchUri(const std::string& ticker, boost::gregorian::date startDate,
				  boost::gregorian::date endDateExclusive)
    {
      std::string uri = "https://query1.finance.yahoo.com/v8/finance/chart/%1%?period1=%2%&period2=%3%&interval=1d&events=history";

      return (boost::format(uri) %
	      ticker %
	      boost::lexical_cast<std::string>(timestampFromDate(startDate)) %
	      boost::lexical_cast<std::string>(timestampFromDate(endDateExclusive))).str();
    }

    bool validApiResponse(rapidjson::Document& json)
    {
      if (!json.HasMember("chart") || !json["chart"].IsObject())
	return false;

      const rapidjson::Value& chart = json["chart"];
      if (chart.HasMember("error") && !chart["error"].IsNull())
	return false;

      if (!chart.HasMember("result") || !chart["result"].IsArray() || chart["result"].Empty())
	return false;

      const rapidjson::Value& result = chart["result"][0u];
      return result.HasMember("timestamp") && result["timestamp"].IsArray() &&
	closeArray(json) != nullptr;
    }

    rapidjson::SizeType getJsonArraySize(rapidjson::Document& json)
    {
      return json["chart"]["result"][0u]["timestamp"].Size();
    }

    std::string getCsvRow(rapidjson::Document& json, rapidjson::SizeType idx)
    {
      const rapidjson::Value& timestamps = json["chart"]["result"][0u]["timestamp"];
      const rapidjson::Value* closes = closeArray(json);

      if (idx >= closes->Size() || !(*closes)[idx].IsNumber())
	return "";

      return csvRowFor(timestamps[idx].GetInt64(), (*closes)[idx].GetDouble());
    }

  private:
    // Adjusted closes when the response carries them, raw closes otherwise
    const rapidjson::Value* closeArray(rapidjson::Document& json)
    {
      const rapidjson::Value& result = json["chart"]["result"][0u];
      if (!result.HasMember("indicators"))
	return nullptr;

      const rapidjson::Value& indicators = result["indicators"];
      if (indicators.HasMember("adjclose") && indicators["adjclose"].IsArray() &&
	  !indicators["adjclose"].Empty() && indicators["adjclose"][0u].HasMember("adjclose"))
	return &indicators["adjclose"][0u]["adjclose"];

      if (indicators.HasMember("quote") && indicators["quote"].IsArray() &&
	  !indicators["quote"].Empty() && indicators["quote"][0u].HasMember("close"))
	return &indicators["quote"][0u]["close"];

      return nullptr;
    }
  };

  /*
   * Data reader implementation for Finnhub.IO.
   */
  class FinnhubIOReader : public DataSourceReader
  {
  public:
    explicit FinnhubIOReader(const std::string& APIToken) : DataSourceReader(APIToken)
    {}

    std::string getSourceName() const
    {
      return "finnhub";
    }

  protected:
    std::string buildDataFetchUri(const std::string& ticker, boost::gregorian::date startDate,
				  boost::gregorian::date endDateExclusive)
    {
      std::string uri = "https://finnhub.io/api/v1/stock/candle?symbol=%1%&resolution=D&from=%2%&to=%3%&format=json&token=%4%";

      return (boost::format(uri) %
	      ticker %
	      boost::lexical_cast<std::string>(timestampFromDate(startDate)) %
	      boost::lexical_cast<std::string>(timestampFromDate(endDateExclusive) - 1) %
	      mApiKey).str();
    }

    bool validApiResponse(rapidjson::Document& json)
    {
      return json.HasMember("s") && json["s"].IsString() &&
	boost::iequals(json["s"].GetString(), "ok") &&
	json.HasMember("c") && json["c"].IsArray() &&
	json.HasMember("t") && json["t"].IsArray();
    }

    rapidjson::SizeType getJsonArraySize(rapidjson::Document& json)
    {
      return json["c"].Size();
    }

    std::string getCsvRow(rapidjson::Document& json, rapidjson::SizeType idx)
    {
      const rapidjson::Value& closes = json["c"];
      const rapidjson::Value& timestamps = json["t"];

      if (idx >= timestamps.Size() || !closes[idx].IsNumber())
	return "";

      return csvRowFor(timestamps[idx].GetInt64(), closes[idx].GetDouble());
    }
  };

  class DataSourceReaderFactory
  {
  public:
    static std::shared_ptr<DataSourceReader> getDataSourceReader(const std::string& dataSourceName,
								 const std::string& apiKey)
    {
      if (boost::iequals(dataSourceName, "yahoo"))
	return std::make_shared<YahooFinanceReader>();
      else if (boost::iequals(dataSourceName, "finnhub"))
	return std::make_shared<FinnhubIOReader>(apiKey);
      else
	throw DataSourceReaderException("Data source " + dataSourceName + " not recognized");
    }

    static bool requiresApiToken(const std::string& dataSourceName)
    {
      return boost::iequals(dataSourceName, "finnhub");
    }

    static std::string getApiTokenFromFile(const std::string& apiConfigFilename,
					   const std::string& dataSourceName)
    {
      std::string source, token;
      io::CSVReader<2, io::trim_chars<' ', '\t'>> csvApiConfig(apiConfigFilename);
      csvApiConfig.read_header(io::ignore_extra_column, "Source", "Token");

      while (csvApiConfig.read_row(source, token))
	{
	  if (boost::iequals(dataSourceName, source) && !token.empty())
	    return token;
	}

      throw DataSourceReaderException("Source " + dataSourceName + " does not exist in " + apiConfigFilename);
    }

  };
}
#endif
