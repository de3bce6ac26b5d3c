#include "PriceDataLoader.h"
#include <iostream>
#include <memory>
#include "TimeSeriesCsvReader.h"
#include "TimeSeriesException.h"
#include "DataSourceReader.h"
#include "BoostDateHelper.h"

using namespace regime_backtest;

namespace regimebt
{

namespace
{
    // Removes the downloaded CSV however the read ends
    class TemporaryFileGuard
    {
    public:
        explicit TemporaryFileGuard(std::shared_ptr<DataSourceReader> reader)
            : mReader(std::move(reader))
        {}

        ~TemporaryFileGuard()
        {
            mReader->destroyFiles();
        }

        TemporaryFileGuard(const TemporaryFileGuard&) = delete;
        TemporaryFileGuard& operator=(const TemporaryFileGuard&) = delete;

    private:
        std::shared_ptr<DataSourceReader> mReader;
    };
}

PriceDataLoader::PriceDataLoader(const BacktestConfiguration& config)
    : mConfig(config)
{
}

ClosePriceSeries<Num> PriceDataLoader::readCsvFile(const std::string& fileName)
{
    ClosePriceCsvReader<Num> reader(fileName);
    reader.readFile();
    return *reader.getTimeSeries();
}

ClosePriceSeries<Num> PriceDataLoader::loadFromDataSource() const
{
    std::string token;
    if (DataSourceReaderFactory::requiresApiToken(mConfig.getDataSource())) {
        if (!mConfig.hasApiConfigFile())
            throw DataSourceReaderException("Data source " + mConfig.getDataSource() +
                                            " requires --api-config with a Source,Token entry");

        token = DataSourceReaderFactory::getApiTokenFromFile(mConfig.getApiConfigFile(),
                                                             mConfig.getDataSource());
    }

    std::shared_ptr<DataSourceReader> dataSourceReader =
        DataSourceReaderFactory::getDataSourceReader(mConfig.getDataSource(), token);

    std::cout << "Downloading " << mConfig.getTicker() << " from " << dataSourceReader->getSourceName()
              << " for " << toIsoDateString(mConfig.getStartDate()) << " to "
              << toIsoDateString(mConfig.getEndDate()) << std::endl;

    TemporaryFileGuard guard(dataSourceReader);
    std::string fileName = dataSourceReader->createTemporaryFile(mConfig.getTicker(),
                                                                 mConfig.getDateRange(),
                                                                 true);
    return readCsvFile(fileName);
}

ClosePriceSeries<Num> PriceDataLoader::loadPriceSeries() const
{
    ClosePriceSeries<Num> fullSeries = mConfig.hasDataFile() ? readCsvFile(mConfig.getDataFile())
                                                             : loadFromDataSource();

    ClosePriceSeries<Num> series = fullSeries.createSubSeries(mConfig.getDateRange());
    if (series.isEmpty())
        throw TimeSeriesDataAvailabilityException("No data returned for " + mConfig.getTicker() + " between " +
                                                  toIsoDateString(mConfig.getStartDate()) + " and " +
                                                  toIsoDateString(mConfig.getEndDate()));

    return series;
}

} // namespace regimebt
