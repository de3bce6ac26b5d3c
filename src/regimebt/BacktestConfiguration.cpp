#include "BacktestConfiguration.h"
#include "BoostDateHelper.h"
#include <limits>
#include <set>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

using namespace regime_backtest;

namespace regimebt
{

namespace
{
    const std::set<std::string>& knownStrategies()
    {
        static const std::set<std::string> strategies = {
            "regime", "sma", "rsi", "streak", "momentum-streak"
        };
        return strategies;
    }
}

const BacktestConfiguration::OptionMap& BacktestConfiguration::getDefaultValues()
{
    static const OptionMap defaults = {
        {"ticker", "SPY"},
        {"start", "2005-01-01"},
        {"end", "2024-12-31"},
        {"fee-bps", "2.0"},
        {"strategy", "regime"},
        {"lookback", "50"},
        {"down-days", "2"},
        {"up-days", "1"},
        {"crash-week-drop", "0.08"},
        {"crash-hold-days", "5"},
        {"crash-down-days", "1"},
        {"crash-up-days", "1"},
        {"down-leverage", "1.3"},
        {"fast", "20"},
        {"slow", "50"},
        {"rsi-period", "14"},
        {"rsi-buy-below", "30"},
        {"rsi-sell-above", "70"},
        {"data-file", ""},
        {"data-source", "yahoo"},
        {"api-config", ""},
        {"output-dir", "outputs"}
    };
    return defaults;
}

BacktestConfiguration::BacktestConfiguration(const OptionMap& options)
    : mTicker(boost::algorithm::to_upper_copy(lookup(options, "ticker"))),
      mStartDate(parseDate(options, "start")),
      mEndDate(parseDate(options, "end")),
      mFeeBasisPoints(parseDecimal(options, "fee-bps")),
      mStrategyName(boost::algorithm::to_lower_copy(lookup(options, "strategy"))),
      mLookback(parseCount(options, "lookback")),
      mDownDays(parseCount(options, "down-days")),
      mUpDays(parseCount(options, "up-days")),
      mCrashWeekDrop(parseDecimal(options, "crash-week-drop")),
      mCrashHoldDays(parseCount(options, "crash-hold-days")),
      mCrashDownDays(parseCount(options, "crash-down-days")),
      mCrashUpDays(parseCount(options, "crash-up-days")),
      mDownLeverage(parseDecimal(options, "down-leverage")),
      mAllowLeverageInCrash(options.count("allow-leverage-in-crash") > 0),
      mFastPeriod(parseCount(options, "fast")),
      mSlowPeriod(parseCount(options, "slow")),
      mRsiPeriod(parseCount(options, "rsi-period")),
      mRsiBuyBelow(parseDecimal(options, "rsi-buy-below")),
      mRsiSellAbove(parseDecimal(options, "rsi-sell-above")),
      mDataFile(lookup(options, "data-file")),
      mDataSource(boost::algorithm::to_lower_copy(lookup(options, "data-source"))),
      mApiConfigFile(lookup(options, "api-config")),
      mOutputDirectory(lookup(options, "output-dir")),
      mDebug(options.count("debug") > 0)
{
    if (mTicker.empty())
        throw BacktestConfigurationException("Ticker symbol cannot be empty");

    if (!(mStartDate < mEndDate))
        throw BacktestConfigurationException("Start date " + toIsoDateString(mStartDate) +
                                             " must be before end date " + toIsoDateString(mEndDate));

    if (knownStrategies().count(mStrategyName) == 0)
        throw BacktestConfigurationException("Unknown strategy '" + mStrategyName +
                                             "'; expected one of regime, sma, rsi, streak, momentum-streak");

    if (mOutputDirectory.empty())
        throw BacktestConfigurationException("Output directory cannot be empty");
}

DateRange BacktestConfiguration::getDateRange() const
{
    return createHalfOpenDateRange(mStartDate, mEndDate);
}

std::string BacktestConfiguration::lookup(const OptionMap& options, const std::string& key)
{
    auto it = options.find(key);
    if (it != options.end())
        return boost::algorithm::trim_copy(it->second);

    auto defaultIt = getDefaultValues().find(key);
    if (defaultIt == getDefaultValues().end())
        throw BacktestConfigurationException("No value for option --" + key);

    return defaultIt->second;
}

unsigned int BacktestConfiguration::parseCount(const OptionMap& options, const std::string& key)
{
    const std::string text = lookup(options, key);
    long value = 0;

    try {
        value = boost::lexical_cast<long>(text);
    }
    catch (const boost::bad_lexical_cast&) {
        throw BacktestConfigurationException("Option --" + key + " expects a whole number, got '" + text + "'");
    }

    if (value < 0)
        throw BacktestConfigurationException("Option --" + key + " cannot be negative, got " + text);

    if (static_cast<unsigned long>(value) > std::numeric_limits<unsigned int>::max())
        throw BacktestConfigurationException("Option --" + key + " is too large, got " + text);

    return static_cast<unsigned int>(value);
}

Num BacktestConfiguration::parseDecimal(const OptionMap& options, const std::string& key)
{
    const std::string text = lookup(options, key);

    try {
        boost::lexical_cast<double>(text);
    }
    catch (const boost::bad_lexical_cast&) {
        throw BacktestConfigurationException("Option --" + key + " expects a number, got '" + text + "'");
    }

    return num::fromString<Num>(text);
}

boost::gregorian::date BacktestConfiguration::parseDate(const OptionMap& options, const std::string& key)
{
    const std::string text = lookup(options, key);

    try {
        return parseDateString(text);
    }
    catch (const std::invalid_argument&) {
        throw BacktestConfigurationException("Option --" + key + " expects a date as YYYY-MM-DD or YYYYMMDD, got '" +
                                             text + "'");
    }
}

} // namespace regimebt
