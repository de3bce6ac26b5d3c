#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "number.h"
#include "DateRange.h"

namespace regimebt
{

using Num = num::DefaultNumber;

/**
 * @brief Raised for unknown options, missing or unparsable values and
 * unreadable configuration files.
 */
class BacktestConfigurationException : public std::runtime_error
{
public:
    explicit BacktestConfigurationException(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Complete, validated settings of one backtest run.
 *
 * Built from a map of option name (without leading dashes) to raw text.
 * Options missing from the map take their documented defaults. Boolean
 * options are present in the map when set.
 */
class BacktestConfiguration
{
public:
    using OptionMap = std::map<std::string, std::string>;

    /**
     * @throws BacktestConfigurationException if a value cannot be converted
     *         or the start date is not before the end date.
     */
    explicit BacktestConfiguration(const OptionMap& options);

    /**
     * @brief Default value of every option that takes a value.
     */
    static const OptionMap& getDefaultValues();

    const std::string& getTicker() const { return mTicker; }
    const boost::gregorian::date& getStartDate() const { return mStartDate; }
    const boost::gregorian::date& getEndDate() const { return mEndDate; }

    // Inclusive range covering [start, end)
    regime_backtest::DateRange getDateRange() const;

    const Num& getFeeBasisPoints() const { return mFeeBasisPoints; }

    const std::string& getStrategyName() const { return mStrategyName; }

    unsigned int getLookback() const { return mLookback; }
    unsigned int getDownDays() const { return mDownDays; }
    unsigned int getUpDays() const { return mUpDays; }
    const Num& getCrashWeekDrop() const { return mCrashWeekDrop; }
    unsigned int getCrashHoldDays() const { return mCrashHoldDays; }
    unsigned int getCrashDownDays() const { return mCrashDownDays; }
    unsigned int getCrashUpDays() const { return mCrashUpDays; }
    const Num& getDownLeverage() const { return mDownLeverage; }
    bool isLeverageAllowedInCrash() const { return mAllowLeverageInCrash; }

    unsigned int getFastPeriod() const { return mFastPeriod; }
    unsigned int getSlowPeriod() const { return mSlowPeriod; }
    unsigned int getRsiPeriod() const { return mRsiPeriod; }
    const Num& getRsiBuyBelow() const { return mRsiBuyBelow; }
    const Num& getRsiSellAbove() const { return mRsiSellAbove; }

    bool hasDataFile() const { return !mDataFile.empty(); }
    const std::string& getDataFile() const { return mDataFile; }
    const std::string& getDataSource() const { return mDataSource; }
    bool hasApiConfigFile() const { return !mApiConfigFile.empty(); }
    const std::string& getApiConfigFile() const { return mApiConfigFile; }
    const std::string& getOutputDirectory() const { return mOutputDirectory; }

    bool isDebug() const { return mDebug; }

private:
    static std::string lookup(const OptionMap& options, const std::string& key);
    static unsigned int parseCount(const OptionMap& options, const std::string& key);
    static Num parseDecimal(const OptionMap& options, const std::string& key);
    static boost::gregorian::date parseDate(const OptionMap& options, const std::string& key);

private:
    std::string mTicker;
    boost::gregorian::date mStartDate;
    boost::gregorian::date mEndDate;
    Num mFeeBasisPoints;
    std::string mStrategyName;
    unsigned int mLookback;
    unsigned int mDownDays;
    unsigned int mUpDays;
    Num mCrashWeekDrop;
    unsigned int mCrashHoldDays;
    unsigned int mCrashDownDays;
    unsigned int mCrashUpDays;
    Num mDownLeverage;
    bool mAllowLeverageInCrash;
    unsigned int mFastPeriod;
    unsigned int mSlowPeriod;
    unsigned int mRsiPeriod;
    Num mRsiBuyBelow;
    Num mRsiSellAbove;
    std::string mDataFile;
    std::string mDataSource;
    std::string mApiConfigFile;
    std::string mOutputDirectory;
    bool mDebug;
};

} // namespace regimebt
