#include "StrategyFactory.h"
#include "RegimeSwitchingStrategy.h"
#include "SmaCrossoverStrategy.h"
#include "RsiMeanReversionStrategy.h"
#include "ConsecutiveReversalStrategy.h"
#include "MomentumStreakStrategy.h"

using namespace regime_backtest;

namespace regimebt
{

RegimeSwitchingParameters<Num> StrategyFactory::createRegimeParameters(const BacktestConfiguration& config)
{
    return RegimeSwitchingParameters<Num>(config.getLookback(),
                                          config.getDownDays(),
                                          config.getUpDays(),
                                          config.getCrashWeekDrop(),
                                          config.getCrashHoldDays(),
                                          config.getCrashDownDays(),
                                          config.getCrashUpDays(),
                                          config.getDownLeverage(),
                                          !config.isLeverageAllowedInCrash());
}

std::shared_ptr<PositionStrategy<Num>> StrategyFactory::createStrategy(const BacktestConfiguration& config)
{
    const std::string& name = config.getStrategyName();

    if (name == "regime")
        return std::make_shared<RegimeSwitchingStrategy<Num>>(createRegimeParameters(config));
    else if (name == "sma")
        return std::make_shared<SmaCrossoverStrategy<Num>>(config.getFastPeriod(), config.getSlowPeriod());
    else if (name == "rsi")
        return std::make_shared<RsiMeanReversionStrategy<Num>>(config.getRsiPeriod(),
                                                               config.getRsiBuyBelow(),
                                                               config.getRsiSellAbove());
    else if (name == "streak")
        return std::make_shared<ConsecutiveReversalStrategy<Num>>(config.getDownDays(), config.getUpDays());
    else if (name == "momentum-streak")
        return std::make_shared<MomentumStreakStrategy<Num>>(config.getLookback(),
                                                             config.getDownDays(),
                                                             config.getUpDays());
    else
        throw StrategyConfigurationException("Strategy " + name + " not recognized");
}

} // namespace regimebt
