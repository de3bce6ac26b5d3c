#pragma once

#include <memory>
#include "BacktestConfiguration.h"
#include "PositionStrategy.h"
#include "StrategyConfiguration.h"

namespace regimebt
{

class StrategyFactory
{
public:
    /**
     * @brief Build the strategy selected by --strategy from its parameters.
     * @throws regime_backtest::StrategyConfigurationException for invalid parameters.
     */
    static std::shared_ptr<regime_backtest::PositionStrategy<Num>>
    createStrategy(const BacktestConfiguration& config);

    static regime_backtest::RegimeSwitchingParameters<Num>
    createRegimeParameters(const BacktestConfiguration& config);
};

} // namespace regimebt
