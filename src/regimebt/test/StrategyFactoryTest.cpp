#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include "BacktestConfiguration.h"
#include "StrategyFactory.h"
#include "StrategyConfiguration.h"
#include "RegimeSwitchingStrategy.h"
#include "utils/OutputUtils.h"
#include "TestUtils.h"

using namespace regimebt;
using namespace regime_backtest;

TEST_CASE("StrategyFactory builds the selected strategy", "[StrategyFactory]") {
    SECTION("Regime switching by default") {
        BacktestConfiguration config(BacktestConfiguration::OptionMap{});
        std::shared_ptr<PositionStrategy<Num>> strategy = StrategyFactory::createStrategy(config);

        REQUIRE(strategy->getStrategyName() == "Regime Switching");
        REQUIRE(strategy->getParameterTag() == "mom50_d2_u1_cr8w_ch5_cd1_cu1_lev1.30");

        auto regime = std::dynamic_pointer_cast<RegimeSwitchingStrategy<Num>>(strategy);
        REQUIRE(regime);
        REQUIRE(regime->getParameters().isLeverageDisabledInCrash());
    }

    SECTION("Leverage in crash mode follows the flag") {
        BacktestConfiguration config(BacktestConfiguration::OptionMap{{"allow-leverage-in-crash", "true"}});
        RegimeSwitchingParameters<Num> parameters = StrategyFactory::createRegimeParameters(config);
        REQUIRE_FALSE(parameters.isLeverageDisabledInCrash());
    }

    SECTION("Alternative strategies") {
        BacktestConfiguration sma(BacktestConfiguration::OptionMap{{"strategy", "sma"}});
        REQUIRE(StrategyFactory::createStrategy(sma)->getParameterTag() == "sma_f20_s50");

        BacktestConfiguration rsi(BacktestConfiguration::OptionMap{{"strategy", "rsi"}});
        REQUIRE(StrategyFactory::createStrategy(rsi)->getParameterTag() == "rsi_p14_b30_s70");

        BacktestConfiguration streak(BacktestConfiguration::OptionMap{{"strategy", "streak"}});
        REQUIRE(StrategyFactory::createStrategy(streak)->getParameterTag() == "streak_d2_u1");

        BacktestConfiguration momentumStreak(BacktestConfiguration::OptionMap{{"strategy", "momentum-streak"}});
        REQUIRE(StrategyFactory::createStrategy(momentumStreak)->getStrategyName() == "Momentum Else Streak");
    }

    SECTION("Invalid strategy parameters surface from the constructors") {
        BacktestConfiguration sma(BacktestConfiguration::OptionMap{{"strategy", "sma"}, {"fast", "50"}});
        REQUIRE_THROWS_AS(StrategyFactory::createStrategy(sma), StrategyConfigurationException);

        BacktestConfiguration regime(BacktestConfiguration::OptionMap{{"down-days", "0"}});
        REQUIRE_THROWS_AS(StrategyFactory::createStrategy(regime), StrategyConfigurationException);

        BacktestConfiguration rsi(BacktestConfiguration::OptionMap{{"strategy", "rsi"}, {"rsi-buy-below", "90"}});
        REQUIRE_THROWS_AS(StrategyFactory::createStrategy(rsi), StrategyConfigurationException);
    }
}

TEST_CASE("Run tag combines ticker, parameters and dates", "[OutputUtils]") {
    BacktestConfiguration config(BacktestConfiguration::OptionMap{});
    std::shared_ptr<PositionStrategy<Num>> strategy = StrategyFactory::createStrategy(config);

    std::string runTag = utils::createRunTag(config.getTicker(), strategy->getParameterTag(),
                                             config.getStartDate(), config.getEndDate());
    REQUIRE(runTag == "SPY_mom50_d2_u1_cr8w_ch5_cd1_cu1_lev1.30_2005-01-01_to_2024-12-31");

    BacktestConfiguration sma(BacktestConfiguration::OptionMap{{"strategy", "sma"}, {"ticker", "qqq"}});
    REQUIRE(utils::createRunTag(sma.getTicker(), StrategyFactory::createStrategy(sma)->getParameterTag(),
                                sma.getStartDate(), sma.getEndDate()) ==
            "QQQ_sma_f20_s50_2005-01-01_to_2024-12-31");
}
