#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>
#include "StatUtils.h"
#include "TestUtils.h"

using namespace regime_backtest;
using Catch::Approx;

typedef StatUtils<DecimalType> Stat;

TEST_CASE("StatUtils mean and sample variance", "[StatUtils]")
{
    std::vector<DecimalType> data(createDecimals({"2", "4", "4", "4", "5", "5", "7", "9"}));

    REQUIRE(Stat::computeMean(data) == Approx(5.0));
    // population variance 4, sample variance 32 / 7
    REQUIRE(Stat::computeSampleVariance(data) == Approx(32.0 / 7.0));
    REQUIRE(Stat::computeSampleStdDev(data) == Approx(std::sqrt(32.0 / 7.0)));

    SECTION("Undefined for short input")
    {
        REQUIRE(std::isnan(Stat::computeMean({})));
        REQUIRE(std::isnan(Stat::computeSampleVariance(createDecimals({"1"}))));
        REQUIRE(std::isnan(Stat::computeSampleStdDev(createDecimals({"1"}))));
    }

    SECTION("Works on double data")
    {
        REQUIRE(StatUtils<double>::computeMean({1.0, 2.0, 3.0}) == Approx(2.0));
        REQUIRE(StatUtils<double>::computeSampleVariance({1.0, 2.0, 3.0}) == Approx(1.0));
    }
}

TEST_CASE("StatUtils Sharpe ratio", "[StatUtils]")
{
    std::vector<DecimalType> returns(createDecimals({"0.01", "-0.005", "0.02", "0.0"}));

    const double mean = (0.01 - 0.005 + 0.02 + 0.0) / 4.0;
    const double sd = Stat::computeSampleStdDev(returns);

    REQUIRE(Stat::computeSharpeRatio(returns, 0.0, 252.0) == Approx(std::sqrt(252.0) * mean / sd));

    SECTION("Risk free rate is deducted per period")
    {
        const double expected = std::sqrt(252.0) * (mean - 0.0252 / 252.0) / sd;
        REQUIRE(Stat::computeSharpeRatio(returns, 0.0252, 252.0) == Approx(expected));
    }

    SECTION("Zero variance gives NaN")
    {
        REQUIRE(std::isnan(Stat::computeSharpeRatio(createDecimals({"0", "0", "0"}), 0.0, 252.0)));
        REQUIRE(std::isnan(Stat::computeSharpeRatio(createDecimals({"0.01"}), 0.0, 252.0)));
    }
}

TEST_CASE("StatUtils max drawdown", "[StatUtils]")
{
    REQUIRE(Stat::computeMaxDrawdown(createDecimals({"1", "1.2", "0.9", "1.1", "0.6", "1.5"})) == Approx(-0.5));
    REQUIRE(Stat::computeMaxDrawdown(createDecimals({"1", "1.1", "1.2"})) == Approx(0.0));
    REQUIRE(std::isnan(Stat::computeMaxDrawdown({})));
}
