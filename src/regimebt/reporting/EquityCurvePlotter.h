#pragma once

#include <ostream>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "number.h"
#include "BackTester.h"

namespace regimebt
{
namespace reporting
{

using Num = num::DefaultNumber;

/**
 * @brief Draws strategy and buy & hold equity on one SVG line chart.
 *
 * The chart has a title, Date and "Growth of $1" axis labels, a grid and a
 * legend. The x axis is linear in calendar days.
 */
class EquityCurvePlotter
{
public:
    EquityCurvePlotter(int width = 1000, int height = 600);

    /**
     * @brief Write the chart to fileName.
     * @throws std::runtime_error if the file cannot be written or the two
     *         results are not aligned.
     */
    void writeSvgFile(const std::string& fileName,
                      const regime_backtest::BacktestResult<Num>& strategy,
                      const regime_backtest::BacktestResult<Num>& buyAndHold,
                      const std::string& runTag) const;

    void writeSvg(std::ostream& os,
                  const std::vector<boost::gregorian::date>& dates,
                  const std::vector<double>& strategyEquity,
                  const std::vector<double>& benchmarkEquity,
                  const std::string& title) const;

    static std::string escapeXml(const std::string& text);

private:
    int mWidth;
    int mHeight;
};

} // namespace reporting
} // namespace regimebt
