#include "EquityCurvePlotter.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <boost/format.hpp>

namespace regimebt
{
namespace reporting
{

namespace
{
    const int MarginLeft = 80;
    const int MarginRight = 30;
    const int MarginTop = 50;
    const int MarginBottom = 60;
    const int NumGridLines = 6;

    const char* StrategyColor = "#1f77b4";
    const char* BenchmarkColor = "#ff7f0e";

    std::vector<double> toDoubles(const std::vector<Num>& values)
    {
        std::vector<double> out;
        out.reserve(values.size());
        for (const auto& value : values)
            out.push_back(num::to_double(value));
        return out;
    }
}

EquityCurvePlotter::EquityCurvePlotter(int width, int height)
    : mWidth(width),
      mHeight(height)
{
    if (width <= MarginLeft + MarginRight || height <= MarginTop + MarginBottom)
        throw std::invalid_argument("EquityCurvePlotter: chart dimensions are too small");
}

void EquityCurvePlotter::writeSvgFile(const std::string& fileName,
                                      const regime_backtest::BacktestResult<Num>& strategy,
                                      const regime_backtest::BacktestResult<Num>& buyAndHold,
                                      const std::string& runTag) const
{
    if (strategy.getDates() != buyAndHold.getDates())
        throw std::runtime_error("EquityCurvePlotter: strategy and benchmark cover different dates");

    std::ofstream svgFile(fileName);
    if (!svgFile.is_open())
        throw std::runtime_error("Cannot open plot file for writing: " + fileName);

    writeSvg(svgFile, strategy.getDates(), toDoubles(strategy.getEquity()),
             toDoubles(buyAndHold.getEquity()), "Equity Curve - " + runTag);

    svgFile.close();
    if (!svgFile)
        throw std::runtime_error("Error writing plot file " + fileName);
}

void EquityCurvePlotter::writeSvg(std::ostream& os,
                                  const std::vector<boost::gregorian::date>& dates,
                                  const std::vector<double>& strategyEquity,
                                  const std::vector<double>& benchmarkEquity,
                                  const std::string& title) const
{
    const int plotWidth = mWidth - MarginLeft - MarginRight;
    const int plotHeight = mHeight - MarginTop - MarginBottom;

    double yMin = 1.0;
    double yMax = 1.0;
    for (const auto* series : {&strategyEquity, &benchmarkEquity}) {
        for (double value : *series) {
            if (std::isfinite(value)) {
                yMin = std::min(yMin, value);
                yMax = std::max(yMax, value);
            }
        }
    }

    const double yPad = (yMax - yMin) * 0.05 + 1e-9;
    yMin -= yPad;
    yMax += yPad;

    long totalDays = 1;
    if (dates.size() > 1)
        totalDays = std::max(1L, static_cast<long>((dates.back() - dates.front()).days()));

    auto xFor = [&](std::size_t i) {
        const long offset = dates.empty() ? 0 : static_cast<long>((dates[i] - dates.front()).days());
        return MarginLeft + plotWidth * static_cast<double>(offset) / static_cast<double>(totalDays);
    };
    auto yFor = [&](double value) {
        return MarginTop + plotHeight * (1.0 - (value - yMin) / (yMax - yMin));
    };

    os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    os << boost::format("<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"%1%\" height=\"%2%\" "
                        "viewBox=\"0 0 %1% %2%\" font-family=\"sans-serif\">\n") % mWidth % mHeight;
    os << boost::format("<rect x=\"0\" y=\"0\" width=\"%1%\" height=\"%2%\" fill=\"white\"/>\n") % mWidth % mHeight;

    os << boost::format("<text x=\"%1%\" y=\"30\" font-size=\"16\" text-anchor=\"middle\">%2%</text>\n")
        % (mWidth / 2) % escapeXml(title);

    // grid and tick labels
    os << "<g stroke=\"#dddddd\" stroke-width=\"1\">\n";
    for (int k = 0; k <= NumGridLines; ++k) {
        const double y = MarginTop + plotHeight * static_cast<double>(k) / NumGridLines;
        os << boost::format("  <line x1=\"%1%\" y1=\"%2$.2f\" x2=\"%3%\" y2=\"%2$.2f\"/>\n")
            % MarginLeft % y % (MarginLeft + plotWidth);

        const double x = MarginLeft + plotWidth * static_cast<double>(k) / NumGridLines;
        os << boost::format("  <line x1=\"%1$.2f\" y1=\"%2%\" x2=\"%1$.2f\" y2=\"%3%\"/>\n")
            % x % MarginTop % (MarginTop + plotHeight);
    }
    os << "</g>\n";

    os << "<g font-size=\"11\" fill=\"#333333\">\n";
    for (int k = 0; k <= NumGridLines; ++k) {
        const double fraction = static_cast<double>(k) / NumGridLines;
        const double value = yMax - (yMax - yMin) * fraction;
        const double y = MarginTop + plotHeight * fraction;
        os << boost::format("  <text x=\"%1%\" y=\"%2$.2f\" text-anchor=\"end\">%3$.2f</text>\n")
            % (MarginLeft - 6) % (y + 4) % value;

        if (!dates.empty()) {
            boost::gregorian::date labelDate =
                dates.front() + boost::gregorian::days(static_cast<long>(std::lround(totalDays * fraction)));
            const double x = MarginLeft + plotWidth * fraction;
            os << boost::format("  <text x=\"%1$.2f\" y=\"%2%\" text-anchor=\"middle\">%3%</text>\n")
                % x % (MarginTop + plotHeight + 18) % boost::gregorian::to_iso_extended_string(labelDate);
        }
    }
    os << "</g>\n";

    os << boost::format("<rect x=\"%1%\" y=\"%2%\" width=\"%3%\" height=\"%4%\" fill=\"none\" stroke=\"#333333\"/>\n")
        % MarginLeft % MarginTop % plotWidth % plotHeight;

    // axis labels
    os << boost::format("<text x=\"%1%\" y=\"%2%\" font-size=\"13\" text-anchor=\"middle\">Date</text>\n")
        % (MarginLeft + plotWidth / 2) % (mHeight - 15);
    os << boost::format("<text x=\"20\" y=\"%1%\" font-size=\"13\" text-anchor=\"middle\" "
                        "transform=\"rotate(-90 20 %1%)\">Growth of $1</text>\n") % (MarginTop + plotHeight / 2);

    auto writePolyline = [&](const std::vector<double>& equity, const char* color, double opacity) {
        os << boost::format("<polyline fill=\"none\" stroke=\"%1%\" stroke-width=\"1.5\" stroke-opacity=\"%2%\" points=\"")
            % color % opacity;
        for (std::size_t i = 0; i < equity.size() && i < dates.size(); ++i) {
            if (!std::isfinite(equity[i]))
                continue;
            os << boost::format("%1$.2f,%2$.2f ") % xFor(i) % yFor(equity[i]);
        }
        os << "\"/>\n";
    };

    writePolyline(benchmarkEquity, BenchmarkColor, 0.7);
    writePolyline(strategyEquity, StrategyColor, 1.0);

    // legend
    const int legendX = MarginLeft + 15;
    const int legendY = MarginTop + 15;
    os << boost::format("<rect x=\"%1%\" y=\"%2%\" width=\"130\" height=\"48\" fill=\"white\" stroke=\"#999999\"/>\n")
        % (legendX - 8) % (legendY - 8);
    os << boost::format("<line x1=\"%1%\" y1=\"%2%\" x2=\"%3%\" y2=\"%2%\" stroke=\"%4%\" stroke-width=\"2\"/>\n")
        % legendX % (legendY + 5) % (legendX + 25) % StrategyColor;
    os << boost::format("<text x=\"%1%\" y=\"%2%\" font-size=\"12\">Strategy</text>\n")
        % (legendX + 32) % (legendY + 9);
    os << boost::format("<line x1=\"%1%\" y1=\"%2%\" x2=\"%3%\" y2=\"%2%\" stroke=\"%4%\" stroke-width=\"2\" stroke-opacity=\"0.7\"/>\n")
        % legendX % (legendY + 25) % (legendX + 25) % BenchmarkColor;
    os << boost::format("<text x=\"%1%\" y=\"%2%\" font-size=\"12\">Buy &amp; Hold</text>\n")
        % (legendX + 32) % (legendY + 29);

    os << "</svg>\n";
}

std::string EquityCurvePlotter::escapeXml(const std::string& text)
{
    std::string escaped;
    escaped.reserve(text.size());

    for (char c : text) {
        switch (c) {
        case '&': escaped += "&amp;"; break;
        case '<': escaped += "&lt;"; break;
        case '>': escaped += "&gt;"; break;
        case '"': escaped += "&quot;"; break;
        default: escaped += c; break;
        }
    }

    return escaped;
}

} // namespace reporting
} // namespace regimebt
