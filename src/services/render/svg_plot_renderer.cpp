#include "services/render/svg_plot_renderer.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <random>

#include <fmt/format.h>

#include "core/logging.hpp"

namespace acr_qa::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("SvgPlotRenderer");
    return logger;
}

constexpr const char* kFontFamily = "Segoe UI, Arial";

} // anonymous namespace

const std::vector<std::string>& SvgPlotRenderer::palette() {
    static const std::vector<std::string> colors = {
        "#2563eb", "#ef4444", "#10b981", "#a855f7"
    };
    return colors;
}

AxisRange SvgPlotRenderer::computeRange(const std::vector<double>& values) {
    AxisRange range;
    if (values.empty()) {
        return range;
    }
    auto [minIt, maxIt] = std::minmax_element(values.begin(), values.end());
    range.min = *minIt;
    range.max = *maxIt;
    if (range.max == range.min) {
        range.max = range.min + 1.0;
    }
    return range;
}

std::string SvgPlotRenderer::escapeText(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            default:  escaped += c; break;
        }
    }
    return escaped;
}

std::string SvgPlotRenderer::generateUniqueId() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    return fmt::format("{:016x}{:016x}", dis(gen), dis(gen));
}

std::expected<std::string, PlotError>
SvgPlotRenderer::render(std::string_view title,
                        const std::vector<double>& x,
                        const std::vector<PlotSeries>& series) const {
    if (x.empty()) {
        return std::unexpected(PlotError{PlotError::Code::InvalidData, "empty x sequence"});
    }
    if (series.empty()) {
        return std::unexpected(PlotError{PlotError::Code::InvalidData, "no series"});
    }

    std::vector<double> allY;
    for (const auto& s : series) {
        if (s.values.size() != x.size()) {
            return std::unexpected(PlotError{
                PlotError::Code::InvalidData,
                fmt::format("series '{}' has {} values for {} x values",
                            s.label, s.values.size(), x.size())
            });
        }
        allY.insert(allY.end(), s.values.begin(), s.values.end());
    }

    constexpr double plotWidth = kWidth - kPadLeft - kPadRight;
    constexpr double plotHeight = kHeight - kPadTop - kPadBottom;

    const AxisRange xRange = computeRange(x);
    const AxisRange yRange = computeRange(allY);

    auto sx = [&](double v) {
        return kPadLeft + (v - xRange.min) / (xRange.max - xRange.min) * plotWidth;
    };
    auto sy = [&](double v) {
        return kPadTop + (1.0 - (v - yRange.min) / (yRange.max - yRange.min)) * plotHeight;
    };

    std::vector<std::string> parts;
    parts.push_back(fmt::format(
        "<svg xmlns='http://www.w3.org/2000/svg' width='{0}' height='{1}' viewBox='0 0 {0} {1}'>",
        kWidth, kHeight));
    parts.push_back(fmt::format(
        "<rect x='0' y='0' width='{}' height='{}' rx='16' fill='white' stroke='#e5e7eb' />",
        kWidth, kHeight));
    parts.push_back(fmt::format(
        "<text x='{}' y='28' font-family='{}' font-size='18' font-weight='600' fill='#111827'>{}</text>",
        kPadLeft, kFontFamily, escapeText(title)));

    // grid
    for (int i = 0; i < kGridLines; ++i) {
        double yy = kPadTop + i * (plotHeight / (kGridLines - 1));
        parts.push_back(fmt::format(
            "<line x1='{}' y1='{:.2f}' x2='{}' y2='{:.2f}' stroke='#f3f4f6' />",
            kPadLeft, yy, kPadLeft + plotWidth, yy));
    }
    for (int i = 0; i < kGridLines; ++i) {
        double xx = kPadLeft + i * (plotWidth / (kGridLines - 1));
        parts.push_back(fmt::format(
            "<line x1='{:.2f}' y1='{}' x2='{:.2f}' y2='{}' stroke='#f3f4f6' />",
            xx, kPadTop, xx, kPadTop + plotHeight));
    }

    // axes
    parts.push_back(fmt::format(
        "<line x1='{0}' y1='{1}' x2='{0}' y2='{2}' stroke='#9ca3af' />",
        kPadLeft, kPadTop, kPadTop + plotHeight));
    parts.push_back(fmt::format(
        "<line x1='{0}' y1='{1}' x2='{2}' y2='{1}' stroke='#9ca3af' />",
        kPadLeft, kPadTop + plotHeight, kPadLeft + plotWidth));

    // series and legend
    const double legendX = kPadLeft + plotWidth - 170;
    const double legendY = 60;
    const auto& colors = palette();
    for (size_t idx = 0; idx < series.size(); ++idx) {
        const auto& color = colors[idx % colors.size()];
        const auto& values = series[idx].values;

        std::string points;
        points.reserve(x.size() * 14);
        for (size_t i = 0; i < x.size(); ++i) {
            if (i > 0) {
                points += ' ';
            }
            points += fmt::format("{:.2f},{:.2f}", sx(x[i]), sy(values[i]));
        }
        parts.push_back(fmt::format(
            "<polyline fill='none' stroke='{}' stroke-width='2.5' points='{}' />",
            color, points));

        double ly = legendY + static_cast<double>(idx) * 20;
        parts.push_back(fmt::format(
            "<line x1='{}' y1='{}' x2='{}' y2='{}' stroke='{}' stroke-width='3' />",
            legendX, ly - 6, legendX + 26, ly - 6, color));
        parts.push_back(fmt::format(
            "<text x='{}' y='{}' font-family='{}' font-size='12' fill='#111827'>{}</text>",
            legendX + 32, ly - 2, kFontFamily, escapeText(series[idx].label)));
    }

    // captions
    parts.push_back(fmt::format(
        "<text x='{:.2f}' y='{}' text-anchor='middle' font-family='{}' font-size='12' fill='#374151'>Pixel Number</text>",
        kPadLeft + plotWidth / 2, kHeight - 18, kFontFamily));
    const double captionY = kPadTop + plotHeight / 2;
    parts.push_back(fmt::format(
        "<text x='18' y='{0:.2f}' transform='rotate(-90 18 {0:.2f})' text-anchor='middle' font-family='{1}' font-size='12' fill='#374151'>Pixel Value</text>",
        captionY, kFontFamily));
    parts.push_back("</svg>\n");

    std::string document;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            document += '\n';
        }
        document += parts[i];
    }
    return document;
}

std::expected<std::string, PlotError>
SvgPlotRenderer::writeUnique(const std::filesystem::path& directory,
                             std::string_view prefix,
                             std::string_view title,
                             const std::vector<double>& x,
                             const std::vector<PlotSeries>& series) const {
    auto document = render(title, x, series);
    if (!document) {
        return std::unexpected(document.error());
    }

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return std::unexpected(PlotError{
            PlotError::Code::DirectoryCreationFailed,
            directory.string() + ": " + ec.message()
        });
    }

    std::string fileName;
    std::filesystem::path target;
    do {
        fileName = fmt::format("{}_{}.svg", prefix, generateUniqueId());
        target = directory / fileName;
    } while (std::filesystem::exists(target, ec));

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(PlotError{
            PlotError::Code::FileWriteFailed, target.string()
        });
    }
    out << *document;
    if (!out) {
        return std::unexpected(PlotError{
            PlotError::Code::FileWriteFailed, target.string()
        });
    }

    getLogger()->debug("Wrote plot '{}' to {}", title, target.string());
    return fileName;
}

} // namespace acr_qa::services
