// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file svg_plot_renderer.hpp
 * @brief Self-contained SVG line plots of pixel intensity profiles
 * @details Renders one or more series against a shared x axis on a fixed
 *          900x420 canvas: title, light grid, two axis segments, one polyline
 *          per series, legend and the "Pixel Number" / "Pixel Value" captions.
 *          Files are written under a random name so runs sharing a plot
 *          directory never overwrite each other.
 *
 * ## Thread Safety
 * - render() and writeUnique() are const and hold no shared state
 * - Unique identifiers come from a thread-local generator
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace acr_qa::services {

/**
 * @brief Error information for plot rendering
 */
struct PlotError {
    enum class Code {
        Success,
        InvalidData,
        DirectoryCreationFailed,
        FileWriteFailed
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidData: return "Invalid data: " + message;
            case Code::DirectoryCreationFailed: return "Directory creation failed: " + message;
            case Code::FileWriteFailed: return "File write failed: " + message;
        }
        return "Unknown error";
    }
};

/// One labelled y sequence, same length as the x sequence
struct PlotSeries {
    std::string label;
    std::vector<double> values;
};

/// Data range of one axis after widening
struct AxisRange {
    double min = 0.0;
    double max = 1.0;
};

class SvgPlotRenderer {
public:
    static constexpr int kWidth = 900;
    static constexpr int kHeight = 420;
    static constexpr int kPadLeft = 70;
    static constexpr int kPadRight = 20;
    static constexpr int kPadTop = 45;
    static constexpr int kPadBottom = 55;
    static constexpr int kGridLines = 6;

    /**
     * @brief Render a plot to SVG text
     * @return SVG document or InvalidData when x is empty, no series is
     *         given, or a series length differs from x
     */
    [[nodiscard]] std::expected<std::string, PlotError>
    render(std::string_view title,
           const std::vector<double>& x,
           const std::vector<PlotSeries>& series) const;

    /**
     * @brief Render and write to "<prefix>_<random hex>.svg" in a directory
     * @param directory Output directory, created if missing
     * @return Generated file name (without directory)
     */
    [[nodiscard]] std::expected<std::string, PlotError>
    writeUnique(const std::filesystem::path& directory,
                std::string_view prefix,
                std::string_view title,
                const std::vector<double>& x,
                const std::vector<PlotSeries>& series) const;

    /// Min/max of the values; equal bounds are widened by 1
    [[nodiscard]] static AxisRange computeRange(const std::vector<double>& values);

    /// Escape &, <, > and " for text and attribute content
    [[nodiscard]] static std::string escapeText(std::string_view text);

    /// 128 random bits as 32 lowercase hex digits
    [[nodiscard]] static std::string generateUniqueId();

    /// Series colours, cycled when there are more series than entries
    [[nodiscard]] static const std::vector<std::string>& palette();
};

} // namespace acr_qa::services
