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
 * @file qa_metrics_engine.hpp
 * @brief Image quality metrics for an MRI QA phantom series
 * @details Computes slice thickness and geometric accuracy from DICOM
 *          attributes, and SNR, percent integral uniformity and ghosting from
 *          rectangular ROIs on the first decodable slice. Two intensity
 *          profiles are rendered as SVG plots. Missing attributes or pixels
 *          turn the affected rows into "na"; nothing here fails the run
 *          except an empty input.
 *
 * ROI layout, as fractions of the image extent (rows x columns):
 * - center: 0.40-0.60 x 0.40-0.60
 * - uniformity quadrants: 0.20-0.35 / 0.65-0.80 on both axes
 * - ghosting corner: 0.00-0.10 x 0.00-0.10
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/dicom_dataset.hpp"
#include "services/qa/qa_report.hpp"
#include "services/render/svg_plot_renderer.hpp"

namespace acr_qa::services {

/**
 * @brief Raw numbers behind the QA Results table
 */
struct QaMeasurements {
    /// Image shape from the first dataset's attributes
    int rows = 0;
    int columns = 0;

    std::optional<double> sliceThicknessMm;

    /// (0028,0030) first value: spacing between rows
    std::optional<double> rowSpacingMm;
    /// (0028,0030) second value: spacing between columns
    std::optional<double> columnSpacingMm;

    std::optional<double> fovRowsMm;
    std::optional<double> fovColumnsMm;

    std::optional<double> snr;
    std::optional<double> piu;
    std::optional<double> ghostingRatio;

    MetricStatus sliceThicknessStatus = MetricStatus::NotAvailable;
    MetricStatus geometryStatus = MetricStatus::NotAvailable;
    MetricStatus snrStatus = MetricStatus::NotAvailable;
    MetricStatus piuStatus = MetricStatus::NotAvailable;
    MetricStatus ghostingStatus = MetricStatus::NotAvailable;
};

struct EngineOptions {
    /// Prefix joined with the plot file name to form PlotSpec::url
    std::string plotUrlPrefix = "/plots/";
    bool generatePlots = true;
};

/**
 * @brief Produces a QA Report from loaded datasets
 *
 * @code
 * QaMetricsEngine engine;
 * auto report = engine.run(datasets, plotDir);
 * if (report.isOk()) {
 *     const auto* snr = report.findMetric("SNR");
 * }
 * @endcode
 */
class QaMetricsEngine {
public:
    static constexpr double kEpsilon = 1e-6;
    static constexpr double kSnrThreshold = 20.0;
    static constexpr double kPiuThreshold = 85.0;
    static constexpr double kGhostingThreshold = 0.025;
    static constexpr double kSpacingTolerance = 0.02;

    explicit QaMetricsEngine(EngineOptions options = {});

    /**
     * @brief Compute the report; detected file count equals datasets.size()
     */
    [[nodiscard]] Report run(const std::vector<core::DicomDataset>& datasets,
                             const std::filesystem::path& plotDirectory) const;

    /**
     * @brief Compute the report with the detector's file count for the summary
     */
    [[nodiscard]] Report run(const std::vector<core::DicomDataset>& datasets,
                             const std::filesystem::path& plotDirectory,
                             size_t detectedFiles) const;

    /**
     * @brief Dataset whose attributes feed the tag based rows
     *
     * The first dataset carrying a pixel array, or the first dataset when
     * none does. nullptr for an empty sequence.
     */
    [[nodiscard]] static const core::DicomDataset*
    selectRepresentative(const std::vector<core::DicomDataset>& datasets);

    /**
     * @brief All metric values and verdicts, without plots
     */
    [[nodiscard]] static QaMeasurements
    measure(const std::vector<core::DicomDataset>& datasets);

    /**
     * @brief QA Results rows in report order
     */
    [[nodiscard]] static std::vector<MetricRow>
    buildRows(const QaMeasurements& measurements, bool plotsGenerated);

    /**
     * @brief Decimal string to double, as DICOM DS values are written
     *
     * Surrounding spaces are allowed; anything else that is not part of the
     * number makes the value absent.
     */
    [[nodiscard]] static std::optional<double> parseDecimal(const std::string& text);

private:
    std::vector<PlotSpec> renderPlots(const core::PixelImageType* image,
                                      int rows, int columns,
                                      const std::filesystem::path& plotDirectory) const;

    EngineOptions options_;
    SvgPlotRenderer renderer_;
};

} // namespace acr_qa::services
