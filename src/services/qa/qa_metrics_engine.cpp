#include "services/qa/qa_metrics_engine.hpp"
#include "services/qa/report_assembler.hpp"
#include "services/qa/roi_sampler.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <numeric>

#include <fmt/format.h>

#include "core/logging.hpp"

namespace acr_qa::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("QaMetricsEngine");
    return logger;
}

std::optional<std::string> formatOptional(const std::optional<double>& value,
                                          const char* pattern) {
    if (!value) {
        return std::nullopt;
    }
    return fmt::format(fmt::runtime(pattern), *value);
}

MetricRow makeRow(std::string label,
                  std::optional<std::string> value,
                  std::string expected,
                  MetricStatus status,
                  std::string notes = {}) {
    return MetricRow{std::move(label), std::move(value), std::move(expected), status, std::move(notes)};
}

} // anonymous namespace

QaMetricsEngine::QaMetricsEngine(EngineOptions options)
    : options_(std::move(options)) {}

std::optional<double> QaMetricsEngine::parseDecimal(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    auto last = text.find_last_not_of(" \t\r\n");
    std::string trimmed = text.substr(first, last - first + 1);

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size() || errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

const core::DicomDataset*
QaMetricsEngine::selectRepresentative(const std::vector<core::DicomDataset>& datasets) {
    if (datasets.empty()) {
        return nullptr;
    }
    auto it = std::find_if(datasets.begin(), datasets.end(),
                           [](const core::DicomDataset& ds) { return ds.hasPixelArray(); });
    return it != datasets.end() ? &*it : &datasets.front();
}

QaMeasurements QaMetricsEngine::measure(const std::vector<core::DicomDataset>& datasets) {
    QaMeasurements m;

    const auto* representative = selectRepresentative(datasets);
    if (!representative) {
        return m;
    }

    // Image shape always comes from the first dataset
    const auto& first = datasets.front();
    m.rows = first.rows.value_or(0);
    m.columns = first.columns.value_or(0);

    // Slice thickness: presence of a numeric tag value is the verdict
    if (representative->sliceThickness) {
        m.sliceThicknessMm = parseDecimal(*representative->sliceThickness);
    }
    m.sliceThicknessStatus = m.sliceThicknessMm ? MetricStatus::Pass : MetricStatus::NotAvailable;

    // Geometric accuracy from pixel spacing
    const auto& spacing = representative->pixelSpacing;
    if (spacing.size() >= 2) {
        m.rowSpacingMm = parseDecimal(spacing[0]);
        m.columnSpacingMm = parseDecimal(spacing[1]);
    }

    const bool haveSpacing = m.rowSpacingMm && m.columnSpacingMm
        && *m.rowSpacingMm != 0.0 && *m.columnSpacingMm != 0.0;
    if (haveSpacing && m.rows != 0 && m.columns != 0) {
        const double sr = *m.rowSpacingMm;
        const double sc = *m.columnSpacingMm;
        m.fovRowsMm = sr * m.rows;
        m.fovColumnsMm = sc * m.columns;
        m.geometryStatus = std::abs(sc - sr) <= std::max(sc, sr) * kSpacingTolerance
            ? MetricStatus::Pass
            : MetricStatus::Fail;
    }

    // ROI metrics need a decoded slice and a non-zero shape
    const core::PixelImageType* image = representative->pixels.GetPointer();
    if (!image || m.rows == 0 || m.columns == 0) {
        return m;
    }

    const int rows = m.rows;
    const int cols = m.columns;

    auto center = RoiSampler::measure(
        image, RoiBounds::fromFractions(rows, cols, 0.40, 0.60, 0.40, 0.60));
    const double centerStd = center.stdDev + kEpsilon;
    m.snr = center.mean / centerStd;
    m.snrStatus = *m.snr >= kSnrThreshold ? MetricStatus::Pass : MetricStatus::Fail;

    const double quadrantMeans[] = {
        RoiSampler::measure(image, RoiBounds::fromFractions(rows, cols, 0.20, 0.35, 0.20, 0.35)).mean,
        RoiSampler::measure(image, RoiBounds::fromFractions(rows, cols, 0.20, 0.35, 0.65, 0.80)).mean,
        RoiSampler::measure(image, RoiBounds::fromFractions(rows, cols, 0.65, 0.80, 0.20, 0.35)).mean,
        RoiSampler::measure(image, RoiBounds::fromFractions(rows, cols, 0.65, 0.80, 0.65, 0.80)).mean,
    };
    auto [qMin, qMax] = std::minmax_element(std::begin(quadrantMeans), std::end(quadrantMeans));
    m.piu = 100.0 * (1.0 - (*qMax - *qMin) / (*qMax + *qMin + kEpsilon));
    m.piuStatus = *m.piu >= kPiuThreshold ? MetricStatus::Pass : MetricStatus::Fail;

    auto corner = RoiSampler::measure(
        image, RoiBounds::fromFractions(rows, cols, 0.0, 0.10, 0.0, 0.10));
    m.ghostingRatio = corner.mean / (center.mean + kEpsilon);
    m.ghostingStatus = *m.ghostingRatio <= kGhostingThreshold ? MetricStatus::Pass : MetricStatus::Fail;

    return m;
}

std::vector<MetricRow> QaMetricsEngine::buildRows(const QaMeasurements& m, bool plotsGenerated) {
    std::optional<std::string> geometryValue;
    if (m.fovRowsMm && m.fovColumnsMm) {
        geometryValue = fmt::format("FOV ~ {:.1f} mm x {:.1f} mm (pixel {:.3f} x {:.3f} mm)",
                                    *m.fovColumnsMm, *m.fovRowsMm,
                                    *m.columnSpacingMm, *m.rowSpacingMm);
    }

    std::vector<MetricRow> rows;
    rows.push_back(makeRow("Slice thickness",
                           formatOptional(m.sliceThicknessMm, "{:.2f} mm"),
                           "DICOM tag",
                           m.sliceThicknessStatus));
    rows.push_back(makeRow("Geometric accuracy",
                           geometryValue,
                           "Pixel spacing check",
                           m.geometryStatus));
    rows.push_back(makeRow("High-contrast resolution",
                           std::nullopt,
                           "Not calculated",
                           MetricStatus::NotAvailable,
                           "Algorithm can be added"));
    rows.push_back(makeRow("Low-contrast detectability",
                           std::nullopt,
                           "Not calculated",
                           MetricStatus::NotAvailable,
                           "Algorithm can be added"));
    rows.push_back(makeRow("Intensity uniformity (PIU)",
                           formatOptional(m.piu, "{:.2f}%"),
                           ">= 85%",
                           m.piuStatus));
    rows.push_back(makeRow("Ghosting",
                           formatOptional(m.ghostingRatio, "{:.4f}"),
                           "<= 0.025",
                           m.ghostingStatus));
    rows.push_back(makeRow("SNR",
                           formatOptional(m.snr, "{:.2f}"),
                           ">= 20",
                           m.snrStatus));
    rows.push_back(makeRow("MTF / ramp analysis",
                           plotsGenerated ? std::optional<std::string>("Plot generated") : std::nullopt,
                           "See plot",
                           plotsGenerated ? MetricStatus::Pass : MetricStatus::NotAvailable));
    return rows;
}

std::vector<PlotSpec>
QaMetricsEngine::renderPlots(const core::PixelImageType* image,
                             int rows, int columns,
                             const std::filesystem::path& plotDirectory) const {
    std::vector<PlotSpec> plots;

    auto emit = [&](const char* prefix, const char* svgTitle, const char* reportTitle,
                    std::vector<PlotSeries> series) {
        if (series.empty() || series.front().values.empty()) {
            getLogger()->warn("Skipping plot '{}': profile outside the pixel array", svgTitle);
            return;
        }
        std::vector<double> x(series.front().values.size());
        std::iota(x.begin(), x.end(), 0.0);

        auto fileName = renderer_.writeUnique(plotDirectory, prefix, svgTitle, x, series);
        if (!fileName) {
            getLogger()->warn("Plot '{}' not written: {}", svgTitle, fileName.error().toString());
            return;
        }
        plots.push_back(PlotSpec{reportTitle, *fileName, options_.plotUrlPrefix + *fileName});
    };

    // Ramp-style plot: two horizontal profiles around the vertical center
    auto top = RoiSampler::rowProfile(image, static_cast<int>(rows * 0.45));
    auto bottom = RoiSampler::rowProfile(image, static_cast<int>(rows * 0.55));
    if (!top.empty() && top.size() == bottom.size()) {
        emit("ramp", "MTF / Ramp Analysis", "MTF / ramp analysis",
             {{"Top Ramp", std::move(top)}, {"Bottom Ramp", std::move(bottom)}});
    } else {
        emit("ramp", "MTF / Ramp Analysis", "MTF / ramp analysis", {});
    }

    // Slice thickness profile proxy: vertical line through the center column
    auto vertical = RoiSampler::columnProfile(image, columns / 2);
    emit("slice", "Slice Thickness Profile", "Slice thickness",
         {{"Center Line", std::move(vertical)}});

    return plots;
}

Report QaMetricsEngine::run(const std::vector<core::DicomDataset>& datasets,
                            const std::filesystem::path& plotDirectory) const {
    return run(datasets, plotDirectory, datasets.size());
}

Report QaMetricsEngine::run(const std::vector<core::DicomDataset>& datasets,
                            const std::filesystem::path& plotDirectory,
                            size_t detectedFiles) const {
    if (datasets.empty()) {
        getLogger()->warn("No DICOM datasets provided");
        return ReportAssembler::error("No DICOM datasets provided.");
    }

    auto measurements = measure(datasets);

    std::vector<PlotSpec> plots;
    const auto* representative = selectRepresentative(datasets);
    const auto* image = representative->pixels.GetPointer();
    if (options_.generatePlots && image && measurements.rows != 0 && measurements.columns != 0) {
        plots = renderPlots(image, measurements.rows, measurements.columns, plotDirectory);
    }

    getLogger()->info("QA metrics from {}: SNR={} PIU={} ghosting={} plots={}",
                      representative->path.string(),
                      measurements.snr ? fmt::format("{:.2f}", *measurements.snr) : "n/a",
                      measurements.piu ? fmt::format("{:.2f}", *measurements.piu) : "n/a",
                      measurements.ghostingRatio ? fmt::format("{:.4f}", *measurements.ghostingRatio) : "n/a",
                      plots.size());

    InputSummary summary{detectedFiles, datasets.size(), measurements.rows, measurements.columns};
    return ReportAssembler::assemble(summary,
                                     buildRows(measurements, !plots.empty()),
                                     std::move(plots));
}

} // namespace acr_qa::services
