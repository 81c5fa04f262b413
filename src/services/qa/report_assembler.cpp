#include "services/qa/report_assembler.hpp"

namespace acr_qa::services {

Report ReportAssembler::assemble(const InputSummary& summary,
                                 std::vector<MetricRow> rows,
                                 std::vector<PlotSpec> plots) {
    KeyValueSection input{
        kSummarySection,
        {
            {"DICOM files detected", std::to_string(summary.detectedFiles)},
            {"Slices read", std::to_string(summary.loadedDatasets)},
            {"Image shape", std::to_string(summary.rows) + " x " + std::to_string(summary.columns)},
        }
    };

    MetricsSection results{kResultsSection, std::move(rows)};

    std::vector<Section> sections;
    sections.emplace_back(std::move(input));
    sections.emplace_back(std::move(results));

    return Report(kTitle, ReportStatus::Ok, "Report generated.",
                  std::move(plots), std::move(sections));
}

Report ReportAssembler::error(std::string message) {
    return Report(kTitle, ReportStatus::Error, std::move(message), {}, {});
}

} // namespace acr_qa::services
