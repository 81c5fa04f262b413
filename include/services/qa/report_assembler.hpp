#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "services/qa/qa_report.hpp"

namespace acr_qa::services {

/// Counts and shape shown in the "Input Summary" table
struct InputSummary {
    size_t detectedFiles = 0;
    size_t loadedDatasets = 0;
    int rows = 0;
    int columns = 0;
};

/**
 * @brief Builds Report values from already computed parts
 */
class ReportAssembler {
public:
    static constexpr const char* kTitle = "ACR QA Report";
    static constexpr const char* kSummarySection = "Input Summary";
    static constexpr const char* kResultsSection = "QA Results";

    /**
     * @brief Report with status ok: Input Summary, then QA Results
     */
    [[nodiscard]] static Report assemble(const InputSummary& summary,
                                         std::vector<MetricRow> rows,
                                         std::vector<PlotSpec> plots);

    /**
     * @brief Report with status error, no sections and no plots
     */
    [[nodiscard]] static Report error(std::string message);
};

} // namespace acr_qa::services
