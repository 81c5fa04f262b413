#include "services/qa/qa_report.hpp"

#include <algorithm>
#include <cctype>

namespace acr_qa::services {

std::string toString(MetricStatus status) {
    switch (status) {
        case MetricStatus::Pass:         return "pass";
        case MetricStatus::Fail:         return "fail";
        case MetricStatus::NotAvailable: return "na";
    }
    return "na";
}

MetricStatus normalizeStatus(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "pass") return MetricStatus::Pass;
    if (lower == "fail") return MetricStatus::Fail;
    return MetricStatus::NotAvailable;
}

std::string MetricRow::displayValue() const {
    return value ? *value : std::string(kMissingValue);
}

const std::string& sectionName(const Section& section) {
    return std::visit([](const auto& s) -> const std::string& { return s.name; }, section);
}

std::string toString(ReportStatus status) {
    return status == ReportStatus::Ok ? "ok" : "error";
}

Report::Report(std::string title,
               ReportStatus status,
               std::string message,
               std::vector<PlotSpec> plots,
               std::vector<Section> sections)
    : title_(std::move(title))
    , status_(status)
    , message_(std::move(message))
    , plots_(std::move(plots))
    , sections_(std::move(sections))
{
}

const MetricsSection* Report::metrics() const {
    for (const auto& section : sections_) {
        if (const auto* table = std::get_if<MetricsSection>(&section)) {
            return table;
        }
    }
    return nullptr;
}

const KeyValueSection* Report::summary() const {
    for (const auto& section : sections_) {
        if (const auto* table = std::get_if<KeyValueSection>(&section)) {
            return table;
        }
    }
    return nullptr;
}

const MetricRow* Report::findMetric(std::string_view label) const {
    const auto* table = metrics();
    if (!table) {
        return nullptr;
    }
    auto it = std::find_if(table->rows.begin(), table->rows.end(),
                           [label](const MetricRow& row) { return row.label == label; });
    return it == table->rows.end() ? nullptr : &*it;
}

} // namespace acr_qa::services
