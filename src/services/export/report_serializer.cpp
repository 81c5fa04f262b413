#include "services/export/report_serializer.hpp"

#include <fstream>
#include <type_traits>
#include <variant>

#include "core/logging.hpp"

namespace acr_qa::services {

using json = nlohmann::json;

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ReportSerializer");
    return logger;
}

constexpr const char* KIND_KEY_VALUE = "kv";
constexpr const char* KIND_METRICS = "metrics";

json metricRowToJson(const MetricRow& row) {
    return {
        {"label", row.label},
        {"value", row.displayValue()},
        {"expected", row.expected},
        {"status", toString(row.status)},
        {"notes", row.notes}
    };
}

MetricRow jsonToMetricRow(const json& j) {
    MetricRow row;
    row.label = j.value("label", "");
    std::string value = j.value("value", std::string(kMissingValue));
    if (value != kMissingValue) {
        row.value = std::move(value);
    }
    row.expected = j.value("expected", "");
    row.status = normalizeStatus(j.value("status", ""));
    row.notes = j.value("notes", "");
    return row;
}

json sectionToJson(const Section& section) {
    return std::visit([](const auto& s) -> json {
        using T = std::decay_t<decltype(s)>;
        json rows = json::array();
        if constexpr (std::is_same_v<T, KeyValueSection>) {
            for (const auto& row : s.rows) {
                rows.push_back({{"label", row.label}, {"value", row.value}});
            }
            return {{"name", s.name}, {"kind", KIND_KEY_VALUE}, {"rows", rows}};
        } else {
            for (const auto& row : s.rows) {
                rows.push_back(metricRowToJson(row));
            }
            return {{"name", s.name}, {"kind", KIND_METRICS}, {"rows", rows}};
        }
    }, section);
}

std::expected<Section, SerializationError> jsonToSection(const json& j) {
    std::string kind = j.value("kind", "");
    std::string name = j.value("name", "");
    const json rows = j.value("rows", json::array());

    if (kind == KIND_KEY_VALUE) {
        KeyValueSection section{name, {}};
        for (const auto& row : rows) {
            section.rows.push_back({row.value("label", ""), row.value("value", "")});
        }
        return section;
    }
    if (kind == KIND_METRICS) {
        MetricsSection section{name, {}};
        for (const auto& row : rows) {
            section.rows.push_back(jsonToMetricRow(row));
        }
        return section;
    }
    return std::unexpected(SerializationError{
        SerializationError::Code::InvalidSchema,
        "unknown section kind '" + kind + "'"
    });
}

} // anonymous namespace

json ReportSerializer::toJson(const Report& report) {
    json plots = json::array();
    for (const auto& plot : report.plots()) {
        plots.push_back({{"title", plot.title}, {"file", plot.fileName}, {"url", plot.url}});
    }

    json sections = json::array();
    for (const auto& section : report.sections()) {
        sections.push_back(sectionToJson(section));
    }

    return {
        {"title", report.title()},
        {"status", toString(report.status())},
        {"message", report.message()},
        {"plots", plots},
        {"sections", sections}
    };
}

std::expected<Report, SerializationError> ReportSerializer::fromJson(const json& root) {
    try {
        if (!root.is_object()) {
            return std::unexpected(SerializationError{
                SerializationError::Code::InvalidSchema, "report root is not an object"
            });
        }

        std::string status = root.value("status", "");
        if (status != "ok" && status != "error") {
            return std::unexpected(SerializationError{
                SerializationError::Code::InvalidSchema, "unknown status '" + status + "'"
            });
        }

        std::vector<PlotSpec> plots;
        for (const auto& plot : root.value("plots", json::array())) {
            plots.push_back({plot.value("title", ""), plot.value("file", ""), plot.value("url", "")});
        }

        std::vector<Section> sections;
        for (const auto& entry : root.value("sections", json::array())) {
            auto section = jsonToSection(entry);
            if (!section) {
                return std::unexpected(section.error());
            }
            sections.push_back(std::move(*section));
        }

        return Report(root.value("title", ""),
                      status == "ok" ? ReportStatus::Ok : ReportStatus::Error,
                      root.value("message", ""),
                      std::move(plots),
                      std::move(sections));
    } catch (const json::exception& e) {
        return std::unexpected(SerializationError{
            SerializationError::Code::InvalidSchema, e.what()
        });
    }
}

std::string ReportSerializer::toText(const Report& report) {
    return toJson(report).dump(2, ' ', false, json::error_handler_t::replace);
}

std::expected<void, SerializationError>
ReportSerializer::save(const Report& report, const std::filesystem::path& filePath) {
    std::ofstream file(filePath);
    if (!file) {
        return std::unexpected(SerializationError{
            SerializationError::Code::FileAccessDenied, filePath.string()
        });
    }

    file << toText(report) << '\n';
    if (!file) {
        return std::unexpected(SerializationError{
            SerializationError::Code::InternalError, "write failed: " + filePath.string()
        });
    }

    getLogger()->info("Report written to {}", filePath.string());
    return {};
}

std::expected<Report, SerializationError>
ReportSerializer::load(const std::filesystem::path& filePath) {
    if (!std::filesystem::exists(filePath)) {
        return std::unexpected(SerializationError{
            SerializationError::Code::FileNotFound, filePath.string()
        });
    }

    std::ifstream file(filePath);
    if (!file) {
        return std::unexpected(SerializationError{
            SerializationError::Code::FileAccessDenied, filePath.string()
        });
    }

    json root = json::parse(file, nullptr, false);
    if (root.is_discarded()) {
        return std::unexpected(SerializationError{
            SerializationError::Code::InvalidJson, filePath.string()
        });
    }
    return fromJson(root);
}

} // namespace acr_qa::services
