#include "core/pipeline_config.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace acr_qa::core {

using json = nlohmann::json;

namespace {

/// Read an optional key of the expected JSON type into target
template <typename T>
std::expected<void, ConfigError> readKey(const json& object, const char* key,
                                         json::value_t expected, T& target) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    const bool typeMatches = (expected == json::value_t::number_unsigned)
        ? it->is_number_unsigned() || (it->is_number_integer() && it->get<int64_t>() >= 0)
        : it->type() == expected;
    if (!typeMatches) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            std::string("'") + key + "' has type " + it->type_name()
        });
    }
    target = it->get<T>();
    return {};
}

} // anonymous namespace

logging::LogConfig PipelineConfig::toLogConfig() const {
    logging::LogConfig config;
    config.level = logLevel;
    config.enableFileLogging = enableFileLogging;
    config.logDirectory = logDirectory;
    return config;
}

std::expected<PipelineConfig, ConfigError> PipelineConfig::fromJson(const json& root) {
    if (!root.is_object()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue, "configuration root must be an object"
        });
    }

    PipelineConfig config;
    std::string workDirectory = config.workDirectory.string();
    std::string plotDirectory = config.plotDirectory.string();

    for (auto result : {
             readKey(root, "workDirectory", json::value_t::string, workDirectory),
             readKey(root, "plotDirectory", json::value_t::string, plotDirectory),
             readKey(root, "plotUrlPrefix", json::value_t::string, config.plotUrlPrefix),
             readKey(root, "maxArchiveBytes", json::value_t::number_unsigned, config.maxArchiveBytes),
         }) {
        if (!result) {
            return std::unexpected(result.error());
        }
    }
    config.workDirectory = workDirectory;
    config.plotDirectory = plotDirectory;

    auto loggingNode = root.find("logging");
    if (loggingNode != root.end() && !loggingNode->is_null()) {
        if (!loggingNode->is_object()) {
            return std::unexpected(ConfigError{
                ConfigError::Code::InvalidValue, "'logging' must be an object"
            });
        }

        std::string level = logging::toString(config.logLevel);
        std::string logDirectory;
        for (auto result : {
                 readKey(*loggingNode, "level", json::value_t::string, level),
                 readKey(*loggingNode, "directory", json::value_t::string, logDirectory),
                 readKey(*loggingNode, "file", json::value_t::boolean, config.enableFileLogging),
             }) {
            if (!result) {
                return std::unexpected(result.error());
            }
        }

        auto parsed = logging::logLevelFromString(level);
        if (!parsed) {
            return std::unexpected(ConfigError{
                ConfigError::Code::InvalidValue, "unknown log level '" + level + "'"
            });
        }
        config.logLevel = *parsed;
        config.logDirectory = logDirectory;
    }

    if (config.plotUrlPrefix.empty() || config.plotUrlPrefix.back() != '/') {
        config.plotUrlPrefix += '/';
    }

    return config;
}

std::expected<PipelineConfig, ConfigError>
PipelineConfig::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileNotFound, path.string()
        });
    }

    json root = json::parse(file, nullptr, false);
    if (root.is_discarded()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidJson, path.string()
        });
    }
    return fromJson(root);
}

} // namespace acr_qa::core
