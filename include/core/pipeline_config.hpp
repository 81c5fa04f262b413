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
 * @file pipeline_config.hpp
 * @brief Settings of a QA pipeline run
 * @details Loaded from a JSON document; keys that are absent keep their
 *          defaults, keys with a wrong type are rejected.
 * @code
 * {
 *   "workDirectory": "/var/lib/acr_qa/uploads/job-42",
 *   "plotDirectory": "/var/lib/acr_qa/plots",
 *   "plotUrlPrefix": "/plots/",
 *   "maxArchiveBytes": 524288000,
 *   "logging": {"level": "info", "directory": "/var/log/acr_qa", "file": true}
 * }
 * @endcode
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/logging.hpp"

namespace acr_qa::core {

/**
 * @brief Error information for configuration loading
 */
struct ConfigError {
    enum class Code {
        Success,
        FileNotFound,
        InvalidJson,
        InvalidValue
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::FileNotFound: return "File not found: " + message;
            case Code::InvalidJson: return "Invalid JSON: " + message;
            case Code::InvalidValue: return "Invalid value: " + message;
        }
        return "Unknown error";
    }
};

struct PipelineConfig {
    /// Where uploaded archives are extracted
    std::filesystem::path workDirectory = "acr_qa_work";

    /// Where SVG plots are written
    std::filesystem::path plotDirectory = "plots";

    /// URL prefix under which the web layer serves plotDirectory
    std::string plotUrlPrefix = "/plots/";

    /// Upload size ceiling checked before ingestion
    uint64_t maxArchiveBytes = 500ULL * 1024 * 1024;

    logging::LogLevel logLevel = logging::LogLevel::Info;
    bool enableFileLogging = false;
    std::filesystem::path logDirectory;

    [[nodiscard]] logging::LogConfig toLogConfig() const;

    [[nodiscard]] static std::expected<PipelineConfig, ConfigError>
    fromJson(const nlohmann::json& root);

    [[nodiscard]] static std::expected<PipelineConfig, ConfigError>
    loadFromFile(const std::filesystem::path& path);
};

} // namespace acr_qa::core
