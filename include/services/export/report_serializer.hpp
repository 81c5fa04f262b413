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
 * @file report_serializer.hpp
 * @brief JSON transport form of a QA Report
 * @details Layout consumed by the web layer that persists and renders
 *          reports:
 * @code
 * {
 *   "title": "ACR QA Report", "status": "ok", "message": "Report generated.",
 *   "plots": [{"title": "...", "file": "ramp_<id>.svg", "url": "/plots/ramp_<id>.svg"}],
 *   "sections": [
 *     {"name": "Input Summary", "kind": "kv", "rows": [{"label": "...", "value": "..."}]},
 *     {"name": "QA Results", "kind": "metrics",
 *      "rows": [{"label": "...", "value": "...", "expected": "...", "status": "pass", "notes": ""}]}
 *   ]
 * }
 * @endcode
 * Absent metric values are written as the em-dash placeholder and read back
 * as absent.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/qa/qa_report.hpp"

#include <expected>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace acr_qa::services {

/**
 * @brief Error information for serialization operations
 */
struct SerializationError {
    enum class Code {
        Success,
        FileAccessDenied,
        FileNotFound,
        InvalidJson,
        InvalidSchema,
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::FileAccessDenied: return "File access denied: " + message;
            case Code::FileNotFound: return "File not found: " + message;
            case Code::InvalidJson: return "Invalid JSON: " + message;
            case Code::InvalidSchema: return "Invalid schema: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

class ReportSerializer {
public:
    [[nodiscard]] static nlohmann::json toJson(const Report& report);

    [[nodiscard]] static std::expected<Report, SerializationError>
    fromJson(const nlohmann::json& root);

    /**
     * @brief Indented JSON text; invalid UTF-8 is replaced with U+FFFD
     */
    [[nodiscard]] static std::string toText(const Report& report);

    /**
     * @brief Write the report as indented JSON
     */
    [[nodiscard]] static std::expected<void, SerializationError>
    save(const Report& report, const std::filesystem::path& filePath);

    [[nodiscard]] static std::expected<Report, SerializationError>
    load(const std::filesystem::path& filePath);
};

} // namespace acr_qa::services
