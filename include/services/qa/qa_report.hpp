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
 * @file qa_report.hpp
 * @brief Value types of a phantom QA report
 * @details A Report is built once by ReportAssembler and never modified.
 *          Sections are a closed variant so renderers handle exactly the
 *          two table shapes the pipeline produces.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace acr_qa::services {

/// Placeholder shown for an absent metric value (U+2014 EM DASH)
inline constexpr std::string_view kMissingValue = "\xE2\x80\x94";

/**
 * @brief Verdict of a single QA check
 */
enum class MetricStatus {
    Pass,
    Fail,
    NotAvailable
};

/// "pass", "fail" or "na"
[[nodiscard]] std::string toString(MetricStatus status);

/**
 * @brief Fold free text into a verdict
 *
 * Case-insensitive "pass", "fail" and "na" map to their verdicts; anything
 * else, including an empty string, is NotAvailable.
 */
[[nodiscard]] MetricStatus normalizeStatus(std::string_view text);

/**
 * @brief One line of the QA Results table
 */
struct MetricRow {
    std::string label;
    std::optional<std::string> value;
    std::string expected;
    MetricStatus status = MetricStatus::NotAvailable;
    std::string notes;

    /// Value text, or the em-dash placeholder when absent
    [[nodiscard]] std::string displayValue() const;

    bool operator==(const MetricRow&) const = default;
};

struct KeyValueRow {
    std::string label;
    std::string value;

    bool operator==(const KeyValueRow&) const = default;
};

/// Label/value table, e.g. "Input Summary"
struct KeyValueSection {
    std::string name;
    std::vector<KeyValueRow> rows;

    bool operator==(const KeyValueSection&) const = default;
};

/// Verdict table, e.g. "QA Results"
struct MetricsSection {
    std::string name;
    std::vector<MetricRow> rows;

    bool operator==(const MetricsSection&) const = default;
};

using Section = std::variant<KeyValueSection, MetricsSection>;

/// Name of either section kind
[[nodiscard]] const std::string& sectionName(const Section& section);

/**
 * @brief A generated plot file
 *
 * fileName is unique per generation; url is the reference a web layer
 * serves it under.
 */
struct PlotSpec {
    std::string title;
    std::string fileName;
    std::string url;

    bool operator==(const PlotSpec&) const = default;
};

enum class ReportStatus {
    Ok,
    Error
};

/// "ok" or "error"
[[nodiscard]] std::string toString(ReportStatus status);

/**
 * @brief Immutable QA report
 */
class Report {
public:
    Report(std::string title,
           ReportStatus status,
           std::string message,
           std::vector<PlotSpec> plots,
           std::vector<Section> sections);

    [[nodiscard]] const std::string& title() const noexcept { return title_; }
    [[nodiscard]] ReportStatus status() const noexcept { return status_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::vector<PlotSpec>& plots() const noexcept { return plots_; }
    [[nodiscard]] const std::vector<Section>& sections() const noexcept { return sections_; }

    [[nodiscard]] bool isOk() const noexcept { return status_ == ReportStatus::Ok; }

    /// First metrics table, or nullptr
    [[nodiscard]] const MetricsSection* metrics() const;

    /// First key/value table, or nullptr
    [[nodiscard]] const KeyValueSection* summary() const;

    /// Row of the metrics table by label, or nullptr
    [[nodiscard]] const MetricRow* findMetric(std::string_view label) const;

private:
    std::string title_;
    ReportStatus status_;
    std::string message_;
    std::vector<PlotSpec> plots_;
    std::vector<Section> sections_;
};

} // namespace acr_qa::services
