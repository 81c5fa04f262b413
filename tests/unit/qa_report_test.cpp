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

#include "services/qa/qa_report.hpp"
#include "services/qa/report_assembler.hpp"

#include <gtest/gtest.h>

namespace acr_qa::services::test {

// ============================================================================
// Status values
// ============================================================================

TEST(MetricStatusTest, WireNames) {
    EXPECT_EQ(toString(MetricStatus::Pass), "pass");
    EXPECT_EQ(toString(MetricStatus::Fail), "fail");
    EXPECT_EQ(toString(MetricStatus::NotAvailable), "na");
    EXPECT_EQ(toString(ReportStatus::Ok), "ok");
    EXPECT_EQ(toString(ReportStatus::Error), "error");
}

TEST(MetricStatusTest, NormalizationFoldsUnknownTextToNotAvailable) {
    EXPECT_EQ(normalizeStatus("pass"), MetricStatus::Pass);
    EXPECT_EQ(normalizeStatus("PASS"), MetricStatus::Pass);
    EXPECT_EQ(normalizeStatus("Fail"), MetricStatus::Fail);
    EXPECT_EQ(normalizeStatus("na"), MetricStatus::NotAvailable);
    EXPECT_EQ(normalizeStatus(""), MetricStatus::NotAvailable);
    EXPECT_EQ(normalizeStatus("warning"), MetricStatus::NotAvailable);
}

TEST(MetricRowTest, AbsentValueDisplaysAsEmDash) {
    MetricRow row{"SNR", std::nullopt, ">= 20", MetricStatus::NotAvailable, ""};
    EXPECT_EQ(row.displayValue(), "\xE2\x80\x94");

    row.value = "42.00";
    EXPECT_EQ(row.displayValue(), "42.00");
}

// ============================================================================
// Assembly
// ============================================================================

TEST(ReportAssemblerTest, AssembleBuildsSummaryThenResults) {
    std::vector<MetricRow> rows{
        {"SNR", "120.00", ">= 20", MetricStatus::Pass, ""},
    };
    std::vector<PlotSpec> plots{
        {"Slice thickness", "slice_abc.svg", "/plots/slice_abc.svg"},
    };

    auto report = ReportAssembler::assemble(InputSummary{12, 10, 256, 192}, rows, plots);

    EXPECT_TRUE(report.isOk());
    EXPECT_EQ(report.title(), "ACR QA Report");
    EXPECT_EQ(report.message(), "Report generated.");
    ASSERT_EQ(report.sections().size(), 2u);
    EXPECT_EQ(sectionName(report.sections()[0]), "Input Summary");
    EXPECT_EQ(sectionName(report.sections()[1]), "QA Results");
    EXPECT_EQ(report.plots(), plots);

    const auto* summary = report.summary();
    ASSERT_NE(summary, nullptr);
    ASSERT_EQ(summary->rows.size(), 3u);
    EXPECT_EQ(summary->rows[0], (KeyValueRow{"DICOM files detected", "12"}));
    EXPECT_EQ(summary->rows[1], (KeyValueRow{"Slices read", "10"}));
    EXPECT_EQ(summary->rows[2], (KeyValueRow{"Image shape", "256 x 192"}));

    const auto* snr = report.findMetric("SNR");
    ASSERT_NE(snr, nullptr);
    EXPECT_EQ(snr->status, MetricStatus::Pass);
    EXPECT_EQ(report.findMetric("Ghosting"), nullptr);
}

TEST(ReportAssemblerTest, ErrorReportHasNoTables) {
    auto report = ReportAssembler::error("No DICOM datasets provided.");
    EXPECT_FALSE(report.isOk());
    EXPECT_EQ(report.status(), ReportStatus::Error);
    EXPECT_EQ(report.title(), "ACR QA Report");
    EXPECT_EQ(report.message(), "No DICOM datasets provided.");
    EXPECT_TRUE(report.sections().empty());
    EXPECT_TRUE(report.plots().empty());
    EXPECT_EQ(report.metrics(), nullptr);
    EXPECT_EQ(report.summary(), nullptr);
}

} // namespace acr_qa::services::test
