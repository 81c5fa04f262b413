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
 * @file qa_pipeline.hpp
 * @brief End-to-end QA run over an upload
 * @details Wires the archive ingestor, DICOM detector, loader and metrics
 *          engine together. Every outcome, including "nothing usable in the
 *          upload", is returned as a Report; no stage throws to the caller.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <expected>
#include <filesystem>
#include <memory>

#include "services/export/report_serializer.hpp"
#include "services/qa/qa_metrics_engine.hpp"
#include "services/qa/qa_report.hpp"

namespace acr_qa::core {
class IDicomReader;
}

namespace acr_qa::services {

/**
 * @brief Facade running a complete QA job
 *
 * @code
 * auto reader = std::make_shared<core::GdcmDicomReader>();
 * QaPipeline pipeline(reader, "/srv/plots");
 * auto report = pipeline.runOnUpload("upload.zip", "/srv/acr_qa_work");
 * QaPipeline::writeReport(report, "report.json");
 * @endcode
 */
class QaPipeline {
public:
    static constexpr const char* kNoDicomMessage =
        "No DICOM files found inside the ZIP. Please ensure the ZIP contains "
        "MRI DICOM files (it can be nested in folders).";

    QaPipeline(std::shared_ptr<const core::IDicomReader> reader,
               std::filesystem::path plotDirectory,
               EngineOptions options = {});
    ~QaPipeline();

    QaPipeline(const QaPipeline&) = delete;
    QaPipeline& operator=(const QaPipeline&) = delete;
    QaPipeline(QaPipeline&&) noexcept;
    QaPipeline& operator=(QaPipeline&&) noexcept;

    /**
     * @brief Scan an extracted upload, load the slices and compute metrics
     */
    [[nodiscard]] Report runOnDirectory(const std::filesystem::path& workDirectory) const;

    /**
     * @brief Extract a ZIP upload into workDirectory, then run on it
     */
    [[nodiscard]] Report runOnArchive(const std::filesystem::path& archivePath,
                                      const std::filesystem::path& workDirectory) const;

    /**
     * @brief Extract a ZIP upload into a fresh job directory below workRoot
     *
     * Every call gets its own "job_<id>" directory, so files left by
     * earlier uploads are never scanned again.
     */
    [[nodiscard]] Report runOnUpload(const std::filesystem::path& archivePath,
                                     const std::filesystem::path& workRoot) const;

    /// Unused job directory path below workRoot (not created)
    [[nodiscard]] static std::filesystem::path
    newJobDirectory(const std::filesystem::path& workRoot);

    [[nodiscard]] static std::expected<void, SerializationError>
    writeReport(const Report& report, const std::filesystem::path& filePath);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace acr_qa::services
