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
 * @file dicom_loader.hpp
 * @brief Batch decoding of classified DICOM files
 * @details Decodes each path through the injected IDicomReader. Files that
 *          fail to decode or carry no Pixel Data element are dropped from the
 *          batch; the remaining datasets keep the order of the input paths.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <vector>

#include "core/dicom_dataset.hpp"

namespace acr_qa::core {

class IDicomReader;

/// Per-batch counters for the input summary and logs
struct LoadStatistics {
    size_t requested = 0;
    size_t loaded = 0;
    size_t withoutPixelData = 0;
    size_t failed = 0;
};

/**
 * @brief DICOM batch loader
 *
 * Files without Pixel Data are dropped; files whose pixels cannot be
 * decoded are kept so their attributes still feed the tag-based metrics.
 */
class DicomLoader {
public:
    explicit DicomLoader(std::shared_ptr<const IDicomReader> reader);

    /**
     * @brief Decode one file, requiring Pixel Data
     * @return Dataset, or MissingPixelData / the reader's error
     */
    [[nodiscard]] std::expected<DicomDataset, DicomErrorInfo>
    loadFile(const std::filesystem::path& filePath) const;

    /**
     * @brief Decode a batch, skipping files that fail
     * @param filePaths Paths in scan order
     * @param statistics Optional counters filled for the batch
     */
    [[nodiscard]] std::vector<DicomDataset>
    loadAll(const std::vector<std::filesystem::path>& filePaths,
            LoadStatistics* statistics = nullptr) const;

private:
    std::shared_ptr<const IDicomReader> reader_;
};

} // namespace acr_qa::core
