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
 * @file dicom_dataset.hpp
 * @brief In-memory representation of one decoded DICOM file
 * @details Holds the tag values the QA metrics consume plus an optional 2-D
 *          float pixel array. Tag values keep their DICOM text form; numeric
 *          coercion happens where a metric needs the number, so a malformed
 *          value degrades that metric only.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <itkImage.h>

namespace acr_qa::core {

/// Pixel array type: index[0] is the column, index[1] is the row
using PixelImageType = itk::Image<float, 2>;

/// Error types for DICOM reading
enum class DicomError {
    FileNotFound,
    FileReadFailed,
    InvalidDicomFormat,
    DecodingFailed,
    MissingPixelData
};

/// Error result with message
struct DicomErrorInfo {
    DicomError code;
    std::string message;
};

/**
 * @brief The identifying attributes read during metadata sniffing
 */
struct IdentifyingTags {
    std::string sopClassUid;
    std::string studyInstanceUid;
    std::string seriesInstanceUid;
    std::string sopInstanceUid;
    std::string patientId;
    std::string modality;

    /// Patient ID alone does not identify a DICOM object
    [[nodiscard]] bool identifiesDicom() const {
        return !sopClassUid.empty() || !studyInstanceUid.empty()
            || !seriesInstanceUid.empty() || !sopInstanceUid.empty()
            || !modality.empty();
    }
};

/**
 * @brief Decoded DICOM file
 */
struct DicomDataset {
    std::filesystem::path path;

    // Image Pixel Module
    std::optional<int> rows;
    std::optional<int> columns;

    /// (0018,0050) as stored, decimal string
    std::optional<std::string> sliceThickness;

    /// (0028,0030) components as stored: row spacing, column spacing
    std::vector<std::string> pixelSpacing;

    IdentifyingTags identity;

    /// (7FE0,0010) element present in the file
    bool hasPixelData = false;

    /// Decoded first frame, null when decoding failed
    PixelImageType::Pointer pixels;

    [[nodiscard]] bool hasPixelArray() const { return pixels.IsNotNull(); }
};

} // namespace acr_qa::core
