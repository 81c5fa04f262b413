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
 * @file roi_sampler.hpp
 * @brief Rectangular ROI statistics and line profiles on a 2-D slice
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include "core/dicom_dataset.hpp"

namespace acr_qa::services {

using core::PixelImageType;

/**
 * @brief Half-open pixel rectangle [rowStart, rowEnd) x [colStart, colEnd)
 */
struct RoiBounds {
    int rowStart = 0;
    int rowEnd = 0;
    int colStart = 0;
    int colEnd = 0;

    /**
     * @brief Bounds from fractions of the image extent
     *
     * Each edge is truncated toward zero, e.g. 0.40 of 64 rows is row 25.
     */
    [[nodiscard]] static RoiBounds fromFractions(int rows, int columns,
                                                 double rowStartFraction,
                                                 double rowEndFraction,
                                                 double colStartFraction,
                                                 double colEndFraction);

    /// Every edge clamped into [0, rows] / [0, columns]
    [[nodiscard]] RoiBounds clampedTo(int rows, int columns) const;

    [[nodiscard]] int64_t pixelCount() const;

    [[nodiscard]] bool isEmpty() const { return pixelCount() == 0; }
};

/// Statistics over the pixels of one ROI
struct RegionStatistics {
    double mean = 0.0;

    /// Population standard deviation
    double stdDev = 0.0;

    int64_t pixelCount = 0;
};

/**
 * @brief ROI sampling helpers for the QA metrics
 */
class RoiSampler {
public:
    /**
     * @brief Mean and standard deviation inside an ROI
     *
     * The ROI is clamped to the image first. An empty ROI or a null image
     * yields zeroed statistics.
     */
    [[nodiscard]] static RegionStatistics measure(const PixelImageType* image,
                                                  const RoiBounds& roi);

    /// Pixel values along one row, empty when the row is outside the image
    [[nodiscard]] static std::vector<double> rowProfile(const PixelImageType* image, int row);

    /// Pixel values along one column, empty when the column is outside the image
    [[nodiscard]] static std::vector<double> columnProfile(const PixelImageType* image, int column);

    [[nodiscard]] static int rowCount(const PixelImageType* image);
    [[nodiscard]] static int columnCount(const PixelImageType* image);
};

} // namespace acr_qa::services
