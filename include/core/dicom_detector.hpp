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
 * @file dicom_detector.hpp
 * @brief Recursive discovery and classification of DICOM files
 * @details MRI exports frequently omit the ".dcm" extension and sometimes the
 *          128-byte preamble with the "DICM" marker, so classification does
 *          not look at file names. Two stages run in a fixed order and stop at
 *          the first that accepts the file:
 *          1. magic header: bytes 128..131 equal "DICM"
 *          2. identifying tags: a metadata-only parse finds a non-empty SOP
 *             Class UID, Study/Series/SOP Instance UID or Modality
 *
 * ## Thread Safety
 * - DicomDetector is stateless apart from the injected reader and may be
 *   shared between threads when the reader is.
 * - A CandidateFileSequence iterator must stay on one thread.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace acr_qa::core {

class IDicomReader;

/// Result of a single classification stage
enum class DetectionOutcome {
    Found,
    NotFound
};

/// Stage that accepted a file
enum class DetectionStage {
    None,
    MagicHeader,
    IdentifyingTags
};

struct DetectionResult {
    DetectionOutcome outcome = DetectionOutcome::NotFound;
    DetectionStage stage = DetectionStage::None;

    [[nodiscard]] bool isDicom() const { return outcome == DetectionOutcome::Found; }
};

/// A discovered file and its classification
struct CandidateFile {
    std::filesystem::path path;
    bool looksLikeDicom = false;
};

/**
 * @brief Lazy walk over the regular files below a root directory
 *
 * Archives (".zip", any case) are not candidates. Each directory yields its
 * files in name order before descending into its sub-directories, also in
 * name order, so the sequence is deterministic for a given tree. Calling
 * begin() again restarts the walk. Unreadable directories and symbolic links
 * to directories are skipped.
 */
class CandidateFileSequence {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::filesystem::path;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::filesystem::path*;
        using reference = const std::filesystem::path&;

        Iterator() = default;

        reference operator*() const;
        pointer operator->() const { return &**this; }
        Iterator& operator++();
        void operator++(int) { ++*this; }

        friend bool operator==(const Iterator& a, const Iterator& b) {
            return a.atEnd() == b.atEnd() && (a.atEnd() || a.state_ == b.state_);
        }

    private:
        friend class CandidateFileSequence;
        struct State;

        explicit Iterator(const std::filesystem::path& root);
        [[nodiscard]] bool atEnd() const;
        void advance();

        std::shared_ptr<State> state_;
    };

    explicit CandidateFileSequence(std::filesystem::path root);

    [[nodiscard]] Iterator begin() const;
    [[nodiscard]] Iterator end() const;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    /// true for names ending in ".zip", compared case-insensitively
    [[nodiscard]] static bool isArchiveName(const std::filesystem::path& path);

private:
    std::filesystem::path root_;
};

/**
 * @brief Classifies files as DICOM by content
 *
 * @code
 * auto reader = std::make_shared<GdcmDicomReader>();
 * DicomDetector detector(reader);
 * auto paths = detector.findDicomFiles(workDir);
 * @endcode
 */
class DicomDetector {
public:
    /// Bytes read for the magic header check
    static constexpr std::size_t kPreambleLength = 132;

    explicit DicomDetector(std::shared_ptr<const IDicomReader> reader);

    /**
     * @brief Stage 1: "DICM" at offset 128
     *
     * Short files and read errors yield NotFound; never throws.
     */
    [[nodiscard]] static DetectionOutcome checkMagicHeader(const std::filesystem::path& filePath);

    /**
     * @brief Stage 2: metadata-only parse of the identifying attributes
     *
     * Parse failures yield NotFound; never throws.
     */
    [[nodiscard]] DetectionOutcome checkIdentifyingTags(const std::filesystem::path& filePath) const;

    /**
     * @brief Run both stages in order, stopping at the first Found
     */
    [[nodiscard]] DetectionResult classify(const std::filesystem::path& filePath) const;

    [[nodiscard]] CandidateFile inspect(const std::filesystem::path& filePath) const;

    /**
     * @brief Paths below root classified as DICOM, in walk order
     */
    [[nodiscard]] std::vector<std::filesystem::path>
    findDicomFiles(const std::filesystem::path& root) const;

private:
    std::shared_ptr<const IDicomReader> reader_;
};

} // namespace acr_qa::core
