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
 * @file archive_ingestor.hpp
 * @brief Safe extraction of uploaded ZIP archives into a working directory
 * @details Every member is resolved against the canonical target directory
 *          before it is written. Members that would land outside the target
 *          (zip-slip), absolute member names and damaged members are skipped
 *          individually; the rest of the archive is still extracted.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace acr_qa::core {

class ZipArchive;

/// Uploaded archive bytes with the name the client gave them
struct RawArchive {
    std::string name;
    std::vector<uint8_t> bytes;
};

/// Reason a single member was not extracted
enum class SkipReason {
    PathTraversal,
    EmptyName,
    DamagedEntry,
    WriteFailed
};

[[nodiscard]] std::string toString(SkipReason reason);

struct SkippedEntry {
    std::string name;
    SkipReason reason;
    std::string detail;
};

/// Outcome of a completed extraction
struct ExtractionSummary {
    size_t entriesTotal = 0;
    size_t filesWritten = 0;
    size_t directoriesCreated = 0;
    std::vector<SkippedEntry> skipped;

    [[nodiscard]] size_t skippedCount() const { return skipped.size(); }
};

/**
 * @brief Error information for archive ingestion
 *
 * Only failures of the archive as a whole are reported here; member level
 * failures end up in ExtractionSummary::skipped.
 */
struct IngestError {
    enum class Code {
        Success,
        ArchiveUnreadable,
        InvalidArchive,
        TargetDirectoryFailed
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::ArchiveUnreadable: return "Archive unreadable: " + message;
            case Code::InvalidArchive: return "Invalid archive: " + message;
            case Code::TargetDirectoryFailed: return "Target directory failed: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Extracts ZIP archives into a target directory
 *
 * Stateless; one instance may be shared, but concurrent extractions must
 * use distinct target directories.
 *
 * @code
 * ArchiveIngestor ingestor;
 * auto summary = ingestor.extractFile(uploadPath, jobDir);
 * if (summary) {
 *     // summary->filesWritten files are now under jobDir
 * }
 * @endcode
 */
class ArchiveIngestor {
public:
    /**
     * @brief Extract an in-memory archive; the blob is released afterwards
     * @param archive Archive bytes, consumed by the call
     * @param targetDirectory Destination, created if missing
     */
    [[nodiscard]] std::expected<ExtractionSummary, IngestError>
    extract(RawArchive archive, const std::filesystem::path& targetDirectory) const;

    /**
     * @brief Extract an archive stored on disk
     */
    [[nodiscard]] std::expected<ExtractionSummary, IngestError>
    extractFile(const std::filesystem::path& archivePath,
                const std::filesystem::path& targetDirectory) const;

    /**
     * @brief Extract an already parsed archive
     */
    [[nodiscard]] std::expected<ExtractionSummary, IngestError>
    extractArchive(const ZipArchive& archive,
                   const std::filesystem::path& targetDirectory) const;

    /**
     * @brief Resolve a member name against a canonical base directory
     * @return Absolute destination, or nullopt when it is not strictly inside base
     */
    [[nodiscard]] static std::optional<std::filesystem::path>
    resolveEntryPath(const std::filesystem::path& canonicalBase,
                     const std::string& entryName);
};

} // namespace acr_qa::core
