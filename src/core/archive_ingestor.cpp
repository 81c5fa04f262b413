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

#include "core/archive_ingestor.hpp"
#include "core/logging.hpp"
#include "core/zip_archive.hpp"

#include <algorithm>
#include <fstream>

namespace acr_qa::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ArchiveIngestor");
    return logger;
}

/// true when candidate is base itself or lies below it (both normalized)
bool isWithin(const std::filesystem::path& base, const std::filesystem::path& candidate) {
    auto rel = candidate.lexically_relative(base);
    if (rel.empty()) {
        return false;
    }
    auto first = rel.begin();
    return *first != "..";
}

/// Deepest ancestor of path (or path itself) that is present on disk
std::filesystem::path deepestExisting(std::filesystem::path path) {
    std::error_code ec;
    while (path.has_relative_path()
           && !std::filesystem::exists(std::filesystem::symlink_status(path, ec))) {
        path = path.parent_path();
    }
    return path;
}

/// Canonical form of the present part of dir stays at or under base
bool staysInside(const std::filesystem::path& base, const std::filesystem::path& dir) {
    std::error_code ec;
    auto real = std::filesystem::weakly_canonical(deepestExisting(dir), ec);
    return !ec && (real == base || isWithin(base, real));
}

} // anonymous namespace

std::string toString(SkipReason reason) {
    switch (reason) {
        case SkipReason::PathTraversal: return "path outside target directory";
        case SkipReason::EmptyName:     return "empty entry name";
        case SkipReason::DamagedEntry:  return "damaged entry";
        case SkipReason::WriteFailed:   return "write failed";
    }
    return "unknown";
}

std::optional<std::filesystem::path>
ArchiveIngestor::resolveEntryPath(const std::filesystem::path& canonicalBase,
                                  const std::string& entryName) {
    std::string name = entryName;
    std::replace(name.begin(), name.end(), '\\', '/');

    std::filesystem::path member(name);
    if (member.empty() || member.has_root_path()) {
        return std::nullopt;
    }

    auto resolved = (canonicalBase / member).lexically_normal();
    // "dir/" normalizes with a trailing empty filename
    if (!resolved.has_filename()) {
        resolved = resolved.parent_path();
    }

    auto rel = resolved.lexically_relative(canonicalBase);
    if (rel.empty() || rel == "." || *rel.begin() == "..") {
        return std::nullopt;
    }
    return resolved;
}

std::expected<ExtractionSummary, IngestError>
ArchiveIngestor::extract(RawArchive archive,
                         const std::filesystem::path& targetDirectory) const {
    RawArchive owned = std::move(archive);
    getLogger()->info("Extracting '{}' ({} bytes) into {}",
                      owned.name, owned.bytes.size(), targetDirectory.string());

    auto zip = ZipArchive::readFromBuffer(std::move(owned.bytes));
    if (!zip) {
        return std::unexpected(IngestError{
            IngestError::Code::InvalidArchive,
            owned.name + ": " + toString(zip.error())
        });
    }
    return extractArchive(*zip, targetDirectory);
}

std::expected<ExtractionSummary, IngestError>
ArchiveIngestor::extractFile(const std::filesystem::path& archivePath,
                             const std::filesystem::path& targetDirectory) const {
    getLogger()->info("Extracting {} into {}", archivePath.string(), targetDirectory.string());

    auto zip = ZipArchive::readFrom(archivePath);
    if (!zip) {
        auto code = (zip.error() == ZipError::InvalidArchive)
            ? IngestError::Code::InvalidArchive
            : IngestError::Code::ArchiveUnreadable;
        return std::unexpected(IngestError{
            code, archivePath.string() + ": " + toString(zip.error())
        });
    }
    return extractArchive(*zip, targetDirectory);
}

std::expected<ExtractionSummary, IngestError>
ArchiveIngestor::extractArchive(const ZipArchive& archive,
                                const std::filesystem::path& targetDirectory) const {
    std::error_code ec;
    std::filesystem::create_directories(targetDirectory, ec);
    if (ec) {
        return std::unexpected(IngestError{
            IngestError::Code::TargetDirectoryFailed,
            targetDirectory.string() + ": " + ec.message()
        });
    }

    auto base = std::filesystem::weakly_canonical(std::filesystem::absolute(targetDirectory), ec);
    if (ec) {
        return std::unexpected(IngestError{
            IngestError::Code::TargetDirectoryFailed,
            targetDirectory.string() + ": " + ec.message()
        });
    }

    ExtractionSummary summary;
    summary.entriesTotal = archive.entries().size();

    auto skip = [&summary](const ZipEntry& entry, SkipReason reason, std::string detail) {
        getLogger()->warn("Skipping entry '{}': {} {}", entry.name, toString(reason), detail);
        summary.skipped.push_back(SkippedEntry{entry.name, reason, std::move(detail)});
    };

    for (const auto& entry : archive.entries()) {
        if (entry.name.empty()) {
            skip(entry, SkipReason::EmptyName, "");
            continue;
        }

        auto destination = resolveEntryPath(base, entry.name);
        if (!destination) {
            skip(entry, SkipReason::PathTraversal, "");
            continue;
        }

        // A symlink already present in the tree must not redirect the write
        auto parent = entry.isDirectory() ? *destination : destination->parent_path();
        if (!staysInside(base, parent)) {
            skip(entry, SkipReason::PathTraversal, "resolved through link");
            continue;
        }

        if (entry.isDirectory()) {
            std::filesystem::create_directories(*destination, ec);
            if (ec) {
                skip(entry, SkipReason::WriteFailed, ec.message());
                continue;
            }
            ++summary.directoriesCreated;
            continue;
        }

        if (!entry.isReadable()) {
            skip(entry, SkipReason::DamagedEntry, toString(*entry.error));
            continue;
        }

        if (std::filesystem::is_symlink(std::filesystem::symlink_status(*destination, ec))) {
            skip(entry, SkipReason::PathTraversal, "destination is a link");
            continue;
        }

        std::filesystem::create_directories(parent, ec);
        if (ec) {
            skip(entry, SkipReason::WriteFailed, ec.message());
            continue;
        }
        if (!staysInside(base, parent)) {
            skip(entry, SkipReason::PathTraversal, "resolved through link");
            continue;
        }

        std::ofstream out(*destination, std::ios::binary | std::ios::trunc);
        if (!out) {
            skip(entry, SkipReason::WriteFailed, destination->string());
            continue;
        }

        auto written = archive.streamEntry(entry, [&out](const uint8_t* chunk, size_t size) {
            out.write(reinterpret_cast<const char*>(chunk), static_cast<std::streamsize>(size));
            return static_cast<bool>(out);
        });
        out.close();

        if (!written || !out) {
            std::filesystem::remove(*destination, ec);
            if (!written && written.error() != ZipError::FileWriteFailed) {
                skip(entry, SkipReason::DamagedEntry, toString(written.error()));
            } else {
                skip(entry, SkipReason::WriteFailed, destination->string());
            }
            continue;
        }
        ++summary.filesWritten;
    }

    getLogger()->info("Extraction completed: {} entries, {} files written, {} skipped",
                      summary.entriesTotal, summary.filesWritten, summary.skippedCount());
    return summary;
}

} // namespace acr_qa::core
