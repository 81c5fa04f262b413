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

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace acr_qa::core {

/**
 * @brief Error codes for ZIP operations
 */
enum class ZipError {
    FileOpenFailed,
    FileWriteFailed,
    FileReadFailed,
    CompressionFailed,
    DecompressionFailed,
    ChecksumMismatch,
    UnsupportedCompression,
    InvalidArchive,
    InvalidEntry,
    EntryNotFound
};

[[nodiscard]] std::string toString(ZipError error);

/// Where a member read from an archive lives inside the source buffer
struct StoredMember {
    uint16_t method = 0;
    uint32_t crc32 = 0;
    uint32_t compressedSize = 0;
    uint32_t uncompressedSize = 0;
    size_t dataOffset = 0;
};

/**
 * @brief One member of a ZIP archive, in central directory order
 *
 * Members read from an archive are decoded on demand through
 * ZipArchive::streamEntry; only entries added for writing carry data.
 * A member whose local header is damaged keeps its name and carries the
 * error, so the rest of the archive stays usable. Payload damage (inflate
 * failure, size or CRC mismatch) surfaces when the member is decoded.
 */
struct ZipEntry {
    std::string name;
    std::vector<uint8_t> data;
    std::optional<ZipError> error;
    std::optional<StoredMember> stored;

    [[nodiscard]] bool isDirectory() const {
        return !name.empty() && (name.back() == '/' || name.back() == '\\');
    }

    [[nodiscard]] bool isReadable() const { return !error.has_value(); }
};

/**
 * @brief Lightweight ZIP archive reader/writer using system zlib
 *
 * Supports STORE and DEFLATE members. Reading tolerates damaged members:
 * only a missing or truncated central directory fails the whole archive.
 * Member payloads are inflated in fixed-size chunks when requested, and a
 * member may never produce more bytes than its central directory declares.
 *
 * Usage (read):
 * @code
 * auto archive = ZipArchive::readFrom("/path/to/upload.zip");
 * if (archive) {
 *     for (const auto& entry : archive->entries()) {
 *         archive->streamEntry(entry, [&](const uint8_t* chunk, size_t size) {
 *             out.write(reinterpret_cast<const char*>(chunk), size);
 *             return static_cast<bool>(out);
 *         });
 *     }
 * }
 * @endcode
 */
class ZipArchive {
public:
    /// Receives decoded bytes; returning false aborts with FileWriteFailed
    using ChunkSink = std::function<bool(const uint8_t* chunk, size_t size)>;

    ZipArchive() = default;

    /**
     * @brief Add an entry to the archive (for writing)
     * @param name Entry name (path within the archive, stored verbatim)
     * @param data Entry content
     */
    void addEntry(const std::string& name, const std::vector<uint8_t>& data);

    /**
     * @brief Add a string entry to the archive (for writing)
     */
    void addEntry(const std::string& name, const std::string& content);

    /**
     * @brief Serialize the archive to bytes
     */
    [[nodiscard]] std::expected<std::vector<uint8_t>, ZipError> toBytes() const;

    /**
     * @brief Write the archive to a file
     * @param path Output file path
     * @return Success or ZipError
     */
    [[nodiscard]] std::expected<void, ZipError>
    writeTo(const std::filesystem::path& path) const;

    /**
     * @brief Read an archive from a file
     */
    [[nodiscard]] static std::expected<ZipArchive, ZipError>
    readFrom(const std::filesystem::path& path);

    /**
     * @brief Read an archive from an in-memory byte blob (copied)
     */
    [[nodiscard]] static std::expected<ZipArchive, ZipError>
    readFromBuffer(const std::vector<uint8_t>& bytes);

    /**
     * @brief Read an archive taking ownership of the byte blob
     */
    [[nodiscard]] static std::expected<ZipArchive, ZipError>
    readFromBuffer(std::vector<uint8_t>&& bytes);

    /**
     * @brief Decode one member chunk by chunk
     * @param entry An element of entries()
     * @param sink Called for each decoded chunk, in order
     * @return Success, the entry's header error, or the decoding error
     */
    [[nodiscard]] std::expected<void, ZipError>
    streamEntry(const ZipEntry& entry, const ChunkSink& sink) const;

    /**
     * @brief Read a specific entry
     * @return Entry data, EntryNotFound, or the entry's own error
     */
    [[nodiscard]] std::expected<std::vector<uint8_t>, ZipError>
    readEntry(const std::string& name) const;

    [[nodiscard]] bool hasEntry(const std::string& name) const;

    [[nodiscard]] const std::vector<ZipEntry>& entries() const { return entries_; }

    [[nodiscard]] std::vector<std::string> entryNames() const;

private:
    [[nodiscard]] std::expected<std::vector<uint8_t>, ZipError>
    decodeEntry(const ZipEntry& entry) const;

    std::vector<ZipEntry> entries_;
    std::shared_ptr<const std::vector<uint8_t>> source_;
};

} // namespace acr_qa::core
