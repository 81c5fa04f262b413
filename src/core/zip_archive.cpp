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

#include "core/zip_archive.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <utility>
#include <zlib.h>

namespace acr_qa::core {

// ZIP format constants
namespace {

constexpr uint32_t kLocalFileHeaderSignature = 0x04034b50;
constexpr uint32_t kCentralDirHeaderSignature = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr uint16_t kVersionNeeded = 20;        // 2.0
constexpr uint16_t kVersionMadeBy = 0x031E;    // Unix, version 3.0
constexpr uint16_t kCompressionDeflate = 8;
constexpr uint16_t kCompressionStore = 0;
constexpr uint16_t kFlagEncrypted = 0x0001;

constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kEndOfCentralDirSize = 22;
constexpr size_t kInflateChunkSize = 64 * 1024;

// Write a little-endian integer to a buffer
template <typename T>
void writeLE(std::vector<uint8_t>& buf, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf.push_back(static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    }
}

// Read a little-endian integer from a buffer at offset
template <typename T>
T readLE(const uint8_t* data, size_t offset) {
    T result = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        result |= static_cast<T>(static_cast<T>(data[offset + i]) << (i * 8));
    }
    return result;
}

std::expected<std::vector<uint8_t>, ZipError>
deflateData(const std::vector<uint8_t>& input) {
    if (input.empty()) {
        return std::vector<uint8_t>{};
    }

    uLong compBound = compressBound(static_cast<uLong>(input.size()));
    std::vector<uint8_t> output(compBound);

    z_stream stream{};
    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = output.data();
    stream.avail_out = static_cast<uInt>(output.size());

    // Raw deflate (-MAX_WBITS) for ZIP compatibility
    int ret = deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                           -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        return std::unexpected(ZipError::CompressionFailed);
    }

    ret = deflate(&stream, Z_FINISH);
    deflateEnd(&stream);

    if (ret != Z_STREAM_END) {
        return std::unexpected(ZipError::CompressionFailed);
    }

    output.resize(stream.total_out);
    return output;
}

/// Validate a member's local header and locate its payload
std::expected<StoredMember, ZipError>
locateMember(const std::vector<uint8_t>& data,
             uint32_t localOffset,
             uint16_t flags,
             uint16_t method,
             uint32_t crc,
             uint32_t compSize,
             uint32_t uncompSize) {
    if (flags & kFlagEncrypted) {
        return std::unexpected(ZipError::UnsupportedCompression);
    }
    if (method != kCompressionStore && method != kCompressionDeflate) {
        return std::unexpected(ZipError::UnsupportedCompression);
    }

    size_t local = localOffset;
    if (local + kLocalHeaderSize > data.size()
        || readLE<uint32_t>(data.data(), local) != kLocalFileHeaderSignature) {
        return std::unexpected(ZipError::InvalidEntry);
    }

    uint16_t localNameLen = readLE<uint16_t>(data.data(), local + 26);
    uint16_t localExtraLen = readLE<uint16_t>(data.data(), local + 28);
    size_t dataStart = local + kLocalHeaderSize + localNameLen + localExtraLen;

    if (dataStart > data.size() || compSize > data.size() - dataStart) {
        return std::unexpected(ZipError::InvalidEntry);
    }
    if (method == kCompressionStore && compSize != uncompSize) {
        return std::unexpected(ZipError::InvalidEntry);
    }

    return StoredMember{method, crc, compSize, uncompSize, dataStart};
}

/// Inflate a raw DEFLATE payload in fixed-size chunks
std::expected<void, ZipError>
inflateChunks(const uint8_t* input,
              const StoredMember& member,
              const ZipArchive::ChunkSink& sink,
              uLong& crc) {
    if (member.compressedSize == 0 && member.uncompressedSize == 0) {
        return {};
    }

    z_stream stream{};
    stream.next_in = const_cast<Bytef*>(input);
    stream.avail_in = static_cast<uInt>(member.compressedSize);

    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        return std::unexpected(ZipError::DecompressionFailed);
    }

    std::vector<uint8_t> chunk(kInflateChunkSize);
    uint64_t produced = 0;
    int ret = Z_OK;

    while (ret != Z_STREAM_END) {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<uInt>(chunk.size());

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&stream);
            return std::unexpected(ZipError::DecompressionFailed);
        }

        size_t have = chunk.size() - stream.avail_out;
        produced += have;
        if (produced > member.uncompressedSize) {
            inflateEnd(&stream);
            return std::unexpected(ZipError::DecompressionFailed);
        }
        if (have == 0) {
            continue;
        }

        crc = ::crc32(crc, chunk.data(), static_cast<uInt>(have));
        if (!sink(chunk.data(), have)) {
            inflateEnd(&stream);
            return std::unexpected(ZipError::FileWriteFailed);
        }
    }
    inflateEnd(&stream);

    if (produced != member.uncompressedSize) {
        return std::unexpected(ZipError::DecompressionFailed);
    }
    return {};
}

} // anonymous namespace

std::string toString(ZipError error) {
    switch (error) {
        case ZipError::FileOpenFailed:         return "file open failed";
        case ZipError::FileWriteFailed:        return "file write failed";
        case ZipError::FileReadFailed:         return "file read failed";
        case ZipError::CompressionFailed:      return "compression failed";
        case ZipError::DecompressionFailed:    return "decompression failed";
        case ZipError::ChecksumMismatch:       return "CRC-32 mismatch";
        case ZipError::UnsupportedCompression: return "unsupported compression or encryption";
        case ZipError::InvalidArchive:         return "invalid archive";
        case ZipError::InvalidEntry:           return "invalid entry";
        case ZipError::EntryNotFound:          return "entry not found";
    }
    return "unknown error";
}

void ZipArchive::addEntry(const std::string& name, const std::vector<uint8_t>& data) {
    entries_.push_back(ZipEntry{name, data, std::nullopt, std::nullopt});
}

void ZipArchive::addEntry(const std::string& name, const std::string& content) {
    addEntry(name, std::vector<uint8_t>(content.begin(), content.end()));
}

std::expected<std::vector<uint8_t>, ZipError> ZipArchive::toBytes() const {
    struct CentralDirEntry {
        std::string name;
        uint32_t crc32;
        uint32_t compressedSize;
        uint32_t uncompressedSize;
        uint32_t localHeaderOffset;
        uint16_t compressionMethod;
    };

    std::vector<CentralDirEntry> centralDir;
    std::vector<uint8_t> buffer;

    for (const auto& entry : entries_) {
        auto decoded = decodeEntry(entry);
        if (!decoded) {
            return std::unexpected(decoded.error());
        }
        const auto& data = *decoded;

        CentralDirEntry record;
        record.name = entry.name;
        record.uncompressedSize = static_cast<uint32_t>(data.size());
        record.crc32 = static_cast<uint32_t>(
            ::crc32(0L, data.data(), static_cast<uInt>(data.size())));
        record.localHeaderOffset = static_cast<uint32_t>(buffer.size());

        std::vector<uint8_t> compressedData;
        uint16_t method;

        if (data.size() > 64) {
            auto compressed = deflateData(data);
            if (!compressed) {
                return std::unexpected(compressed.error());
            }
            compressedData = std::move(*compressed);
            method = kCompressionDeflate;
        } else {
            // Store small entries uncompressed
            compressedData = data;
            method = kCompressionStore;
        }

        record.compressedSize = static_cast<uint32_t>(compressedData.size());
        record.compressionMethod = method;

        // Local file header
        writeLE<uint32_t>(buffer, kLocalFileHeaderSignature);
        writeLE<uint16_t>(buffer, kVersionNeeded);
        writeLE<uint16_t>(buffer, 0);  // general purpose bit flag
        writeLE<uint16_t>(buffer, method);
        writeLE<uint16_t>(buffer, 0);  // last mod time
        writeLE<uint16_t>(buffer, 0);  // last mod date
        writeLE<uint32_t>(buffer, record.crc32);
        writeLE<uint32_t>(buffer, record.compressedSize);
        writeLE<uint32_t>(buffer, record.uncompressedSize);
        writeLE<uint16_t>(buffer, static_cast<uint16_t>(entry.name.size()));
        writeLE<uint16_t>(buffer, 0);  // extra field length
        buffer.insert(buffer.end(), entry.name.begin(), entry.name.end());
        buffer.insert(buffer.end(), compressedData.begin(), compressedData.end());

        centralDir.push_back(std::move(record));
    }

    uint32_t centralDirOffset = static_cast<uint32_t>(buffer.size());

    for (const auto& record : centralDir) {
        writeLE<uint32_t>(buffer, kCentralDirHeaderSignature);
        writeLE<uint16_t>(buffer, kVersionMadeBy);
        writeLE<uint16_t>(buffer, kVersionNeeded);
        writeLE<uint16_t>(buffer, 0);  // general purpose bit flag
        writeLE<uint16_t>(buffer, record.compressionMethod);
        writeLE<uint16_t>(buffer, 0);  // last mod time
        writeLE<uint16_t>(buffer, 0);  // last mod date
        writeLE<uint32_t>(buffer, record.crc32);
        writeLE<uint32_t>(buffer, record.compressedSize);
        writeLE<uint32_t>(buffer, record.uncompressedSize);
        writeLE<uint16_t>(buffer, static_cast<uint16_t>(record.name.size()));
        writeLE<uint16_t>(buffer, 0);  // extra field length
        writeLE<uint16_t>(buffer, 0);  // file comment length
        writeLE<uint16_t>(buffer, 0);  // disk number start
        writeLE<uint16_t>(buffer, 0);  // internal file attributes
        writeLE<uint32_t>(buffer, 0);  // external file attributes
        writeLE<uint32_t>(buffer, record.localHeaderOffset);
        buffer.insert(buffer.end(), record.name.begin(), record.name.end());
    }

    uint32_t centralDirSize = static_cast<uint32_t>(buffer.size()) - centralDirOffset;

    writeLE<uint32_t>(buffer, kEndOfCentralDirSignature);
    writeLE<uint16_t>(buffer, 0);  // disk number
    writeLE<uint16_t>(buffer, 0);  // disk number with central dir
    writeLE<uint16_t>(buffer, static_cast<uint16_t>(centralDir.size()));
    writeLE<uint16_t>(buffer, static_cast<uint16_t>(centralDir.size()));
    writeLE<uint32_t>(buffer, centralDirSize);
    writeLE<uint32_t>(buffer, centralDirOffset);
    writeLE<uint16_t>(buffer, 0);  // comment length

    return buffer;
}

std::expected<void, ZipError>
ZipArchive::writeTo(const std::filesystem::path& path) const {
    auto bytes = toBytes();
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(ZipError::FileOpenFailed);
    }

    file.write(reinterpret_cast<const char*>(bytes->data()),
               static_cast<std::streamsize>(bytes->size()));

    if (!file) {
        return std::unexpected(ZipError::FileWriteFailed);
    }

    return {};
}

std::expected<ZipArchive, ZipError>
ZipArchive::readFrom(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(ZipError::FileOpenFailed);
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());

    if (file.bad()) {
        return std::unexpected(ZipError::FileReadFailed);
    }

    return readFromBuffer(std::move(data));
}

std::expected<ZipArchive, ZipError>
ZipArchive::readFromBuffer(const std::vector<uint8_t>& bytes) {
    return readFromBuffer(std::vector<uint8_t>(bytes));
}

std::expected<ZipArchive, ZipError>
ZipArchive::readFromBuffer(std::vector<uint8_t>&& bytes) {
    auto source = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
    const auto& data = *source;

    if (data.size() < kEndOfCentralDirSize) {
        return std::unexpected(ZipError::InvalidArchive);
    }

    // Find end of central directory record (search backwards, the record
    // may be followed by an archive comment)
    size_t eocdOffset = 0;
    bool found = false;
    for (size_t i = data.size() - kEndOfCentralDirSize + 1; i-- > 0;) {
        if (readLE<uint32_t>(data.data(), i) == kEndOfCentralDirSignature) {
            eocdOffset = i;
            found = true;
            break;
        }
    }

    if (!found) {
        return std::unexpected(ZipError::InvalidArchive);
    }

    uint16_t entryCount = readLE<uint16_t>(data.data(), eocdOffset + 10);
    uint32_t centralDirOffset = readLE<uint32_t>(data.data(), eocdOffset + 16);

    ZipArchive archive;
    archive.source_ = source;
    archive.entries_.reserve(entryCount);
    size_t offset = centralDirOffset;

    for (uint16_t i = 0; i < entryCount; ++i) {
        if (offset + kCentralHeaderSize > data.size()
            || readLE<uint32_t>(data.data(), offset) != kCentralDirHeaderSignature) {
            return std::unexpected(ZipError::InvalidArchive);
        }

        uint16_t flags = readLE<uint16_t>(data.data(), offset + 8);
        uint16_t method = readLE<uint16_t>(data.data(), offset + 10);
        uint32_t crc = readLE<uint32_t>(data.data(), offset + 16);
        uint32_t compSize = readLE<uint32_t>(data.data(), offset + 20);
        uint32_t uncompSize = readLE<uint32_t>(data.data(), offset + 24);
        uint16_t nameLen = readLE<uint16_t>(data.data(), offset + 28);
        uint16_t extraLen = readLE<uint16_t>(data.data(), offset + 30);
        uint16_t commentLen = readLE<uint16_t>(data.data(), offset + 32);
        uint32_t localOffset = readLE<uint32_t>(data.data(), offset + 42);

        if (offset + kCentralHeaderSize + nameLen > data.size()) {
            return std::unexpected(ZipError::InvalidArchive);
        }

        ZipEntry entry;
        entry.name.assign(
            data.begin() + static_cast<ptrdiff_t>(offset + kCentralHeaderSize),
            data.begin() + static_cast<ptrdiff_t>(offset + kCentralHeaderSize + nameLen));

        auto member = locateMember(data, localOffset, flags, method,
                                   crc, compSize, uncompSize);
        if (member) {
            entry.stored = *member;
        } else {
            entry.error = member.error();
        }
        archive.entries_.push_back(std::move(entry));

        offset += kCentralHeaderSize + nameLen + extraLen + commentLen;
    }

    return archive;
}

std::expected<void, ZipError>
ZipArchive::streamEntry(const ZipEntry& entry, const ChunkSink& sink) const {
    if (entry.error) {
        return std::unexpected(*entry.error);
    }

    if (!entry.stored) {
        if (!entry.data.empty() && !sink(entry.data.data(), entry.data.size())) {
            return std::unexpected(ZipError::FileWriteFailed);
        }
        return {};
    }

    if (!source_) {
        return std::unexpected(ZipError::InvalidEntry);
    }

    const auto& member = *entry.stored;
    const uint8_t* payload = source_->data() + member.dataOffset;
    uLong crc = ::crc32(0L, Z_NULL, 0);

    if (member.method == kCompressionStore) {
        size_t remaining = member.compressedSize;
        while (remaining > 0) {
            size_t size = std::min(remaining, kInflateChunkSize);
            crc = ::crc32(crc, payload, static_cast<uInt>(size));
            if (!sink(payload, size)) {
                return std::unexpected(ZipError::FileWriteFailed);
            }
            payload += size;
            remaining -= size;
        }
    } else {
        auto inflated = inflateChunks(payload, member, sink, crc);
        if (!inflated) {
            return std::unexpected(inflated.error());
        }
    }

    if (static_cast<uint32_t>(crc) != member.crc32) {
        return std::unexpected(ZipError::ChecksumMismatch);
    }
    return {};
}

std::expected<std::vector<uint8_t>, ZipError>
ZipArchive::decodeEntry(const ZipEntry& entry) const {
    if (!entry.stored && !entry.error) {
        return entry.data;
    }

    std::vector<uint8_t> content;
    auto streamed = streamEntry(entry, [&content](const uint8_t* chunk, size_t size) {
        content.insert(content.end(), chunk, chunk + size);
        return true;
    });
    if (!streamed) {
        return std::unexpected(streamed.error());
    }
    return content;
}

std::expected<std::vector<uint8_t>, ZipError>
ZipArchive::readEntry(const std::string& name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const ZipEntry& e) { return e.name == name; });
    if (it == entries_.end()) {
        return std::unexpected(ZipError::EntryNotFound);
    }
    return decodeEntry(*it);
}

bool ZipArchive::hasEntry(const std::string& name) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&name](const ZipEntry& e) { return e.name == name; });
}

std::vector<std::string> ZipArchive::entryNames() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.name);
    }
    return names;
}

} // namespace acr_qa::core
