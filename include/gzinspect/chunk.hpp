#pragma once

#include "gzinspect/gzip_header.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace gzinspect {

struct ChunkInfo {
    std::size_t chunk_number = 0;
    std::uint64_t offset = 0;
    std::uint64_t compressed_size = 0;
    std::uint64_t uncompressed_size = 0;
    double compression_ratio = 0.0;
    GzipHeaderInfo header;
    // Decoded member, only kept when ScanOptions::keep_payload is set.
    std::optional<std::vector<std::uint8_t>> payload;

    std::uint64_t End() const { return offset + compressed_size; }
};

struct FileSummary {
    std::size_t total_chunks = 0;
    std::uint64_t total_compressed_size = 0;
    std::uint64_t total_uncompressed_size = 0;
    // total_uncompressed_size / total_compressed_size, 0 for an empty stream.
    double average_compression_ratio = 0.0;

    void Add(const ChunkInfo& chunk);
};

FileSummary Summarize(std::span<const ChunkInfo> chunks);

enum class ScanErrorKind {
    EndOfStream,     // nothing left at the requested offset
    BadMagic,
    TruncatedHeader,
    Io,
    DecodeFailed,
    SizeExceeded,
};

const char* ToString(ScanErrorKind kind);

struct ScanError {
    ScanErrorKind kind = ScanErrorKind::Io;
    std::uint64_t offset = 0;
    std::string message;

    bool IsEndOfStream() const { return kind == ScanErrorKind::EndOfStream; }
};

struct ScanOptions {
    std::size_t block_size = 8 * 1024;
    std::size_t max_member_bytes = 20 * 1024 * 1024;
    bool keep_payload = false;
};

} // namespace gzinspect
