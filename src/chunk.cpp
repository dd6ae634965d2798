#include "gzinspect/chunk.hpp"

namespace gzinspect {

void FileSummary::Add(const ChunkInfo& chunk) {
    ++total_chunks;
    total_compressed_size += chunk.compressed_size;
    total_uncompressed_size += chunk.uncompressed_size;
    average_compression_ratio =
        total_compressed_size > 0
            ? static_cast<double>(total_uncompressed_size) / static_cast<double>(total_compressed_size)
            : 0.0;
}

FileSummary Summarize(std::span<const ChunkInfo> chunks) {
    FileSummary s;
    for (const auto& c : chunks) s.Add(c);
    return s;
}

const char* ToString(ScanErrorKind kind) {
    switch (kind) {
        case ScanErrorKind::EndOfStream:     return "end of stream";
        case ScanErrorKind::BadMagic:        return "bad magic";
        case ScanErrorKind::TruncatedHeader: return "truncated header";
        case ScanErrorKind::Io:              return "I/O error";
        case ScanErrorKind::DecodeFailed:    return "decode failed";
        case ScanErrorKind::SizeExceeded:    return "size exceeded";
    }
    return "unknown";
}

} // namespace gzinspect
