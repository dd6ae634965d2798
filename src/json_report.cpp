#include "gzinspect/json_report.hpp"

namespace gzinspect {

using json = nlohmann::json;

json HeaderToJson(const GzipHeaderInfo& header) {
    json extra = json::array();
    for (const auto& sf : header.extra_fields) {
        extra.push_back({{"id", sf.id}, {"data", sf.data}});
    }

    json j = {
        {"compression_method", header.compression_method},
        {"flags", header.flags},
        {"mtime", header.mtime},
        {"extra_flags", header.extra_flags},
        {"os", header.os},
        {"extra_fields", std::move(extra)},
        {"header_size", header.header_size},
    };
    j["filename"] = header.filename ? json(*header.filename) : json(nullptr);
    j["comment"] = header.comment ? json(*header.comment) : json(nullptr);
    return j;
}

json ChunkToJson(const ChunkInfo& chunk) {
    return {
        {"chunk_number", chunk.chunk_number},
        {"offset", chunk.offset},
        {"compressed_size", chunk.compressed_size},
        {"uncompressed_size", chunk.uncompressed_size},
        {"compression_ratio", chunk.compression_ratio},
        {"header_info", chunk.header.Summary()},
        {"header", HeaderToJson(chunk.header)},
    };
}

json SummaryToJson(const FileSummary& summary) {
    return {
        {"total_chunks", summary.total_chunks},
        {"total_compressed_size", summary.total_compressed_size},
        {"total_uncompressed_size", summary.total_uncompressed_size},
        {"average_compression_ratio", summary.average_compression_ratio},
    };
}

json ErrorToJson(const ScanError& error) {
    return {
        {"error", ToString(error.kind)},
        {"offset", error.offset},
        {"message", error.message},
    };
}

} // namespace gzinspect
