#pragma once

#include "gzinspect/chunk.hpp"

#include <nlohmann/json.hpp>

namespace gzinspect {

nlohmann::json HeaderToJson(const GzipHeaderInfo& header);

// Payload bytes are never serialized.
nlohmann::json ChunkToJson(const ChunkInfo& chunk);

nlohmann::json SummaryToJson(const FileSummary& summary);

nlohmann::json ErrorToJson(const ScanError& error);

} // namespace gzinspect
