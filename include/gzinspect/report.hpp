#pragma once

#include "gzinspect/chunk.hpp"
#include "util/window_spec.hpp"

#include <cstdint>
#include <ostream>
#include <span>
#include <string>

namespace gzinspect {

// 1536 -> "1.5KB", 512 -> "512B".
std::string HumanSize(std::uint64_t size);

// "🔓 3.2x" for compression, "🔒 1.3x" (inverted) for expansion.
std::string FormatRatio(double ratio);

std::string FormatChunkLine(const ChunkInfo& chunk);
std::string FormatSummary(const FileSummary& summary);

// Numbered head/tail excerpt of a decoded payload, read as lossy UTF-8.
void PrintPreview(std::ostream& os, std::span<const std::uint8_t> data, const WindowSpec& lines);

} // namespace gzinspect
