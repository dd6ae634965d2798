#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gzinspect {

// Strict UTF-8 check: rejects overlongs, surrogates and code points above U+10FFFF.
bool IsValidUtf8(std::span<const std::uint8_t> bytes);

// Copies `bytes`, replacing each invalid sequence with U+FFFD.
std::string Utf8Lossy(std::span<const std::uint8_t> bytes);

// Splits on '\n'; a trailing '\r' is dropped from each line and a final
// newline does not produce an empty last line.
std::vector<std::string_view> SplitLines(std::string_view text);

std::string HexBytes(std::span<const std::uint8_t> bytes, std::string_view sep = " ");

} // namespace gzinspect
