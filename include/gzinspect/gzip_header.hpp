#pragma once

#include "io/io.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace gzinspect {

inline constexpr std::uint8_t kGzipId1 = 0x1F;
inline constexpr std::uint8_t kGzipId2 = 0x8B;
inline constexpr std::uint8_t kGzipMethodDeflate = 8;
inline constexpr std::size_t kGzipHeaderSize = 10;
inline constexpr std::size_t kGzipTrailerSize = 8; // CRC32 + ISIZE

// FLG bits (RFC 1952, 2.3.1)
inline constexpr std::uint8_t kFlagText    = 0x01;
inline constexpr std::uint8_t kFlagHcrc    = 0x02;
inline constexpr std::uint8_t kFlagExtra   = 0x04;
inline constexpr std::uint8_t kFlagName    = 0x08;
inline constexpr std::uint8_t kFlagComment = 0x10;

using GzipFixedHeader = std::array<std::uint8_t, kGzipHeaderSize>;

struct ExtraSubfield {
    std::uint16_t id = 0; // (SI1 << 8) | SI2
    std::vector<std::uint8_t> data;
};

struct GzipHeaderInfo {
    std::string compression_method;
    std::vector<std::string> flags;
    std::string mtime;
    std::string extra_flags;
    std::string os;
    std::vector<ExtraSubfield> extra_fields;
    std::optional<std::string> filename;
    std::optional<std::string> comment;

    // Raw values, kept for structured output.
    std::uint8_t method_code = 0;
    std::uint8_t flag_byte = 0;
    std::uint32_t mtime_raw = 0;
    std::uint8_t xfl = 0;
    std::uint8_t os_code = 0;
    std::size_t header_size = kGzipHeaderSize;

    bool HasFlag(std::uint8_t bit) const { return (flag_byte & bit) != 0; }

    // "method|FLAG|FLAG[|filename]"
    std::string Summary() const;
};

inline bool HasGzipMagic(const std::uint8_t* p) {
    return p[0] == kGzipId1 && p[1] == kGzipId2;
}

std::string DescribeMethod(std::uint8_t cm);
std::string DescribeExtraFlags(std::uint8_t xfl);
std::string DescribeOs(std::uint8_t os);
// "Not set" for 0, "YYYY-MM-DD HH:MM:SS UTC" otherwise, "Invalid" if unrepresentable.
std::string DescribeMtime(std::uint32_t mtime);

std::vector<ExtraSubfield> ParseExtraSubfields(const std::vector<std::uint8_t>& extra);

// Decodes the optional header fields that follow `fixed` in `src`.
// Every byte read from `src` is appended to `consumed`, so on success
// `consumed.size()` grows by exactly the length of the optional fields.
// Fails only when EXTRA or HCRC data is cut short or the source errors.
std::expected<GzipHeaderInfo, std::string> DecodeGzipHeader(const GzipFixedHeader& fixed,
                                                            IReader& src,
                                                            std::vector<std::uint8_t>& consumed);

} // namespace gzinspect
