#include "gzinspect/gzip_header.hpp"

#include "util/logger.hpp"
#include "util/text_utils.hpp"

#include <cstdio>
#include <ctime>

namespace gzinspect {

namespace {

constexpr const char* kOsNames[] = {
    "FAT",     "Amiga",   "VMS",  "Unix", "VM/CMS", "Atari TOS", "HPFS",
    "Macintosh", "Z-System", "CP/M", "TOPS-20", "NTFS", "QDOS", "Acorn RISCOS",
};

struct FlagName {
    std::uint8_t bit;
    const char* name;
};

constexpr FlagName kFlagNames[] = {
    {kFlagText, "TEXT"},
    {kFlagHcrc, "HCRC"},
    {kFlagExtra, "EXTRA"},
    {kFlagName, "NAME"},
    {kFlagComment, "COMMENT"},
};

std::uint16_t LoadLe16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t LoadLe32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

// Reads exactly `n` bytes, appending them to both `out` and `consumed`.
bool ReadExact(IReader& src, size_t n, std::vector<std::uint8_t>& out, std::vector<std::uint8_t>& consumed) {
    const size_t base = out.size();
    out.resize(base + n);
    const ssize_t got = ReadFull(src, std::span<std::uint8_t>(out.data() + base, n));
    if (got > 0) {
        consumed.insert(consumed.end(), out.begin() + static_cast<std::ptrdiff_t>(base),
                        out.begin() + static_cast<std::ptrdiff_t>(base) + got);
    }
    return got == static_cast<ssize_t>(n);
}

// Reads a zero-terminated string. Source exhaustion ends the string too.
bool ReadZeroTerminated(IReader& src, std::vector<std::uint8_t>& out, std::vector<std::uint8_t>& consumed) {
    std::uint8_t b = 0;
    while (true) {
        const ssize_t n = src.Read(std::span<std::uint8_t>(&b, 1));
        if (n < 0) return false;
        if (n == 0) return true;
        consumed.push_back(b);
        if (b == 0) return true;
        out.push_back(b);
    }
}

std::optional<std::string> DecodeText(const std::vector<std::uint8_t>& raw, const char* what) {
    if (!IsValidUtf8(raw)) {
        LogDebug("gzip header %s is not valid UTF-8 (%zu bytes), ignoring", what, raw.size());
        return std::nullopt;
    }
    return std::string(raw.begin(), raw.end());
}

} // namespace

std::string GzipHeaderInfo::Summary() const {
    std::string out = compression_method + "|";
    for (size_t i = 0; i < flags.size(); ++i) {
        if (i > 0) out += "|";
        out += flags[i];
    }
    if (filename) {
        out += "|" + *filename;
    }
    return out;
}

std::string DescribeMethod(std::uint8_t cm) {
    if (cm == kGzipMethodDeflate) return "deflate";
    return "unknown(" + std::to_string(cm) + ")";
}

std::string DescribeExtraFlags(std::uint8_t xfl) {
    switch (xfl) {
        case 2: return "max compression";
        case 4: return "fastest";
        default: {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "unknown(0x%02x)", xfl);
            return buf;
        }
    }
}

std::string DescribeOs(std::uint8_t os) {
    if (os < std::size(kOsNames)) return kOsNames[os];
    if (os == 255) return "unknown";
    return "unknown(" + std::to_string(os) + ")";
}

std::string DescribeMtime(std::uint32_t mtime) {
    if (mtime == 0) return "Not set";

    const std::time_t t = static_cast<std::time_t>(mtime);
    std::tm tm{};
    if (gmtime_r(&t, &tm) == nullptr) return "Invalid";

    char buf[40];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm) == 0) return "Invalid";
    return buf;
}

std::vector<ExtraSubfield> ParseExtraSubfields(const std::vector<std::uint8_t>& extra) {
    std::vector<ExtraSubfield> out;
    size_t pos = 0;
    while (pos + 4 <= extra.size()) {
        ExtraSubfield sf;
        sf.id = static_cast<std::uint16_t>((extra[pos] << 8) | extra[pos + 1]);
        const size_t len = LoadLe16(&extra[pos + 2]);
        if (pos + 4 + len <= extra.size()) {
            sf.data.assign(extra.begin() + static_cast<std::ptrdiff_t>(pos + 4),
                           extra.begin() + static_cast<std::ptrdiff_t>(pos + 4 + len));
        } else {
            LogDebug("extra subfield 0x%04x claims %zu bytes, only %zu left", sf.id, len,
                     extra.size() - pos - 4);
        }
        out.push_back(std::move(sf));
        pos += 4 + len;
    }
    return out;
}

std::expected<GzipHeaderInfo, std::string> DecodeGzipHeader(const GzipFixedHeader& fixed,
                                                            IReader& src,
                                                            std::vector<std::uint8_t>& consumed) {
    GzipHeaderInfo info;
    info.method_code = fixed[2];
    info.flag_byte = fixed[3];
    info.mtime_raw = LoadLe32(&fixed[4]);
    info.xfl = fixed[8];
    info.os_code = fixed[9];

    info.compression_method = DescribeMethod(info.method_code);
    for (const auto& f : kFlagNames) {
        if (info.HasFlag(f.bit)) info.flags.emplace_back(f.name);
    }
    info.mtime = DescribeMtime(info.mtime_raw);
    info.extra_flags = DescribeExtraFlags(info.xfl);
    info.os = DescribeOs(info.os_code);

    const size_t start = consumed.size();

    if (info.HasFlag(kFlagExtra)) {
        std::vector<std::uint8_t> xlen;
        if (!ReadExact(src, 2, xlen, consumed)) {
            return std::unexpected("truncated extra field length");
        }
        const size_t len = LoadLe16(xlen.data());
        std::vector<std::uint8_t> extra;
        if (!ReadExact(src, len, extra, consumed)) {
            return std::unexpected("truncated extra field (" + std::to_string(len) + " bytes declared)");
        }
        info.extra_fields = ParseExtraSubfields(extra);
    }

    if (info.HasFlag(kFlagName)) {
        std::vector<std::uint8_t> raw;
        if (!ReadZeroTerminated(src, raw, consumed)) {
            return std::unexpected("read error in file name field");
        }
        info.filename = DecodeText(raw, "file name");
    }

    if (info.HasFlag(kFlagComment)) {
        std::vector<std::uint8_t> raw;
        if (!ReadZeroTerminated(src, raw, consumed)) {
            return std::unexpected("read error in comment field");
        }
        info.comment = DecodeText(raw, "comment");
    }

    if (info.HasFlag(kFlagHcrc)) {
        std::vector<std::uint8_t> crc16;
        if (!ReadExact(src, 2, crc16, consumed)) {
            return std::unexpected("truncated header CRC16");
        }
    }

    info.header_size = kGzipHeaderSize + (consumed.size() - start);
    return info;
}

} // namespace gzinspect
