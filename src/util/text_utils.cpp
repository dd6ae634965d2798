#include "util/text_utils.hpp"

#include <cstdio>

namespace gzinspect {

namespace {

constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

// Length of the valid UTF-8 sequence starting at bytes[i], or 0 if invalid.
size_t ValidSequenceLength(std::span<const std::uint8_t> bytes, size_t i) {
    const std::uint8_t b0 = bytes[i];
    if (b0 < 0x80) return 1;

    size_t len = 0;
    std::uint8_t lo = 0x80;
    std::uint8_t hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        if (b0 == 0xE0) lo = 0xA0;
        if (b0 == 0xED) hi = 0x9F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }

    if (i + len > bytes.size()) return 0;
    if (bytes[i + 1] < lo || bytes[i + 1] > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        if (bytes[i + k] < 0x80 || bytes[i + k] > 0xBF) return 0;
    }
    return len;
}

} // namespace

bool IsValidUtf8(std::span<const std::uint8_t> bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        const size_t n = ValidSequenceLength(bytes, i);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

std::string Utf8Lossy(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        const size_t n = ValidSequenceLength(bytes, i);
        if (n == 0) {
            out.append(kReplacement);
            ++i;
            continue;
        }
        out.append(reinterpret_cast<const char*>(bytes.data() + i), n);
        i += n;
    }
    return out;
}

std::vector<std::string_view> SplitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) nl = text.size();
        std::string_view line = text.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = nl + 1;
    }
    return lines;
}

std::string HexBytes(std::span<const std::uint8_t> bytes, std::string_view sep) {
    std::string out;
    char buf[3];
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) out.append(sep);
        std::snprintf(buf, sizeof(buf), "%02x", bytes[i]);
        out.append(buf, 2);
    }
    return out;
}

} // namespace gzinspect
