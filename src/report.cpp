#include "gzinspect/report.hpp"

#include "util/text_utils.hpp"

#include <algorithm>
#include <cstdio>

namespace gzinspect {

std::string HumanSize(std::uint64_t size) {
    static constexpr const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(size);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit;
    }

    char buf[32];
    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%.0f%s", value, kUnits[unit]);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f%s", value, kUnits[unit]);
    }
    return buf;
}

std::string FormatRatio(double ratio) {
    char buf[48];
    if (ratio >= 1.0) {
        std::snprintf(buf, sizeof(buf), "🔓 %.1fx", ratio);
    } else if (ratio > 0.0) {
        std::snprintf(buf, sizeof(buf), "🔒 %.1fx", 1.0 / ratio);
    } else {
        std::snprintf(buf, sizeof(buf), "🔒 --");
    }
    return buf;
}

std::string FormatChunkLine(const ChunkInfo& chunk) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "📦 #%-5zu │ 📍 %-10llu │ %s │ 📥 %-8s │ 📤 %-8s │ ℹ️  ",
                  chunk.chunk_number,
                  static_cast<unsigned long long>(chunk.offset),
                  FormatRatio(chunk.compression_ratio).c_str(),
                  HumanSize(chunk.compressed_size).c_str(),
                  HumanSize(chunk.uncompressed_size).c_str());
    return std::string(buf) + chunk.header.Summary();
}

std::string FormatSummary(const FileSummary& summary) {
    char ratio[32];
    std::snprintf(ratio, sizeof(ratio), "%.1fx", summary.average_compression_ratio);

    std::string out = "\n📊 Summary:\n";
    out += "├─ 📦 Chunks: " + std::to_string(summary.total_chunks) + "\n";
    out += "├─ 📥 Total Compressed: " + HumanSize(summary.total_compressed_size) + "\n";
    out += "├─ 📤 Total Uncompressed: " + HumanSize(summary.total_uncompressed_size) + "\n";
    out += "└─ 📈 Average Compression: " + std::string(ratio);
    return out;
}

void PrintPreview(std::ostream& os, std::span<const std::uint8_t> data, const WindowSpec& lines) {
    const std::string text = Utf8Lossy(data);
    const auto all = SplitLines(text);

    char num[16];
    auto print_line = [&](std::size_t i) {
        std::snprintf(num, sizeof(num), "%4zu", i + 1);
        os << "     " << num << " │ " << all[i] << "\n";
    };

    const std::size_t head = std::min(lines.head, all.size());
    for (std::size_t i = 0; i < head; ++i) print_line(i);

    if (lines.tail && head < all.size()) {
        os << "          | ...\n";
        const std::size_t start = std::max(head, all.size() - std::min(*lines.tail, all.size()));
        for (std::size_t i = start; i < all.size(); ++i) print_line(i);
    }
    os << "\n\n";
}

} // namespace gzinspect
