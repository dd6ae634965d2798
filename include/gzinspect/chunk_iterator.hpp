#pragma once

#include "gzinspect/chunk.hpp"
#include "gzinspect/member_scanner.hpp"
#include "gzinspect/progress.hpp"
#include "io/io.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

namespace gzinspect {

// Walks a stream member by member, starting at offset 0. Each chunk starts
// where the previous one ended.
class ChunkIterator {
public:
    explicit ChunkIterator(ISeekableReader& src, ScanOptions opt = {}, IProgress* progress = nullptr);

    ChunkIterator(const ChunkIterator&) = delete;
    ChunkIterator& operator=(const ChunkIterator&) = delete;

    // Next chunk, std::nullopt at the normal end of the stream, or the error
    // that stopped the pass. Once stopped, later calls return the same outcome.
    std::expected<std::optional<ChunkInfo>, ScanError> Next();

    bool Done() const { return done_; }
    std::uint64_t Cursor() const { return cursor_; }
    const FileSummary& Summary() const { return summary_; }

private:
    ISeekableReader& src_;
    MemberScanner scanner_;
    IProgress* progress_ = nullptr;
    std::optional<std::uint64_t> total_;

    std::uint64_t cursor_ = 0;
    std::size_t next_number_ = 0;
    FileSummary summary_;
    bool done_ = false;
    std::optional<ScanError> error_;
};

struct ScanReport {
    std::vector<ChunkInfo> chunks;
    FileSummary summary;
    // Set when the pass stopped early; `chunks` is still valid.
    std::optional<ScanError> error;

    bool ok() const { return !error.has_value(); }
};

ScanReport ScanAll(ISeekableReader& src, const ScanOptions& opt = {}, IProgress* progress = nullptr);

} // namespace gzinspect
