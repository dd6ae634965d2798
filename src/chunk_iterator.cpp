#include "gzinspect/chunk_iterator.hpp"

#include "util/logger.hpp"

namespace gzinspect {

ChunkIterator::ChunkIterator(ISeekableReader& src, ScanOptions opt, IProgress* progress)
    : src_(src), scanner_(opt), progress_(progress), total_(src.TotalSize()) {}

std::expected<std::optional<ChunkInfo>, ScanError> ChunkIterator::Next() {
    if (done_) {
        if (error_) return std::unexpected(*error_);
        return std::nullopt;
    }

    auto chunk = scanner_.ReadMember(src_, cursor_, next_number_);
    if (!chunk) {
        done_ = true;
        if (progress_) progress_->OnFinish();
        if (chunk.error().IsEndOfStream()) {
            LogDebug("end of stream at offset %llu after %zu chunks",
                     static_cast<unsigned long long>(cursor_), next_number_);
            return std::nullopt;
        }
        error_ = chunk.error();
        return std::unexpected(*error_);
    }

    cursor_ = chunk->End();
    ++next_number_;
    summary_.Add(*chunk);

    if (progress_) {
        progress_->OnProgress(ProgressEvent{.offset = cursor_, .total = total_.value_or(0), .chunks = next_number_});
    }
    return std::optional<ChunkInfo>(std::move(*chunk));
}

ScanReport ScanAll(ISeekableReader& src, const ScanOptions& opt, IProgress* progress) {
    ScanReport report;
    ChunkIterator it(src, opt, progress);
    while (true) {
        auto next = it.Next();
        if (!next) {
            report.error = next.error();
            break;
        }
        if (!next->has_value()) break;
        report.chunks.push_back(std::move(**next));
    }
    report.summary = it.Summary();
    return report;
}

} // namespace gzinspect
