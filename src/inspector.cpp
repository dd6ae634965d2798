#include "gzinspect/inspector.hpp"

#include "gzinspect/chunk_iterator.hpp"
#include "gzinspect/json_report.hpp"
#include "gzinspect/progress_sinks.hpp"
#include "gzinspect/report.hpp"
#include "gzinspect/tail_buffer.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <cctype>
#include <utility>

namespace gzinspect {

namespace {

bool IsUtf8Name(std::string_view name) {
    std::string lower;
    for (char c : name) {
        if (c == '-' || c == '_') continue;
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lower == "utf8";
}

} // namespace

std::optional<OutputFormat> ParseOutputFormat(std::string_view name) {
    if (name == "human") return OutputFormat::Human;
    if (name == "json") return OutputFormat::Json;
    return std::nullopt;
}

Inspector::Inspector(InspectOptions opt, std::ostream& out) : opt_(std::move(opt)), out_(out) {
    if (opt_.preview && !IsUtf8Name(opt_.encoding)) {
        LogWarn("encoding '%s' is not supported, previews are shown as UTF-8", opt_.encoding.c_str());
    }
}

InspectOutcome Inspector::Run(ISeekableReader& src, IProgress* progress) {
    InspectOutcome outcome;

    ScanOptions scan = opt_.scan;
    scan.keep_payload = opt_.preview.has_value() && opt_.format == OutputFormat::Human;

    std::optional<TailBuffer> tail;
    if (opt_.chunk_filter && opt_.chunk_filter->tail) {
        tail.emplace(*opt_.chunk_filter->tail);
    }

    ChunkIterator it(src, scan, progress);
    while (true) {
        if (CancelRequested()) {
            if (progress) progress->OnFinish();
            LogWarn("interrupted at offset %llu", static_cast<unsigned long long>(it.Cursor()));
            outcome.cancelled = true;
            break;
        }

        auto next = it.Next();
        if (!next) {
            outcome.error = next.error();
            break;
        }
        if (!next->has_value()) break;

        ChunkInfo& chunk = **next;
        if (!opt_.chunk_filter || chunk.chunk_number < opt_.chunk_filter->head) {
            Emit(chunk);
        } else if (tail && tail->ShouldBuffer(chunk.chunk_number)) {
            tail->Add(std::move(chunk));
        }
    }

    if (tail) {
        if (opt_.format == OutputFormat::Human && tail->TotalSeen() > tail->Capacity()) {
            out_ << "          ...\n";
        }
        for (const ChunkInfo* chunk : tail->GetBuffered()) {
            Emit(*chunk);
        }
    }

    outcome.summary = it.Summary();
    if (opt_.format == OutputFormat::Json) {
        if (outcome.error) out_ << ErrorToJson(*outcome.error).dump() << "\n";
        out_ << SummaryToJson(outcome.summary).dump() << "\n";
    } else {
        out_ << FormatSummary(outcome.summary) << "\n";
    }
    out_.flush();
    return outcome;
}

void Inspector::Emit(const ChunkInfo& chunk) {
    ClearProgressLine();

    if (opt_.format == OutputFormat::Json) {
        out_ << ChunkToJson(chunk).dump() << "\n";
        return;
    }

    out_ << FormatChunkLine(chunk) << "\n";
    if (opt_.preview && chunk.payload) {
        PrintPreview(out_, *chunk.payload, *opt_.preview);
    }
}

} // namespace gzinspect
