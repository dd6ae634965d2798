#pragma once

#include "gzinspect/chunk.hpp"
#include "gzinspect/progress.hpp"
#include "io/io.hpp"
#include "util/window_spec.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace gzinspect {

enum class OutputFormat { Human, Json };

std::optional<OutputFormat> ParseOutputFormat(std::string_view name);

struct InspectOptions {
    OutputFormat format = OutputFormat::Human;
    // Lines of each chunk's payload to show (human output only).
    std::optional<WindowSpec> preview;
    std::string encoding = "utf-8";
    // Chunks to show; all of them when unset.
    std::optional<WindowSpec> chunk_filter;
    ScanOptions scan;
};

struct InspectOutcome {
    FileSummary summary;
    std::optional<ScanError> error;
    bool cancelled = false;

    bool ok() const { return !error && !cancelled; }
};

// Runs a full pass over a source and writes the selected chunks and the
// summary to `out`.
class Inspector {
public:
    Inspector(InspectOptions opt, std::ostream& out);

    InspectOutcome Run(ISeekableReader& src, IProgress* progress = nullptr);

private:
    void Emit(const ChunkInfo& chunk);

    InspectOptions opt_;
    std::ostream& out_;
};

} // namespace gzinspect
