#include "gzinspect/progress_sinks.hpp"

#include <cstdio>
#include <string>

namespace gzinspect {

namespace {
bool g_progress_line_active = false;
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    if (e.total == 0) {
        std::fprintf(stderr, "\r[%zu chunks] %llu bytes", e.chunks,
                     static_cast<unsigned long long>(e.offset));
        std::fflush(stderr);
        g_progress_line_active = true;
        return;
    }

    std::uint64_t done = e.offset > e.total ? e.total : e.offset;
    const int permille = static_cast<int>((done * 1000ULL) / e.total);
    if (permille == last_permille_) return;
    last_permille_ = permille;

    const int filled = (permille * bar_width_) / 1000;
    std::string bar(static_cast<size_t>(bar_width_), '-');
    for (int i = 0; i < filled; ++i) bar[static_cast<size_t>(i)] = '#';
    if (filled < bar_width_) bar[static_cast<size_t>(filled)] = '>';

    std::fprintf(stderr,
                 "\r[%s] %llu/%llu bytes %3d.%d%% (%zu chunks)",
                 bar.c_str(),
                 static_cast<unsigned long long>(done),
                 static_cast<unsigned long long>(e.total),
                 permille / 10,
                 permille % 10,
                 e.chunks);
    std::fflush(stderr);
    g_progress_line_active = true;
}

void ConsoleProgressSink::OnFinish() {
    ClearProgressLine();
    last_permille_ = -1;
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        // Erase instead of leaving the bar behind.
        std::fprintf(stderr, "\r\033[2K");
        std::fflush(stderr);
        g_progress_line_active = false;
    }
}

} // namespace gzinspect
