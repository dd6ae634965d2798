#pragma once

#include "gzinspect/progress.hpp"

#include <cstdint>

namespace gzinspect {

// Single-line progress bar on stderr, redrawn when the percentage moves.
class ConsoleProgressSink final : public IProgress {
public:
    explicit ConsoleProgressSink(int bar_width = 40) : bar_width_(bar_width) {}

    void OnProgress(const ProgressEvent& e) override;
    void OnFinish() override;

private:
    int bar_width_;
    int last_permille_ = -1;
};

bool IsProgressLineActive();
// Erases the progress line so other stderr output starts on a clean line.
void ClearProgressLine();

} // namespace gzinspect
