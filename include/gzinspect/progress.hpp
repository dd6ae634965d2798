#pragma once
#include <cstddef>
#include <cstdint>

namespace gzinspect {

struct ProgressEvent {
    std::uint64_t offset = 0;
    // 0 when the source size is unknown.
    std::uint64_t total = 0;
    std::size_t chunks = 0;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
    virtual void OnFinish() {}
};

} // namespace gzinspect
