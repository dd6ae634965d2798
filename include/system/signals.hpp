#pragma once

#include <atomic>

namespace gzinspect {

// Set by SIGINT/SIGTERM. The inspector checks it between chunks.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

inline bool CancelRequested() { return g_cancel.load(std::memory_order_relaxed); }
inline void ResetCancel() { g_cancel.store(false, std::memory_order_relaxed); }

} // namespace gzinspect
