#include "system/signals.hpp"

#include <signal.h>

namespace gzinspect {

std::atomic_bool g_cancel{false};

namespace {

void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

} // namespace

void InstallSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace gzinspect
