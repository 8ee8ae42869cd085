// signals.cpp - Signal handling and shared cancel flag.

#include "system/signals.hpp"

#include <csignal>

namespace ue {

std::atomic_bool g_cancel{false};

static void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

void InstallSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a blocking read on a pipe should return so the caller can notice.
    sa.sa_flags = 0;
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
}

} // namespace ue
