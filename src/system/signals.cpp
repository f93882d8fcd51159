// signals.cpp - Signal handling and shared shutdown flag.

#include "system/signals.hpp"

#include <csignal>

namespace otasrv {

std::atomic_bool g_cancel{false};

static void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    // A client hanging up mid-download must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
}

} // namespace otasrv
