// signals.cpp - Signal handling and the process-wide cancel context.

#include "system/signals.hpp"

#include <csignal>

namespace migfetch {

CancelContext g_cancel;

static void HandleSignal(int) {
    g_cancel.Cancel();
}

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
}

} // namespace migfetch
