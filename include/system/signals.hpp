#pragma once

#include "system/cancel_context.hpp"

namespace migfetch {

// Process-wide context cancelled by SIGINT/SIGTERM.
extern CancelContext g_cancel;

void InstallSignalHandlers();

} // namespace migfetch
