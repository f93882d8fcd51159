#pragma once

#include <atomic>

namespace otasrv {

// Set by SIGINT/SIGTERM.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace otasrv
