#pragma once

#include <atomic>

namespace hotupdate {

// Set by SIGINT / SIGTERM.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace hotupdate
