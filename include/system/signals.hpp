#pragma once

#include <atomic>

namespace ue {

// Set from SIGINT/SIGTERM. Apply polls it between install operations.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace ue
