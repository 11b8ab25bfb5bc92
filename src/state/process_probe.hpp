#pragma once

namespace runtape::state {

// Best-effort liveness check for a recorded child pid. Non-positive pids are
// never alive. A pid the caller may not signal still counts as alive.
bool IsProcessAlive(int pid);

} // namespace runtape::state
