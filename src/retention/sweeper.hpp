#pragma once

#include "core/logging/logger.hpp"
#include "session/model.hpp"
#include "state/session_store.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace runtape::retention {

struct SweepResult {
  std::size_t checked = 0;
  std::size_t removed = 0;
};

// Removes expired, completed session directories.
//
// Readable sessions expire at (ended_at or started_at) + their own retention,
// falling back to `default_ttl` when the session recorded none. Unreadable
// directories expire at their newest mtime + `default_ttl`. Starting and
// running sessions are never removed. Per-session failures are logged and the
// sweep continues; only a non-positive TTL or an unreadable sessions root
// fails the sweep.
bool Sweep(const state::SessionStore& store, std::chrono::seconds default_ttl,
           core::logging::Logger& logger, SweepResult& result, std::string& error,
           session::Timestamp now = std::chrono::system_clock::now());

} // namespace runtape::retention
