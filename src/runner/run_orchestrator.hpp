#pragma once

#include "core/logging/logger.hpp"
#include "session/model.hpp"
#include "transport/cancellation.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace runtape::runner {

inline constexpr std::chrono::seconds kDefaultRetention = std::chrono::hours(24);
inline constexpr int kSessionIdAttempts = 5;

// Produces one candidate session id per call. Returns false with `error` set
// when no candidate can be produced.
using SessionIdSource = std::function<bool(std::string& id, std::string& error)>;

// Options shared by `runtape run` and in-process callers such as tests.
struct RunOptions {
  std::vector<std::string> command;
  // Empty generates a fresh identifier.
  std::string session_id;
  // Candidate generator used when session_id is empty. Unset draws from
  // session::NewSessionId with the current time.
  SessionIdSource id_source;
  std::chrono::seconds retention = kDefaultRetention;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  // Empty resolves from RUNTAPE_STATE_ROOT / XDG_STATE_HOME / HOME.
  std::filesystem::path state_root;
  const transport::CancellationToken* cancel = nullptr;
};

// What the run recorded. `final_metadata` is set once final.json was written.
struct RunOutcome {
  std::string session_id;
  session::TransportMode transport_mode = session::TransportMode::kPipe;
  bool tty_attached = false;
  std::optional<session::FinalMetadata> final_metadata;
};

// Records one child process end to end and returns the process exit code:
//   child exit code when it exited,
//   128 + N when it died from signal N,
//   1 for engine failures and setup errors,
//   2 for invalid options, an invalid id, or an id that already has metadata.
// Fatal errors are written to stderr with a phase prefix.
int ExecuteRun(const RunOptions& options, RunOutcome* outcome = nullptr);

} // namespace runtape::runner
