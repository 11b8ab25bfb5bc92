#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "core/logging/logger.hpp"
#include "retention/sweeper.hpp"
#include "session/model.hpp"
#include "state/session_store.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

#if defined(_WIN32)
#include <process.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace {

using runtape::tests::common::AssertContains;
using runtape::tests::common::Fail;

int CurrentPid() {
#if defined(_WIN32)
  return _getpid();
#else
  return static_cast<int>(::getpid());
#endif
}

void WriteSession(const runtape::state::SessionStore& store, const std::string& id,
                  runtape::session::Timestamp started_at, std::int64_t retention_seconds,
                  int pid, std::optional<runtape::session::Timestamp> ended_at) {
  runtape::session::StartMetadata meta;
  meta.session_id = id;
  meta.command = {"true"};
  meta.started_at = started_at;
  meta.retention_seconds = retention_seconds;
  meta.pid = pid;
  runtape::state::StoreError error;
  if (!store.WriteStartMetadata(meta, error)) {
    Fail("write start metadata failed: " + error.message);
  }
  if (!ended_at.has_value()) {
    return;
  }
  runtape::session::FinalMetadata final_meta;
  final_meta.session_id = id;
  final_meta.state = runtape::session::SessionState::kExited;
  final_meta.ended_at = *ended_at;
  final_meta.exit_code = 0;
  if (!store.WriteFinalMetadata(final_meta, error)) {
    Fail("write final metadata failed: " + error.message);
  }
}

runtape::retention::SweepResult SweepOrFail(const runtape::state::SessionStore& store,
                                            std::chrono::seconds ttl,
                                            runtape::core::logging::Logger& logger,
                                            runtape::session::Timestamp now) {
  runtape::retention::SweepResult result;
  std::string error;
  if (!runtape::retention::Sweep(store, ttl, logger, result, error, now)) {
    Fail("sweep failed: " + error);
  }
  return result;
}

} // namespace

int main() {
  using runtape::tests::common::CreateUniqueTempDir;
  using runtape::tests::common::RemovePathBestEffort;
  using std::chrono::seconds;

  const fs::path root = CreateUniqueTempDir("runtape-sweeper-smoke");
  runtape::state::SessionStore store;
  runtape::state::StoreError store_error;
  if (!store.Open(root / "state", store_error)) {
    Fail("open store failed: " + store_error.message);
  }
  const fs::path sessions = root / "state" / "sessions";

  std::ostringstream log_output;
  runtape::core::logging::Logger logger(runtape::core::logging::LogLevel::kDebug, log_output);
  const runtape::session::Timestamp now = std::chrono::system_clock::now();

  // A session whose own retention elapsed one second ago goes.
  const std::string expired_id = "01HZX3K4M5N6P7Q8R9S0T1V2W0";
  WriteSession(store, expired_id, now - seconds(1800), 600, 0, now - seconds(601));
  runtape::retention::SweepResult result = SweepOrFail(store, seconds(1800), logger, now);
  if (result.checked != 1U || result.removed != 1U) {
    Fail("expected checked=1 removed=1 for a single expired session");
  }
  if (fs::exists(sessions / expired_id)) {
    Fail("expired session directory should be removed");
  }
  AssertContains(log_output.str(), "cleanup_reason=\"expired\"");
  AssertContains(log_output.str(), "event=\"cleanup_summary\"");

  // Falling back to the default TTL keeps a session that would have expired
  // under the shorter override.
  const std::string default_ttl_id = "01HZX3K4M5N6P7Q8R9S0T1V2W1";
  WriteSession(store, default_ttl_id, now - seconds(1800), 0, 0, now - seconds(601));

  // Expired but still running.
  const std::string running_id = "01HZX3K4M5N6P7Q8R9S0T1V2W2";
  WriteSession(store, running_id, now - seconds(7200), 600, CurrentPid(), std::nullopt);

  // Metadata that cannot be parsed falls back to directory mtimes.
  const std::string unreadable_id = "01HZX3K4M5N6P7Q8R9S0T1V2W3";
  fs::create_directories(sessions / unreadable_id);
  {
    std::ofstream meta(sessions / unreadable_id / "meta.json", std::ios::binary);
    meta << "{not json";
  }

#if !defined(_WIN32)
  const fs::path outside = root / "outside";
  fs::create_directories(outside);
  {
    std::ofstream keep(outside / "keep.txt", std::ios::binary);
    keep << "keep\n";
  }
  fs::create_directory_symlink(outside, sessions / "escaped");
#endif

  log_output.str("");
  result = SweepOrFail(store, seconds(1800), logger, now);
  if (result.removed != 0U) {
    Fail("nothing else should be removed yet");
  }
  AssertContains(log_output.str(), "cleanup_reason=\"not_expired\"");
  AssertContains(log_output.str(), "cleanup_reason=\"active_session\"");
  AssertContains(log_output.str(), "cleanup_reason=\"unreadable_not_expired\"");
#if !defined(_WIN32)
  AssertContains(log_output.str(), "cleanup_reason=\"security_rejected\"");
#endif

  // Two hours later the default TTL has elapsed for every finished session.
  log_output.str("");
  result = SweepOrFail(store, seconds(1800), logger, now + std::chrono::hours(2));
  if (result.removed != 2U) {
    Fail("expected the default-ttl and unreadable sessions to be removed, removed=" +
         std::to_string(result.removed));
  }
  AssertContains(log_output.str(), "cleanup_reason=\"unreadable_expired\"");
  if (fs::exists(sessions / default_ttl_id) || fs::exists(sessions / unreadable_id)) {
    Fail("expired session directories should be gone");
  }
  if (!fs::exists(sessions / running_id)) {
    Fail("running sessions must never be removed");
  }
#if !defined(_WIN32)
  if (!fs::exists(outside / "keep.txt")) {
    Fail("sweeper must not follow escaping links");
  }
#endif

  runtape::retention::SweepResult ignored;
  std::string error;
  if (runtape::retention::Sweep(store, seconds(0), logger, ignored, error, now)) {
    Fail("zero ttl should be rejected");
  }
  AssertContains(error, "ttl must be positive");

  RemovePathBestEffort(root);
  return 0;
}
