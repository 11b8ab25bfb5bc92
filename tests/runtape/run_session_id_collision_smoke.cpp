#include "../common/assertions.hpp"
#include "../common/run_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"
#include "runner/run_orchestrator.hpp"
#include "session/model.hpp"
#include "state/session_store.hpp"
#include "state/state_paths.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

#if defined(_WIN32)

int main() {
  return 0;
}

#else

namespace {

using runtape::tests::common::AssertContains;
using runtape::tests::common::AssertExitCode;
using runtape::tests::common::Fail;
using runtape::tests::common::ReadFileToString;
using runtape::tests::common::SessionDir;

// Hands out the scripted candidates in order and records how many were drawn.
class ScriptedIdSource {
public:
  explicit ScriptedIdSource(std::vector<std::string> candidates)
      : candidates_(std::move(candidates)) {}

  bool Next(std::string& id, std::string& error) {
    if (calls_ >= candidates_.size()) {
      error = "scripted ids exhausted";
      return false;
    }
    id = candidates_[calls_++];
    return true;
  }

  std::size_t calls() const {
    return calls_;
  }

private:
  std::vector<std::string> candidates_;
  std::size_t calls_ = 0;
};

struct CapturedRun {
  int exit_code = 0;
  std::string err;
  runtape::runner::RunOutcome outcome;
};

CapturedRun RunWithSource(const fs::path& state_root, ScriptedIdSource& source) {
  runtape::runner::RunOptions options;
  options.command = {"sh", "-c", "true"};
  options.state_root = state_root;
  options.id_source = [&source](std::string& id, std::string& error) {
    return source.Next(id, error);
  };

  CapturedRun run;
  std::ostringstream captured_err;
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
  run.exit_code = runtape::runner::ExecuteRun(options, &run.outcome);
  std::cerr.rdbuf(original_err);
  run.err = captured_err.str();
  return run;
}

void SeedStartMetadata(const fs::path& state_root, const std::string& session_id) {
  runtape::state::SessionStore store;
  runtape::state::StoreError error;
  if (!store.Open(state_root, error)) {
    Fail("open store failed: " + error.message);
  }
  runtape::session::StartMetadata meta;
  meta.session_id = session_id;
  meta.command = {"seeded"};
  meta.started_at = std::chrono::system_clock::now();
  meta.retention_seconds = 3600;
  if (!store.WriteStartMetadata(meta, error)) {
    Fail("seed start metadata failed: " + error.message);
  }
}

void AssertSkipsTakenIds(const fs::path& state_root) {
  SeedStartMetadata(state_root, "TAKEN-ONE");
  SeedStartMetadata(state_root, "TAKEN-TWO");
  const fs::path seeded_meta_path =
      SessionDir(state_root, "TAKEN-ONE") / std::string(runtape::state::kMetaFileName);
  const std::string seeded_meta = ReadFileToString(seeded_meta_path);

  ScriptedIdSource source({"TAKEN-ONE", "TAKEN-TWO", "FREE-THREE", "UNUSED-FOUR"});
  const CapturedRun run = RunWithSource(state_root, source);
  AssertExitCode(run.exit_code, 0, "run after two collisions", run.err);
  if (run.outcome.session_id != "FREE-THREE") {
    Fail("run should take the first free candidate, got: " + run.outcome.session_id);
  }
  if (source.calls() != 3U) {
    Fail("run should stop drawing candidates once one is free");
  }
  if (!run.outcome.final_metadata.has_value() ||
      run.outcome.final_metadata->state != runtape::session::SessionState::kExited) {
    Fail("run under the free id should finish as exited");
  }

  if (ReadFileToString(seeded_meta_path) != seeded_meta) {
    Fail("colliding session metadata must stay untouched");
  }
  if (fs::exists(SessionDir(state_root, "TAKEN-ONE") /
                 std::string(runtape::state::kFinalFileName))) {
    Fail("colliding session must not receive final metadata");
  }

  const std::string log_text = ReadFileToString(runtape::state::LogFilePath(state_root));
  AssertContains(log_text, "event=\"session_id_collision\" candidate=\"TAKEN-ONE\" attempt=\"1\"");
  AssertContains(log_text, "event=\"session_id_collision\" candidate=\"TAKEN-TWO\" attempt=\"2\"");
}

void AssertExhaustionIsFatal(const fs::path& state_root) {
  ScriptedIdSource source(std::vector<std::string>(
      static_cast<std::size_t>(runtape::runner::kSessionIdAttempts) + 1U, "TAKEN-ONE"));
  const CapturedRun run = RunWithSource(state_root, source);
  AssertExitCode(run.exit_code,
                 runtape::core::errors::ToInt(runtape::core::errors::ExitCode::kFailure),
                 "run with only colliding candidates", run.err);
  AssertContains(run.err, "generate session id: too many session id collisions");
  if (source.calls() != static_cast<std::size_t>(runtape::runner::kSessionIdAttempts)) {
    Fail("id allocation should give up after the attempt budget");
  }
  if (!run.outcome.session_id.empty() || run.outcome.final_metadata.has_value()) {
    Fail("failed allocation should not report a session");
  }
  if (fs::exists(SessionDir(state_root, "TAKEN-ONE") /
                 std::string(runtape::state::kFinalFileName))) {
    Fail("failed allocation must not write final metadata");
  }
}

void AssertSourceErrorIsFatal(const fs::path& state_root) {
  ScriptedIdSource source(std::vector<std::string>{});
  const CapturedRun run = RunWithSource(state_root, source);
  AssertExitCode(run.exit_code,
                 runtape::core::errors::ToInt(runtape::core::errors::ExitCode::kFailure),
                 "run with a failing id source", run.err);
  AssertContains(run.err, "generate session id: scripted ids exhausted");
}

} // namespace

int main() {
  using runtape::tests::common::CreateUniqueTempDir;
  using runtape::tests::common::RemovePathBestEffort;

  const fs::path state_root = CreateUniqueTempDir("runtape-id-collision");
  AssertSkipsTakenIds(state_root);
  AssertExhaustionIsFatal(state_root);
  AssertSourceErrorIsFatal(state_root);

  RemovePathBestEffort(state_root);
  return 0;
}

#endif
