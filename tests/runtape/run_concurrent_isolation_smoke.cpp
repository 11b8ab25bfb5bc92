#include "../common/assertions.hpp"
#include "../common/run_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "session/model.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#if !defined(_WIN32)
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

#if defined(_WIN32)

int main() {
  return 0;
}

#else

namespace {

using runtape::tests::common::Fail;

// Each recorder owns the process-wide signal relay, so concurrent runs are
// separate processes just like two shells invoking `runtape run`.
pid_t SpawnRecorder(const fs::path& state_root, const std::string& session_id,
                    const std::string& payload) {
  const pid_t pid = ::fork();
  if (pid < 0) {
    Fail("fork failed");
  }
  if (pid == 0) {
    const auto outcome = runtape::tests::common::DispatchWithStateRoot(
        state_root, {"run", "--session-id", session_id, "--", "sh", "-c",
                     "for i in 1 2 3 4 5; do printf '" + payload + "'; done"});
    ::_exit(outcome.exit_code);
  }
  return pid;
}

void WaitForSuccess(pid_t pid) {
  int status = 0;
  if (::waitpid(pid, &status, 0) != pid) {
    Fail("waitpid failed");
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    Fail("recorder process did not exit cleanly");
  }
}

void AssertIsolated(const fs::path& state_root, const std::string& session_id,
                    const std::string& payload, const std::string& foreign_payload) {
  const auto final_meta = runtape::tests::common::ReadFinalOrFail(state_root, session_id);
  if (final_meta.session_id != session_id ||
      final_meta.state != runtape::session::SessionState::kExited) {
    Fail("session did not finish as exited: " + session_id);
  }
  const auto page = runtape::tests::common::ReadAllOutputOrFail(state_root, session_id);
  const std::string captured = runtape::tests::common::ConcatChunks(page);
  if (runtape::tests::common::CountOccurrences(captured, payload) != 5U) {
    Fail("session " + session_id + " should hold its own payload five times");
  }
  if (captured.find(foreign_payload) != std::string::npos) {
    Fail("session " + session_id + " captured output from the other run");
  }
  std::uint64_t expected_cursor = 0;
  for (const auto& chunk : page.chunks) {
    if (chunk.start_cursor != expected_cursor) {
      Fail("chunk cursors are not contiguous in " + session_id);
    }
    expected_cursor = chunk.end_cursor;
  }
}

} // namespace

int main() {
  using runtape::tests::common::CollectSessionIds;
  using runtape::tests::common::CreateUniqueTempDir;
  using runtape::tests::common::RemovePathBestEffort;

  const fs::path state_root = CreateUniqueTempDir("runtape-concurrent-runs");

  const pid_t first = SpawnRecorder(state_root, "iso-alpha", "alpha.");
  const pid_t second = SpawnRecorder(state_root, "iso-bravo", "bravo.");
  WaitForSuccess(first);
  WaitForSuccess(second);

  const std::vector<std::string> ids = CollectSessionIds(state_root);
  if (ids.size() != 2U || ids[0] != "iso-alpha" || ids[1] != "iso-bravo") {
    Fail("expected exactly the two concurrent sessions");
  }
  AssertIsolated(state_root, "iso-alpha", "alpha.", "bravo.");
  AssertIsolated(state_root, "iso-bravo", "bravo.", "alpha.");

  RemovePathBestEffort(state_root);
  return 0;
}

#endif
