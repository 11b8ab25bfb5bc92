#include "../common/assertions.hpp"
#include "../common/run_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"
#include "session/model.hpp"
#include "state/session_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace {

using runtape::tests::common::AssertContains;
using runtape::tests::common::AssertExitCode;
using runtape::tests::common::AssertNotContains;
using runtape::tests::common::DispatchWithStateRoot;
using runtape::tests::common::Fail;

constexpr int kExitFailure =
    runtape::core::errors::ToInt(runtape::core::errors::ExitCode::kFailure);
constexpr int kExitUsage = runtape::core::errors::ToInt(runtape::core::errors::ExitCode::kUsage);

void SeedFinishedSession(const fs::path& state_root, const std::string& session_id,
                         runtape::session::Timestamp started_at) {
  runtape::state::SessionStore store;
  runtape::state::StoreError error;
  if (!store.Open(state_root, error)) {
    Fail("open store failed: " + error.message);
  }

  runtape::session::StartMetadata meta;
  meta.session_id = session_id;
  meta.command = {"sh", "-c", "printf 'hi\\n'; printf 'oops' >&2"};
  meta.working_directory = state_root.string();
  meta.started_at = started_at;
  meta.retention_seconds = 3600;
  meta.transport_mode = runtape::session::TransportMode::kPipe;
  meta.pid = 4242;
  if (!store.WriteStartMetadata(meta, error)) {
    Fail("write start metadata failed: " + error.message);
  }

  std::uint64_t offset = 0;
  if (!store.AppendOutput(session_id, runtape::session::OutputChannel::kStdout, "hi\n",
                          started_at + std::chrono::milliseconds(5), offset, error) ||
      !store.AppendOutput(session_id, runtape::session::OutputChannel::kStderr, "oops",
                          started_at + std::chrono::milliseconds(6), offset, error)) {
    Fail("append output failed: " + error.message);
  }
  if (offset != 3U) {
    Fail("second chunk should start at cursor 3");
  }

  runtape::session::FinalMetadata final_meta;
  final_meta.session_id = session_id;
  final_meta.state = runtape::session::SessionState::kExited;
  final_meta.ended_at = started_at + std::chrono::seconds(1);
  final_meta.exit_code = 0;
  if (!store.WriteFinalMetadata(final_meta, error)) {
    Fail("write final metadata failed: " + error.message);
  }
}

} // namespace

int main() {
  using runtape::tests::common::CreateUniqueTempDir;
  using runtape::tests::common::RemovePathBestEffort;

  const fs::path state_root = CreateUniqueTempDir("runtape-reader-commands");
  const auto now = std::chrono::system_clock::now();
  SeedFinishedSession(state_root, "reader-older", now - std::chrono::minutes(5));
  SeedFinishedSession(state_root, "reader-newer", now);

  const auto list = DispatchWithStateRoot(state_root, {"list"});
  AssertExitCode(list.exit_code, 0, "runtape list", list.err);
  AssertContains(list.out, "reader-newer exited ");
  AssertContains(list.out, " pipe 4242\n");
  AssertContains(list.out, "total: 2");
  if (list.out.find("reader-newer") > list.out.find("reader-older")) {
    Fail("list should print newest sessions first");
  }

  const auto limited =
      DispatchWithStateRoot(state_root, {"list", "--limit", "1", "--prefix", "reader-"});
  AssertContains(limited.out, "reader-newer");
  AssertNotContains(limited.out, "reader-older");
  AssertContains(limited.out, "total: 2");

  const auto filtered = DispatchWithStateRoot(state_root, {"list", "--state", "running"});
  if (filtered.exit_code != 0) {
    Fail("list --state running should succeed");
  }
  AssertContains(filtered.out, "total: 0");

  const auto bad_state = DispatchWithStateRoot(state_root, {"list", "--state", "bogus"});
  if (bad_state.exit_code != kExitUsage) {
    Fail("unknown state filter should exit 2");
  }
  AssertContains(bad_state.err, "invalid --state 'bogus'");

  const auto show = DispatchWithStateRoot(state_root, {"show", "reader-newer"});
  AssertExitCode(show.exit_code, 0, "runtape show", show.err);
  AssertContains(show.out, "\"session_id\":\"reader-newer\"");
  AssertContains(show.out, "\"state\":\"exited\"");
  AssertContains(show.out, "\"exit_code\":0");
  AssertContains(show.out, "\"output_bytes\":7");
  AssertContains(show.out, "\"chunk_count\":2");

  const auto missing = DispatchWithStateRoot(state_root, {"show", "no-such-session"});
  AssertExitCode(missing.exit_code, kExitFailure, "show of a missing session", missing.err);
  AssertContains(missing.err, "get session: ");

  const auto traversal = DispatchWithStateRoot(state_root, {"show", "../reader-newer"});
  if (traversal.exit_code != kExitUsage) {
    Fail("show with a traversal id should exit 2");
  }

  const auto read_all = DispatchWithStateRoot(state_root, {"read", "reader-newer"});
  AssertExitCode(read_all.exit_code, 0, "runtape read", read_all.err);
  if (read_all.out != "hi\noops") {
    Fail("read should write raw captured bytes, got: " + read_all.out);
  }
  AssertContains(read_all.err, "next_cursor: 7");
  AssertContains(read_all.err, "eof: true");

  const auto read_page = DispatchWithStateRoot(
      state_root, {"read", "reader-newer", "--cursor", "1", "--max-bytes", "4"});
  if (read_page.out != "i\noo") {
    Fail("partial read should split chunks at the cursor window, got: " + read_page.out);
  }
  AssertContains(read_page.err, "next_cursor: 5");
  AssertContains(read_page.err, "eof: false");

  const auto bad_cursor =
      DispatchWithStateRoot(state_root, {"read", "reader-newer", "--cursor", "abc"});
  if (bad_cursor.exit_code != kExitUsage) {
    Fail("non-numeric cursor should exit 2");
  }
  AssertContains(bad_cursor.err, "invalid --cursor: 'abc'");

  const auto no_id = DispatchWithStateRoot(state_root, {"read"});
  if (no_id.exit_code != kExitUsage) {
    Fail("read without a session id should exit 2");
  }

  RemovePathBestEffort(state_root);
  return 0;
}
