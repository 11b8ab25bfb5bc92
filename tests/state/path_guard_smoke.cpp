#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "session/model.hpp"
#include "state/path_guard.hpp"
#include "state/session_store.hpp"
#include "state/state_paths.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {

using runtape::state::StoreErrorCode;
using runtape::tests::common::Fail;

void ExpectCode(bool ok, const runtape::state::StoreError& error, StoreErrorCode expected,
                const std::string& context) {
  if (ok) {
    Fail(context + ": expected failure");
  }
  if (error.code != expected) {
    Fail(context + ": unexpected error code " +
         std::string(runtape::state::ToStableCode(error.code)) + " (" + error.message + ")");
  }
}

void WriteFile(const fs::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Fail("failed to write " + path.string());
  }
  out << text;
}

#if !defined(_WIN32)
runtape::session::StartMetadata MakeStartMetadata(const std::string& session_id) {
  runtape::session::StartMetadata meta;
  meta.session_id = session_id;
  meta.command = {"true"};
  meta.started_at = std::chrono::system_clock::now();
  meta.retention_seconds = 3600;
  return meta;
}

// Plants `name` as a dangling link to a missing file outside the store and
// checks every operation that touches it refuses before creating the target.
void AssertDanglingArtifactRejected(const runtape::state::SessionStore& store,
                                    const fs::path& store_root, const fs::path& outside,
                                    std::string_view name) {
  using runtape::session::OutputChannel;
  namespace state = runtape::state;

  const std::string file_name(name);
  const std::string session_id = "dangling-" + fs::path(file_name).stem().string();
  const std::string context = "dangling " + file_name;
  runtape::state::StoreError error;
  if (!store.EnsureSessionDirectory(session_id, error)) {
    Fail("ensure session directory failed: " + error.message);
  }
  const fs::path session_dir = store_root / std::string(state::kSessionsDirName) / session_id;
  const fs::path target = outside / (file_name + ".target");
  fs::create_symlink(target, session_dir / file_name);

  bool has_metadata = false;
  if (name == state::kMetaFileName || name == state::kFinalFileName) {
    // Start metadata short-circuits the final lookup, so check before it exists.
    ExpectCode(store.HasStartOrFinalMetadata(session_id, has_metadata, error), error,
               StoreErrorCode::kSymlinkEscape, context + ": has metadata");
  }
  if (name == state::kMetaFileName) {
    ExpectCode(store.WriteStartMetadata(MakeStartMetadata(session_id), error), error,
               StoreErrorCode::kSymlinkEscape, context + ": write start metadata");
  } else if (!store.WriteStartMetadata(MakeStartMetadata(session_id), error)) {
    Fail(context + ": write start metadata failed: " + error.message);
  }
  if (name == state::kFinalFileName) {
    runtape::session::FinalMetadata final_meta;
    final_meta.session_id = session_id;
    final_meta.state = runtape::session::SessionState::kExited;
    final_meta.ended_at = std::chrono::system_clock::now();
    final_meta.exit_code = 0;
    ExpectCode(store.WriteFinalMetadata(final_meta, error), error,
               StoreErrorCode::kSymlinkEscape, context + ": write final metadata");
  }

  std::uint64_t offset = 0;
  const bool append_ok = store.AppendOutput(session_id, OutputChannel::kStdout, "leak",
                                            std::chrono::system_clock::now(), offset, error);
  if (name == state::kMetaFileName || name == state::kFinalFileName) {
    if (!append_ok) {
      Fail(context + ": append should not touch metadata: " + error.message);
    }
  } else {
    ExpectCode(append_ok, error, StoreErrorCode::kSymlinkEscape, context + ": append output");
  }

  if (name != state::kLockFileName) {
    runtape::session::OutputPage page;
    ExpectCode(store.ReadOutput(session_id, 0, 0, page, error), error,
               StoreErrorCode::kSymlinkEscape, context + ": read output");
    runtape::session::SessionDetail detail;
    ExpectCode(store.GetSession(session_id, detail, error), error,
               StoreErrorCode::kSymlinkEscape, context + ": get session");
  }

  if (fs::exists(target) || fs::is_symlink(fs::symlink_status(target))) {
    Fail(context + ": link target outside the store must not be created");
  }
}
#endif

} // namespace

int main() {
  using runtape::session::OutputChannel;
  using runtape::tests::common::CreateUniqueTempDir;
  using runtape::tests::common::RemovePathBestEffort;

  const fs::path root = CreateUniqueTempDir("runtape-path-guard-smoke");
  const fs::path store_root = root / "state";
  const fs::path outside = root / "outside";
  fs::create_directories(outside);
  WriteFile(outside / "secret.txt", "do not touch\n");

  runtape::state::SessionStore store;
  runtape::state::StoreError error;
  if (!store.Open(store_root, error)) {
    Fail("open store failed: " + error.message);
  }

  const std::vector<std::string> bad_ids = {"", ".", "..", "../outside", "a/b", "a\\b",
                                            std::string("a\0b", 3)};
  for (const std::string& bad_id : bad_ids) {
    std::uint64_t offset = 0;
    ExpectCode(store.AppendOutput(bad_id, OutputChannel::kStdout, "x",
                                  std::chrono::system_clock::now(), offset, error),
               error, StoreErrorCode::kInvalidSessionId, "append with bad id");
    runtape::session::OutputPage page;
    ExpectCode(store.ReadOutput(bad_id, 0, 0, page, error), error,
               StoreErrorCode::kInvalidSessionId, "read with bad id");
    runtape::session::SessionDetail detail;
    ExpectCode(store.GetSession(bad_id, detail, error), error, StoreErrorCode::kInvalidSessionId,
               "get with bad id");
    ExpectCode(store.EnsureSessionDirectory(bad_id, error), error,
               StoreErrorCode::kInvalidSessionId, "ensure with bad id");
  }
  if (fs::exists(store_root / "outside") || fs::exists(root / "a")) {
    Fail("rejected ids must not create directories");
  }

#if !defined(_WIN32)
  // Session directory linked outside the store.
  fs::create_directory_symlink(outside, store_root / "sessions" / "escaped");
  runtape::session::SessionDetail detail;
  ExpectCode(store.GetSession("escaped", detail, error), error, StoreErrorCode::kSymlinkEscape,
             "get through escaping session directory");
  std::uint64_t offset = 0;
  ExpectCode(store.AppendOutput("escaped", OutputChannel::kStdout, "x",
                                std::chrono::system_clock::now(), offset, error),
             error, StoreErrorCode::kSymlinkEscape, "append through escaping session directory");
  if (fs::exists(outside / "output.bin")) {
    Fail("escaping append must not write outside the store");
  }

  // Artifact inside a real session directory linked outside it.
  const std::string id = "01HZX3K4M5N6P7Q8R9S0T1V2W3";
  if (!store.EnsureSessionDirectory(id, error)) {
    Fail("ensure session directory failed: " + error.message);
  }
  fs::create_symlink(outside / "secret.txt", store_root / "sessions" / id / "output.bin");
  runtape::session::OutputPage page;
  ExpectCode(store.ReadOutput(id, 0, 0, page, error), error, StoreErrorCode::kSymlinkEscape,
             "read through escaping artifact");
  ExpectCode(store.AppendOutput(id, OutputChannel::kStdout, "x", std::chrono::system_clock::now(),
                                offset, error),
             error, StoreErrorCode::kSymlinkEscape, "append through escaping artifact");
  if (runtape::tests::common::ReadFileToString(outside / "secret.txt") != "do not touch\n") {
    Fail("escaping artifact target must stay unchanged");
  }

  // Links that stay inside the session directory are followed.
  const std::string inner_id = "01HZX3K4M5N6P7Q8R9S0T1V2W4";
  if (!store.EnsureSessionDirectory(inner_id, error)) {
    Fail("ensure session directory failed: " + error.message);
  }
  const fs::path inner_dir = store_root / "sessions" / inner_id;
  WriteFile(inner_dir / "data.bin", "");
  fs::create_symlink(inner_dir / "data.bin", inner_dir / "output.bin");
  if (!store.AppendOutput(inner_id, OutputChannel::kStdout, "inside",
                          std::chrono::system_clock::now(), offset, error)) {
    Fail("append through in-session link failed: " + error.message);
  }
  if (!store.ReadOutput(inner_id, 0, 0, page, error) || page.chunks.size() != 1U ||
      page.chunks.front().data != "inside") {
    Fail("read through in-session link should return the appended bytes");
  }
  if (runtape::tests::common::ReadFileToString(inner_dir / "data.bin") != "inside") {
    Fail("in-session link target should hold the output bytes");
  }

  // Path helpers agree with the store.
  fs::path resolved;
  std::string resolve_error;
  if (!runtape::state::ResolveRealPath(store_root / "sessions" / "escaped" / "missing.txt",
                                       resolved, resolve_error)) {
    Fail("resolve real path failed: " + resolve_error);
  }
  fs::path real_outside;
  if (!runtape::state::ResolveRealPath(outside, real_outside, resolve_error) ||
      resolved != real_outside / "missing.txt") {
    Fail("resolve real path should follow links and append missing components");
  }
  fs::path real_sessions;
  if (!runtape::state::ResolveRealPath(store_root / "sessions", real_sessions, resolve_error)) {
    Fail("resolve sessions root failed: " + resolve_error);
  }
  if (runtape::state::IsStrictDescendant(real_sessions, resolved) ||
      runtape::state::IsStrictDescendant(real_sessions, real_sessions) ||
      !runtape::state::IsStrictDescendant(real_sessions, real_sessions / inner_id)) {
    Fail("strict descendant check disagrees with the session layout");
  }

  // Dangling links for every session artifact.
  for (const std::string_view name :
       {runtape::state::kMetaFileName, runtape::state::kFinalFileName,
        runtape::state::kOutputFileName, runtape::state::kIndexFileName,
        runtape::state::kLockFileName}) {
    AssertDanglingArtifactRejected(store, store_root, outside, name);
  }

  // Dangling session directory link.
  fs::create_directory_symlink(outside / "missing-dir", store_root / "sessions" / "dangling-dir");
  ExpectCode(store.EnsureSessionDirectory("dangling-dir", error), error,
             StoreErrorCode::kSymlinkEscape, "ensure through dangling session directory");
  ExpectCode(store.WriteStartMetadata(MakeStartMetadata("dangling-dir"), error), error,
             StoreErrorCode::kSymlinkEscape, "write start through dangling session directory");
  ExpectCode(store.AppendOutput("dangling-dir", OutputChannel::kStdout, "x",
                                std::chrono::system_clock::now(), offset, error),
             error, StoreErrorCode::kSymlinkEscape, "append through dangling session directory");
  if (fs::exists(outside / "missing-dir")) {
    Fail("dangling session directory target must not be created");
  }
#endif

  RemovePathBestEffort(root);
  return 0;
}
