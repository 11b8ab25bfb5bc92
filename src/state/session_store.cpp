#include "state/session_store.hpp"

#include "core/fs_utils.hpp"
#include "session/metadata_json.hpp"
#include "state/file_lock.hpp"
#include "state/path_guard.hpp"
#include "state/process_probe.hpp"
#include "state/state_paths.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <memory>
#include <system_error>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace runtape::state {

namespace {

constexpr std::uint64_t kIndexTailWindow = 64U * 1024U;

constexpr std::string_view kSessionArtifacts[] = {
    kMetaFileName, kFinalFileName, kOutputFileName, kIndexFileName, kLockFileName,
};

struct FileCloser {
  void operator()(std::FILE* file) const {
    if (file != nullptr) {
      std::fclose(file);
    }
  }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

bool ValidateSessionId(std::string_view session_id, StoreError& error) {
  if (session_id.empty()) {
    return SetStoreError(error, StoreErrorCode::kInvalidSessionId, "session id is empty");
  }
  if (session_id == "." || session_id.find("..") != std::string_view::npos) {
    return SetStoreError(error, StoreErrorCode::kInvalidSessionId,
                         "session id contains invalid path segment: " + std::string(session_id));
  }
  if (session_id.find_first_of("/\\") != std::string_view::npos) {
    return SetStoreError(error, StoreErrorCode::kInvalidSessionId,
                         "session id contains path separator: " + std::string(session_id));
  }
  if (session_id.find('\0') != std::string_view::npos) {
    return SetStoreError(error, StoreErrorCode::kInvalidSessionId,
                         "session id contains NUL byte");
  }
  return true;
}

session::Timestamp ToSystemTime(fs::file_time_type file_time) {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      file_time - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
}

FilePtr OpenForAppend(const fs::path& path) {
#if defined(_WIN32)
  return FilePtr(_wfopen(path.wstring().c_str(), L"ab"));
#else
  return FilePtr(std::fopen(path.c_str(), "ab"));
#endif
}

bool SyncFile(std::FILE* file) {
  if (std::fflush(file) != 0) {
    return false;
  }
#if defined(_WIN32)
  return _commit(_fileno(file)) == 0;
#else
  return ::fsync(fileno(file)) == 0;
#endif
}

// Appends `bytes` and forces them to stable storage before returning.
bool AppendDurably(const fs::path& path, std::string_view bytes, std::string& error) {
  std::error_code ec;
  const bool created = !fs::exists(path, ec);

  FilePtr file = OpenForAppend(path);
  if (!file) {
    error = "open '" + path.string() + "': " + std::strerror(errno);
    return false;
  }
  if (created) {
    fs::permissions(path, core::kPrivateFilePerms, fs::perm_options::replace, ec);
  }
  if (!bytes.empty() && std::fwrite(bytes.data(), 1, bytes.size(), file.get()) != bytes.size()) {
    error = "write '" + path.string() + "': " + std::strerror(errno);
    return false;
  }
  if (!SyncFile(file.get())) {
    error = "sync '" + path.string() + "': " + std::strerror(errno);
    return false;
  }
  return true;
}

bool ReadRange(const fs::path& path, std::uint64_t offset, std::uint64_t length, std::string& out,
               std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "open '" + path.string() + "' for reading failed";
    return false;
  }
  file.seekg(static_cast<std::streamoff>(offset));
  out.resize(static_cast<std::size_t>(length));
  file.read(out.data(), static_cast<std::streamsize>(length));
  if (file.gcount() != static_cast<std::streamsize>(length)) {
    error = "short read from '" + path.string() + "'";
    return false;
  }
  return true;
}

bool IsBlank(std::string_view line) {
  return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

// Cuts a torn trailing line left by a writer that died mid-append and
// reports the end offset of the newest committed record.
bool RepairIndexTail(const fs::path& index_path, std::uint64_t& committed_end, std::string& error) {
  committed_end = 0;
  std::error_code ec;
  if (!fs::exists(index_path, ec)) {
    return true;
  }
  std::uint64_t size = fs::file_size(index_path, ec);
  if (ec) {
    error = "stat index '" + index_path.string() + "': " + ec.message();
    return false;
  }

  std::uint64_t window = kIndexTailWindow;
  while (size > 0U) {
    const std::uint64_t start = size > window ? size - window : 0U;
    std::string tail;
    if (!ReadRange(index_path, start, size - start, tail, error)) {
      return false;
    }

    if (tail.back() != '\n') {
      const std::size_t last_newline = tail.rfind('\n');
      if (last_newline == std::string::npos && start != 0U) {
        window *= 2U;
        continue;
      }
      const std::uint64_t repaired =
          last_newline == std::string::npos ? 0U : start + last_newline + 1U;
      fs::resize_file(index_path, repaired, ec);
      if (ec) {
        error = "truncate torn index tail '" + index_path.string() + "': " + ec.message();
        return false;
      }
      size = repaired;
      if (last_newline == std::string::npos) {
        return true;
      }
      tail.resize(last_newline + 1U);
    }

    std::size_t line_end = tail.size() - 1U;
    while (true) {
      const std::size_t prev = line_end == 0U ? std::string::npos : tail.rfind('\n', line_end - 1U);
      if (prev == std::string::npos && start != 0U) {
        break;
      }
      const std::size_t line_start = prev == std::string::npos ? 0U : prev + 1U;
      const std::string_view line(tail.data() + line_start, line_end - line_start);
      session::IndexEntry entry;
      std::string parse_error;
      if (!IsBlank(line) && session::ParseIndexEntry(line, entry, parse_error)) {
        committed_end = entry.offset + entry.length;
        return true;
      }
      if (prev == std::string::npos) {
        return true;
      }
      line_end = prev;
    }
    window *= 2U;
  }
  return true;
}

session::SessionState InferOpenSessionState(const session::StartMetadata& meta) {
  if (meta.pid == 0) {
    return session::SessionState::kStarting;
  }
  if (IsProcessAlive(meta.pid)) {
    return session::SessionState::kRunning;
  }
  return session::SessionState::kFailed;
}

} // namespace

bool SessionStore::Open(const fs::path& root, StoreError& error) {
  error.Clear();
  if (root.empty()) {
    return SetStoreError(error, StoreErrorCode::kIo, "state root is empty");
  }

  std::string fs_error;
  if (!core::EnsurePrivateDirectory(root, fs_error) ||
      !core::EnsurePrivateDirectory(root / std::string(kSessionsDirName), fs_error)) {
    return SetStoreError(error, StoreErrorCode::kIo, fs_error);
  }

  fs::path real_sessions_root;
  if (!ResolveRealPath(root / std::string(kSessionsDirName), real_sessions_root, fs_error)) {
    return SetStoreError(error, StoreErrorCode::kIo, fs_error);
  }

  root_ = root;
  real_sessions_root_ = real_sessions_root;
  return true;
}

fs::path SessionStore::SessionsRoot() const {
  return root_ / std::string(kSessionsDirName);
}

bool SessionStore::ResolveSessionDirectory(std::string_view session_id, fs::path& lexical_dir,
                                           fs::path& real_dir, StoreError& error) const {
  if (!ValidateSessionId(session_id, error)) {
    return false;
  }
  if (real_sessions_root_.empty()) {
    return SetStoreError(error, StoreErrorCode::kIo, "session store is not open");
  }

  lexical_dir = SessionsRoot() / std::string(session_id);
  std::string resolve_error;
  if (!ResolveRealPath(lexical_dir, real_dir, resolve_error)) {
    return SetStoreError(error, StoreErrorCode::kIo, resolve_error);
  }
  if (!IsStrictDescendant(real_sessions_root_, real_dir)) {
    return SetStoreError(error, StoreErrorCode::kSymlinkEscape,
                         "symlink escape: session directory '" + lexical_dir.string() +
                             "' resolves to '" + real_dir.string() + "' outside '" +
                             real_sessions_root_.string() + "'");
  }
  return true;
}

bool SessionStore::ResolveArtifact(std::string_view session_id, std::string_view file_name,
                                   fs::path& real_path, StoreError& error) const {
  fs::path lexical_dir;
  fs::path real_dir;
  if (!ResolveSessionDirectory(session_id, lexical_dir, real_dir, error)) {
    return false;
  }

  const fs::path lexical_path = lexical_dir / std::string(file_name);
  std::string resolve_error;
  if (!ResolveRealPath(lexical_path, real_path, resolve_error)) {
    return SetStoreError(error, StoreErrorCode::kIo, resolve_error);
  }
  if (!IsStrictDescendant(real_dir, real_path)) {
    return SetStoreError(error, StoreErrorCode::kSymlinkEscape,
                         "symlink escape: session artifact '" + lexical_path.string() +
                             "' resolves to '" + real_path.string() + "' outside '" +
                             real_dir.string() + "'");
  }
  return true;
}

bool SessionStore::EnsureSessionDirectory(std::string_view session_id, StoreError& error) const {
  error.Clear();
  fs::path lexical_dir;
  fs::path real_dir;
  if (!ResolveSessionDirectory(session_id, lexical_dir, real_dir, error)) {
    return false;
  }

  std::error_code ec;
  if (fs::is_directory(real_dir, ec)) {
    return true;
  }
  std::string fs_error;
  if (!core::EnsurePrivateDirectory(real_dir, fs_error)) {
    return SetStoreError(error, StoreErrorCode::kIo, "prepare session directory: " + fs_error);
  }
  return true;
}

bool SessionStore::HasStartOrFinalMetadata(std::string_view session_id, bool& has_metadata,
                                           StoreError& error) const {
  error.Clear();
  has_metadata = false;
  for (const std::string_view name : {kMetaFileName, kFinalFileName}) {
    fs::path path;
    if (!ResolveArtifact(session_id, name, path, error)) {
      return false;
    }
    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    if (ec) {
      return SetStoreError(error, StoreErrorCode::kIo,
                           "stat '" + path.string() + "': " + ec.message());
    }
    if (exists) {
      has_metadata = true;
      return true;
    }
  }
  return true;
}

bool SessionStore::WriteMetadataFile(std::string_view session_id, std::string_view file_name,
                                     std::string_view text, StoreError& error) const {
  if (!EnsureSessionDirectory(session_id, error)) {
    return false;
  }
  fs::path path;
  if (!ResolveArtifact(session_id, file_name, path, error)) {
    return false;
  }
  std::string write_error;
  if (!core::WriteTextFileAtomic(path, text, write_error)) {
    return SetStoreError(error, StoreErrorCode::kIo, write_error);
  }
  return true;
}

bool SessionStore::WriteStartMetadata(const session::StartMetadata& meta,
                                      StoreError& error) const {
  error.Clear();
  return WriteMetadataFile(meta.session_id, kMetaFileName, session::ToJson(meta), error);
}

bool SessionStore::WriteFinalMetadata(const session::FinalMetadata& final_meta,
                                      StoreError& error) const {
  error.Clear();
  return WriteMetadataFile(final_meta.session_id, kFinalFileName, session::ToJson(final_meta),
                           error);
}

bool SessionStore::ReadStartMetadata(std::string_view session_id, session::StartMetadata& meta,
                                     StoreError& error) const {
  error.Clear();
  fs::path path;
  if (!ResolveArtifact(session_id, kMetaFileName, path, error)) {
    return false;
  }

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (!fs::is_directory(path.parent_path(), ec)) {
      return SetStoreError(error, StoreErrorCode::kNotFound,
                           "session not found: " + std::string(session_id));
    }
    return SetStoreError(error, StoreErrorCode::kNotFound,
                         "session " + std::string(session_id) + " has no start metadata");
  }

  std::string text;
  std::string read_error;
  if (!core::ReadTextFile(path, text, read_error)) {
    return SetStoreError(error, StoreErrorCode::kIo, read_error);
  }
  std::string parse_error;
  if (!session::ParseStartMetadata(text, meta, parse_error)) {
    return SetStoreError(error, StoreErrorCode::kCorrupt,
                         "read meta file '" + path.string() + "': " + parse_error);
  }
  return true;
}

bool SessionStore::ReadFinalMetadata(std::string_view session_id,
                                     std::optional<session::FinalMetadata>& final_meta,
                                     StoreError& error) const {
  final_meta.reset();
  fs::path path;
  if (!ResolveArtifact(session_id, kFinalFileName, path, error)) {
    return false;
  }

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return true;
  }

  std::string text;
  std::string read_error;
  if (!core::ReadTextFile(path, text, read_error)) {
    return SetStoreError(error, StoreErrorCode::kIo, read_error);
  }
  session::FinalMetadata parsed;
  std::string parse_error;
  if (!session::ParseFinalMetadata(text, parsed, parse_error)) {
    return SetStoreError(error, StoreErrorCode::kCorrupt,
                         "read final file '" + path.string() + "': " + parse_error);
  }
  final_meta = std::move(parsed);
  return true;
}

bool SessionStore::AppendOutput(std::string_view session_id, session::OutputChannel channel,
                                std::string_view bytes, session::Timestamp timestamp,
                                std::uint64_t& offset, StoreError& error) const {
  error.Clear();
  offset = 0;
  if (!ValidateSessionId(session_id, error)) {
    return false;
  }
  if (bytes.empty()) {
    return true;
  }
  if (!EnsureSessionDirectory(session_id, error)) {
    return false;
  }

  fs::path lock_path;
  fs::path output_path;
  fs::path index_path;
  if (!ResolveArtifact(session_id, kLockFileName, lock_path, error) ||
      !ResolveArtifact(session_id, kOutputFileName, output_path, error) ||
      !ResolveArtifact(session_id, kIndexFileName, index_path, error)) {
    return false;
  }

  // Repair and append run under one lock so a concurrent writer cannot see a
  // tail that is mid-repair or claim the same offset.
  ExclusiveFileLock lock;
  std::string io_error;
  if (!lock.Acquire(lock_path, io_error)) {
    return SetStoreError(error, StoreErrorCode::kIo, io_error);
  }

  std::uint64_t committed_end = 0;
  if (!RepairIndexTail(index_path, committed_end, io_error)) {
    return SetStoreError(error, StoreErrorCode::kIo, io_error);
  }

  std::error_code ec;
  const std::uint64_t output_size = fs::exists(output_path, ec) ? fs::file_size(output_path, ec) : 0U;
  if (ec) {
    return SetStoreError(error, StoreErrorCode::kIo,
                         "stat output file '" + output_path.string() + "': " + ec.message());
  }
  if (output_size < committed_end) {
    return SetStoreError(error, StoreErrorCode::kCorrupt,
                         "output file '" + output_path.string() + "' is shorter (" +
                             std::to_string(output_size) + " bytes) than its index (" +
                             std::to_string(committed_end) + " bytes)");
  }
  if (output_size > committed_end) {
    // Bytes without an index record belong to an interrupted append.
    fs::resize_file(output_path, committed_end, ec);
    if (ec) {
      return SetStoreError(error, StoreErrorCode::kIo,
                           "truncate uncommitted output '" + output_path.string() +
                               "': " + ec.message());
    }
  }

  // Output is synced before its index record so a committed record never
  // points past the bytes on disk.
  if (!AppendDurably(output_path, bytes, io_error)) {
    return SetStoreError(error, StoreErrorCode::kIo, "write output file: " + io_error);
  }

  session::IndexEntry entry;
  entry.offset = committed_end;
  entry.length = bytes.size();
  entry.channel = channel;
  entry.timestamp = timestamp;
  if (!AppendDurably(index_path, session::ToJson(entry) + "\n", io_error)) {
    return SetStoreError(error, StoreErrorCode::kIo, "write index file: " + io_error);
  }

  offset = committed_end;
  return true;
}

bool SessionStore::LoadIndexSnapshot(const fs::path& index_path, const fs::path& output_path,
                                     IndexSnapshot& snapshot, StoreError& error) const {
  snapshot = IndexSnapshot{};

  std::error_code ec;
  std::string text;
  if (fs::exists(index_path, ec)) {
    std::string read_error;
    if (!core::ReadTextFile(index_path, text, read_error)) {
      return SetStoreError(error, StoreErrorCode::kIo, "read index file: " + read_error);
    }
  }

  std::uint64_t output_size = 0;
  if (fs::exists(output_path, ec)) {
    output_size = fs::file_size(output_path, ec);
    if (ec) {
      return SetStoreError(error, StoreErrorCode::kIo,
                           "stat output file '" + output_path.string() + "': " + ec.message());
    }
  }

  std::size_t line_start = 0;
  while (line_start < text.size()) {
    const std::size_t newline = text.find('\n', line_start);
    if (newline == std::string::npos) {
      // Torn tail of an in-flight append.
      break;
    }
    const std::string_view line(text.data() + line_start, newline - line_start);
    line_start = newline + 1U;
    if (IsBlank(line)) {
      continue;
    }

    session::IndexEntry entry;
    std::string parse_error;
    if (!session::ParseIndexEntry(line, entry, parse_error)) {
      continue;
    }
    const std::uint64_t end = entry.offset + entry.length;
    if (end < entry.offset || end > output_size) {
      continue;
    }
    snapshot.committed_bytes = std::max(snapshot.committed_bytes, end);
    snapshot.entries.push_back(entry);
  }
  return true;
}

bool SessionStore::IsTerminalForRead(std::string_view session_id, bool& terminal,
                                     StoreError& error) const {
  std::optional<session::FinalMetadata> final_meta;
  if (!ReadFinalMetadata(session_id, final_meta, error)) {
    return false;
  }
  if (final_meta.has_value()) {
    terminal = true;
    return true;
  }

  session::StartMetadata meta;
  if (!ReadStartMetadata(session_id, meta, error)) {
    if (error.code != StoreErrorCode::kNotFound) {
      return false;
    }
    // Nothing will ever write to a session without start metadata.
    error.Clear();
    terminal = true;
    return true;
  }
  terminal = session::IsTerminal(InferOpenSessionState(meta));
  return true;
}

bool SessionStore::ReadOutput(std::string_view session_id, std::uint64_t cursor,
                              std::uint64_t max_bytes, session::OutputPage& page,
                              StoreError& error) const {
  error.Clear();
  page = session::OutputPage{};
  page.next_cursor = cursor;
  if (max_bytes == 0U) {
    max_bytes = kDefaultReadMaxBytes;
  }

  fs::path lexical_dir;
  fs::path real_dir;
  if (!ResolveSessionDirectory(session_id, lexical_dir, real_dir, error)) {
    return false;
  }
  std::error_code ec;
  if (!fs::is_directory(real_dir, ec)) {
    return SetStoreError(error, StoreErrorCode::kNotFound,
                         "session not found: " + std::string(session_id));
  }

  fs::path index_path;
  fs::path output_path;
  if (!ResolveArtifact(session_id, kIndexFileName, index_path, error) ||
      !ResolveArtifact(session_id, kOutputFileName, output_path, error)) {
    return false;
  }

  // Decide liveness before reading bytes so a session that ends between the
  // two steps is reported as not yet at eof.
  bool terminal = false;
  if (!IsTerminalForRead(session_id, terminal, error)) {
    return false;
  }

  IndexSnapshot snapshot;
  if (!LoadIndexSnapshot(index_path, output_path, snapshot, error)) {
    return false;
  }

  cursor = std::min(cursor, snapshot.committed_bytes);
  page.next_cursor = cursor;

  std::ifstream output;
  std::uint64_t remaining = max_bytes;
  for (const session::IndexEntry& entry : snapshot.entries) {
    const std::uint64_t entry_end = entry.offset + entry.length;
    if (entry_end <= cursor) {
      continue;
    }
    if (remaining == 0U) {
      break;
    }

    const std::uint64_t chunk_start = std::max(entry.offset, cursor);
    const std::uint64_t chunk_end = std::min(entry_end, chunk_start + remaining);
    if (chunk_end <= chunk_start) {
      continue;
    }

    if (!output.is_open()) {
      output.open(output_path, std::ios::binary);
      if (!output) {
        return SetStoreError(error, StoreErrorCode::kIo,
                             "open output file '" + output_path.string() + "' failed");
      }
    }

    session::OutputChunk chunk;
    chunk.channel = entry.channel;
    chunk.start_cursor = chunk_start;
    chunk.end_cursor = chunk_end;
    chunk.timestamp = entry.timestamp;
    chunk.data.resize(static_cast<std::size_t>(chunk_end - chunk_start));
    output.seekg(static_cast<std::streamoff>(chunk_start));
    output.read(chunk.data.data(), static_cast<std::streamsize>(chunk.data.size()));
    if (output.gcount() != static_cast<std::streamsize>(chunk.data.size())) {
      return SetStoreError(error, StoreErrorCode::kIo,
                           "read output chunk at " + std::to_string(chunk_start) + " failed");
    }

    page.chunks.push_back(std::move(chunk));
    page.next_cursor = chunk_end;
    remaining -= chunk_end - chunk_start;
  }

  page.eof = page.next_cursor >= snapshot.committed_bytes && terminal;
  return true;
}

bool SessionStore::GetSession(std::string_view session_id, session::SessionDetail& detail,
                              StoreError& error) const {
  error.Clear();
  session::StartMetadata meta;
  if (!ReadStartMetadata(session_id, meta, error)) {
    return false;
  }
  std::optional<session::FinalMetadata> final_meta;
  if (!ReadFinalMetadata(session_id, final_meta, error)) {
    return false;
  }

  fs::path index_path;
  fs::path output_path;
  if (!ResolveArtifact(session_id, kIndexFileName, index_path, error) ||
      !ResolveArtifact(session_id, kOutputFileName, output_path, error)) {
    return false;
  }
  IndexSnapshot snapshot;
  if (!LoadIndexSnapshot(index_path, output_path, snapshot, error)) {
    return false;
  }

  session::SessionDetail result;
  result.summary.session_id = meta.session_id;
  result.summary.started_at = meta.started_at;
  result.summary.transport_mode = meta.transport_mode;
  result.summary.tty_attached = meta.tty_attached;
  result.summary.retention_seconds = meta.retention_seconds;
  result.summary.pid = meta.pid;
  if (final_meta.has_value()) {
    result.summary.state = final_meta->state;
    result.summary.ended_at = final_meta->ended_at;
    result.exit_code = final_meta->exit_code;
    result.signal = final_meta->signal;
    result.error = final_meta->error;
  } else {
    result.summary.state = InferOpenSessionState(meta);
  }

  result.output_bytes = snapshot.committed_bytes;
  result.chunk_count = snapshot.entries.size();
  if (!snapshot.entries.empty()) {
    result.last_chunk_at = snapshot.entries.back().timestamp;
  }

  detail = std::move(result);
  return true;
}

bool SessionStore::ListSessionDirectoryNames(std::vector<std::string>& names,
                                             StoreError& error) const {
  error.Clear();
  names.clear();

  std::error_code ec;
  fs::directory_iterator it(SessionsRoot(), ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      return true;
    }
    return SetStoreError(error, StoreErrorCode::kIo,
                         "read sessions directory: " + ec.message());
  }

  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      return SetStoreError(error, StoreErrorCode::kIo,
                           "read sessions directory: " + ec.message());
    }
    std::error_code entry_ec;
    if (it->is_directory(entry_ec) || it->is_symlink(entry_ec)) {
      names.push_back(it->path().filename().string());
    }
  }
  if (ec) {
    return SetStoreError(error, StoreErrorCode::kIo, "read sessions directory: " + ec.message());
  }

  std::sort(names.begin(), names.end());
  return true;
}

bool SessionStore::ListSessions(const ListQuery& query, SessionListing& listing,
                                StoreError& error) const {
  error.Clear();
  listing = SessionListing{};

  std::vector<std::string> names;
  if (!ListSessionDirectoryNames(names, error)) {
    return false;
  }

  for (const std::string& name : names) {
    if (!query.id_prefix.empty() && name.rfind(query.id_prefix, 0) != 0U) {
      continue;
    }
    session::SessionDetail detail;
    StoreError detail_error;
    if (!GetSession(name, detail, detail_error)) {
      continue;
    }
    if (query.state.has_value() && detail.summary.state != *query.state) {
      continue;
    }
    listing.sessions.push_back(detail.summary);
  }

  std::stable_sort(listing.sessions.begin(), listing.sessions.end(),
                   [](const session::SessionSummary& lhs, const session::SessionSummary& rhs) {
                     return lhs.started_at > rhs.started_at;
                   });

  listing.total = listing.sessions.size();
  if (query.limit > 0U && listing.sessions.size() > query.limit) {
    listing.sessions.resize(query.limit);
  }
  return true;
}

bool SessionStore::LatestModificationTime(std::string_view session_id,
                                          session::Timestamp& latest, StoreError& error) const {
  error.Clear();
  fs::path lexical_dir;
  fs::path real_dir;
  if (!ResolveSessionDirectory(session_id, lexical_dir, real_dir, error)) {
    return false;
  }

  std::error_code ec;
  const fs::file_time_type dir_time = fs::last_write_time(real_dir, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      return SetStoreError(error, StoreErrorCode::kNotFound,
                           "session not found: " + std::string(session_id));
    }
    return SetStoreError(error, StoreErrorCode::kIo,
                         "stat session directory '" + real_dir.string() + "': " + ec.message());
  }
  latest = ToSystemTime(dir_time);

  for (const std::string_view name : kSessionArtifacts) {
    fs::path path;
    if (!ResolveArtifact(session_id, name, path, error)) {
      return false;
    }
    const fs::file_time_type artifact_time = fs::last_write_time(path, ec);
    if (ec) {
      continue;
    }
    latest = std::max(latest, ToSystemTime(artifact_time));
  }
  return true;
}

bool SessionStore::RemoveSessionDirectory(std::string_view session_id, StoreError& error) const {
  error.Clear();
  fs::path lexical_dir;
  fs::path real_dir;
  if (!ResolveSessionDirectory(session_id, lexical_dir, real_dir, error)) {
    return false;
  }

  std::error_code ec;
  fs::remove_all(lexical_dir, ec);
  if (ec) {
    return SetStoreError(error, StoreErrorCode::kIo,
                         "remove session directory '" + lexical_dir.string() +
                             "': " + ec.message());
  }
  return true;
}

} // namespace runtape::state
