#pragma once

#include "session/model.hpp"
#include "state/store_error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace runtape::state {

inline constexpr std::uint64_t kDefaultReadMaxBytes = 64U * 1024U;

struct ListQuery {
  std::string id_prefix;
  std::optional<session::SessionState> state;
  // 0 returns every match.
  std::size_t limit = 0;
};

struct SessionListing {
  std::vector<session::SessionSummary> sessions;
  // Matches before `limit` was applied.
  std::size_t total = 0;
};

// Filesystem-backed session ledger rooted at <root>/sessions/<id>/.
//
// Every operation validates the session id and resolves each artifact through
// its symlinks before touching it. Anything resolving outside the session
// directory (or a session directory resolving outside <root>/sessions) fails
// with kSymlinkEscape. Appends serialize on append.lock; reads never lock and
// only trust index records fully covered by output.bin.
class SessionStore {
public:
  SessionStore() = default;

  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;

  // Creates <root> and <root>/sessions (owner-only) when missing.
  bool Open(const std::filesystem::path& root, StoreError& error);

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::filesystem::path SessionsRoot() const;

  bool EnsureSessionDirectory(std::string_view session_id, StoreError& error) const;
  bool HasStartOrFinalMetadata(std::string_view session_id, bool& has_metadata,
                               StoreError& error) const;

  bool WriteStartMetadata(const session::StartMetadata& meta, StoreError& error) const;
  bool WriteFinalMetadata(const session::FinalMetadata& final_meta, StoreError& error) const;
  bool ReadStartMetadata(std::string_view session_id, session::StartMetadata& meta,
                         StoreError& error) const;

  // Appends one chunk and returns its start offset in cursor space. Empty
  // chunks are accepted and write nothing.
  bool AppendOutput(std::string_view session_id, session::OutputChannel channel,
                    std::string_view bytes, session::Timestamp timestamp, std::uint64_t& offset,
                    StoreError& error) const;

  // Returns committed output in [cursor, cursor + max_bytes). A cursor past
  // the end is clamped. max_bytes == 0 selects kDefaultReadMaxBytes.
  bool ReadOutput(std::string_view session_id, std::uint64_t cursor, std::uint64_t max_bytes,
                  session::OutputPage& page, StoreError& error) const;

  // Newest first by start time. Unreadable directories are skipped.
  bool ListSessions(const ListQuery& query, SessionListing& listing, StoreError& error) const;
  bool GetSession(std::string_view session_id, session::SessionDetail& detail,
                  StoreError& error) const;

  // Retention helpers.
  bool ListSessionDirectoryNames(std::vector<std::string>& names, StoreError& error) const;
  bool LatestModificationTime(std::string_view session_id, session::Timestamp& latest,
                              StoreError& error) const;
  bool RemoveSessionDirectory(std::string_view session_id, StoreError& error) const;

private:
  struct IndexSnapshot {
    std::vector<session::IndexEntry> entries;
    std::uint64_t committed_bytes = 0;
  };

  bool ResolveSessionDirectory(std::string_view session_id, std::filesystem::path& lexical_dir,
                               std::filesystem::path& real_dir, StoreError& error) const;
  bool ResolveArtifact(std::string_view session_id, std::string_view file_name,
                       std::filesystem::path& real_path, StoreError& error) const;
  bool WriteMetadataFile(std::string_view session_id, std::string_view file_name,
                         std::string_view text, StoreError& error) const;
  bool ReadFinalMetadata(std::string_view session_id,
                         std::optional<session::FinalMetadata>& final_meta,
                         StoreError& error) const;
  bool LoadIndexSnapshot(const std::filesystem::path& index_path,
                         const std::filesystem::path& output_path, IndexSnapshot& snapshot,
                         StoreError& error) const;
  bool IsTerminalForRead(std::string_view session_id, bool& terminal, StoreError& error) const;

  std::filesystem::path root_;
  std::filesystem::path real_sessions_root_;
};

} // namespace runtape::state
