#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace runtape::session {

inline constexpr std::string_view kSchemaVersion = "v1alpha1";

using Timestamp = std::chrono::system_clock::time_point;

enum class SessionState {
  kStarting,
  kRunning,
  kExited,
  kSignaled,
  kFailed,
  kExpired,
};

enum class TransportMode {
  kPosixPty,
  kWindowsConPty,
  kPipe,
};

enum class OutputChannel {
  kPty,
  kStdout,
  kStderr,
};

const char* ToString(SessionState state);
const char* ToString(TransportMode mode);
const char* ToString(OutputChannel channel);

bool ParseSessionState(std::string_view raw, SessionState& state);
bool ParseTransportMode(std::string_view raw, TransportMode& mode);
bool ParseOutputChannel(std::string_view raw, OutputChannel& channel);

// Exited, signaled, failed and expired sessions will never append output
// again.
bool IsTerminal(SessionState state);

// Written once before the child produces output. `pid` is 0 until the
// transport reports the started child, then patched in place.
struct StartMetadata {
  std::string schema_version = std::string(kSchemaVersion);
  std::string session_id;
  std::vector<std::string> command;
  std::string working_directory;
  Timestamp started_at{};
  std::int64_t retention_seconds = 0;
  TransportMode transport_mode = TransportMode::kPipe;
  bool tty_attached = false;
  int pid = 0;
};

// Written exactly once when the run ends. Only the field matching `state` is
// populated: exit_code for exited, signal for signaled, error for failed.
struct FinalMetadata {
  std::string schema_version = std::string(kSchemaVersion);
  std::string session_id;
  SessionState state = SessionState::kFailed;
  Timestamp ended_at{};
  std::optional<int> exit_code;
  std::string signal;
  std::string error;
};

// One line of index.jsonl. Offsets are byte positions in output.bin.
struct IndexEntry {
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
  OutputChannel channel = OutputChannel::kStdout;
  Timestamp timestamp{};
};

struct OutputChunk {
  OutputChannel channel = OutputChannel::kStdout;
  std::uint64_t start_cursor = 0;
  std::uint64_t end_cursor = 0;
  std::string data;
  Timestamp timestamp{};
};

struct OutputPage {
  std::vector<OutputChunk> chunks;
  std::uint64_t next_cursor = 0;
  bool eof = false;
};

struct SessionSummary {
  std::string session_id;
  SessionState state = SessionState::kStarting;
  Timestamp started_at{};
  std::optional<Timestamp> ended_at;
  TransportMode transport_mode = TransportMode::kPipe;
  bool tty_attached = false;
  std::int64_t retention_seconds = 0;
  int pid = 0;
};

struct SessionDetail {
  SessionSummary summary;
  std::optional<int> exit_code;
  std::string signal;
  std::string error;
  std::uint64_t output_bytes = 0;
  std::uint64_t chunk_count = 0;
  std::optional<Timestamp> last_chunk_at;
};

} // namespace runtape::session
