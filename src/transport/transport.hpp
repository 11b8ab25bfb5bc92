#pragma once

#include "capture/output_sink.hpp"
#include "session/model.hpp"
#include "transport/cancellation.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace runtape::transport {

enum class TransportErrorCode {
  kNone,
  kUnimplemented,
  kInvalidRequest,
  kSpawnFailed,
  kStartCallbackFailed,
  kIo,
  kWaitFailed,
};

struct TransportError {
  TransportErrorCode code = TransportErrorCode::kNone;
  std::string message;
};

std::string_view ToStableCode(TransportErrorCode code);

inline bool SetTransportError(TransportError& error, TransportErrorCode code,
                              std::string message) {
  error.code = code;
  error.message = std::move(message);
  return false;
}

// Invoked once the child pid is known and before any output is copied. A
// false return kills and reaps the child, and Run fails with
// kStartCallbackFailed carrying the callback's error text.
using StartCallback = std::function<bool(int pid, std::string& error)>;

struct RunRequest {
  std::vector<std::string> command;
  // Empty inherits the recorder's working directory.
  std::filesystem::path working_directory;
  StartCallback on_start;
  const CancellationToken* cancel = nullptr;
};

// Pty transports write the combined terminal stream to `terminal`. The pipe
// transport writes to `stdout_sink` and `stderr_sink`.
struct OutputSinks {
  capture::IOutputSink* terminal = nullptr;
  capture::IOutputSink* stdout_sink = nullptr;
  capture::IOutputSink* stderr_sink = nullptr;
};

// Exactly one of exit_code or signal_name is set after a successful Run.
struct RunResult {
  std::optional<int> exit_code;
  std::string signal_name;
  int signal_number = 0;
};

// Starts one child process, streams its output into sinks, forwards
// interrupt/terminate/hangup to it and blocks until it has been reaped.
// Child outcomes (non-zero exit, death by signal) are results, not errors.
class ITransport {
public:
  virtual ~ITransport() = default;

  virtual session::TransportMode Mode() const = 0;

  virtual bool Run(const RunRequest& request, const OutputSinks& sinks, RunResult& result,
                   TransportError& error) = 0;
};

constexpr bool IsWindowsHost() {
#if defined(_WIN32)
  return true;
#else
  return false;
#endif
}

// No terminal on both stdin and stdout means pipes. Otherwise the host's
// pseudo-terminal flavour.
session::TransportMode SelectTransportMode(bool tty_attached, bool windows_host);

std::unique_ptr<ITransport> CreateTransport(session::TransportMode mode);

} // namespace runtape::transport
