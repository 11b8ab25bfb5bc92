#include "transport/transport.hpp"

#include "transport/conpty_transport.hpp"
#include "transport/pipe_transport.hpp"
#include "transport/posix_pty_transport.hpp"

namespace runtape::transport {

std::string_view ToStableCode(TransportErrorCode code) {
  switch (code) {
  case TransportErrorCode::kNone:
    return "NONE";
  case TransportErrorCode::kUnimplemented:
    return "UNIMPLEMENTED";
  case TransportErrorCode::kInvalidRequest:
    return "INVALID_REQUEST";
  case TransportErrorCode::kSpawnFailed:
    return "SPAWN_FAILED";
  case TransportErrorCode::kStartCallbackFailed:
    return "START_CALLBACK_FAILED";
  case TransportErrorCode::kIo:
    return "IO";
  case TransportErrorCode::kWaitFailed:
    return "WAIT_FAILED";
  }
  return "IO";
}

session::TransportMode SelectTransportMode(bool tty_attached, bool windows_host) {
  if (!tty_attached) {
    return session::TransportMode::kPipe;
  }
  if (windows_host) {
    return session::TransportMode::kWindowsConPty;
  }
  return session::TransportMode::kPosixPty;
}

std::unique_ptr<ITransport> CreateTransport(session::TransportMode mode) {
  switch (mode) {
  case session::TransportMode::kPosixPty:
    return std::make_unique<PosixPtyTransport>();
  case session::TransportMode::kWindowsConPty:
    return std::make_unique<ConPtyTransport>();
  case session::TransportMode::kPipe:
    return std::make_unique<PipeTransport>();
  }
  return std::make_unique<PipeTransport>();
}

} // namespace runtape::transport
