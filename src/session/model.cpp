#include "session/model.hpp"

namespace runtape::session {

const char* ToString(SessionState state) {
  switch (state) {
  case SessionState::kStarting:
    return "starting";
  case SessionState::kRunning:
    return "running";
  case SessionState::kExited:
    return "exited";
  case SessionState::kSignaled:
    return "signaled";
  case SessionState::kFailed:
    return "failed";
  case SessionState::kExpired:
    return "expired";
  }
  return "failed";
}

const char* ToString(TransportMode mode) {
  switch (mode) {
  case TransportMode::kPosixPty:
    return "posix-pty";
  case TransportMode::kWindowsConPty:
    return "windows-conpty";
  case TransportMode::kPipe:
    return "pipe";
  }
  return "pipe";
}

const char* ToString(OutputChannel channel) {
  switch (channel) {
  case OutputChannel::kPty:
    return "pty";
  case OutputChannel::kStdout:
    return "stdout";
  case OutputChannel::kStderr:
    return "stderr";
  }
  return "stdout";
}

bool ParseSessionState(std::string_view raw, SessionState& state) {
  for (const SessionState candidate :
       {SessionState::kStarting, SessionState::kRunning, SessionState::kExited,
        SessionState::kSignaled, SessionState::kFailed, SessionState::kExpired}) {
    if (raw == ToString(candidate)) {
      state = candidate;
      return true;
    }
  }
  return false;
}

bool ParseTransportMode(std::string_view raw, TransportMode& mode) {
  for (const TransportMode candidate :
       {TransportMode::kPosixPty, TransportMode::kWindowsConPty, TransportMode::kPipe}) {
    if (raw == ToString(candidate)) {
      mode = candidate;
      return true;
    }
  }
  return false;
}

bool ParseOutputChannel(std::string_view raw, OutputChannel& channel) {
  for (const OutputChannel candidate :
       {OutputChannel::kPty, OutputChannel::kStdout, OutputChannel::kStderr}) {
    if (raw == ToString(candidate)) {
      channel = candidate;
      return true;
    }
  }
  return false;
}

bool IsTerminal(SessionState state) {
  switch (state) {
  case SessionState::kExited:
  case SessionState::kSignaled:
  case SessionState::kFailed:
  case SessionState::kExpired:
    return true;
  case SessionState::kStarting:
  case SessionState::kRunning:
    return false;
  }
  return false;
}

} // namespace runtape::session
