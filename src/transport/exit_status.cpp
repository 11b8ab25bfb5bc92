#include "transport/exit_status.hpp"

#include <csignal>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace runtape::transport {

std::string SignalName(int signal_number) {
  switch (signal_number) {
  case SIGINT:
    return "SIGINT";
  case SIGTERM:
    return "SIGTERM";
  case SIGABRT:
    return "SIGABRT";
  case SIGSEGV:
    return "SIGSEGV";
  case SIGFPE:
    return "SIGFPE";
  case SIGILL:
    return "SIGILL";
#if !defined(_WIN32)
  case SIGHUP:
    return "SIGHUP";
  case SIGQUIT:
    return "SIGQUIT";
  case SIGTRAP:
    return "SIGTRAP";
  case SIGBUS:
    return "SIGBUS";
  case SIGKILL:
    return "SIGKILL";
  case SIGUSR1:
    return "SIGUSR1";
  case SIGUSR2:
    return "SIGUSR2";
  case SIGPIPE:
    return "SIGPIPE";
  case SIGALRM:
    return "SIGALRM";
  case SIGCHLD:
    return "SIGCHLD";
  case SIGCONT:
    return "SIGCONT";
  case SIGSTOP:
    return "SIGSTOP";
  case SIGTSTP:
    return "SIGTSTP";
  case SIGTTIN:
    return "SIGTTIN";
  case SIGTTOU:
    return "SIGTTOU";
  case SIGXCPU:
    return "SIGXCPU";
  case SIGXFSZ:
    return "SIGXFSZ";
  case SIGWINCH:
    return "SIGWINCH";
#endif
  default:
    return "SIG" + std::to_string(signal_number);
  }
}

#if !defined(_WIN32)

RunResult DecodeWaitStatus(int status) {
  RunResult result;
  if (WIFSIGNALED(status)) {
    result.signal_number = WTERMSIG(status);
    result.signal_name = SignalName(result.signal_number);
    return result;
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
    return result;
  }
  // Stopped/continued states are never requested from waitpid.
  result.exit_code = 1;
  return result;
}

#endif

} // namespace runtape::transport
