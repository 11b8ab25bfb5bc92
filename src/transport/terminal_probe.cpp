#include "transport/terminal_probe.hpp"

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace runtape::transport {

namespace {

bool IsTerminalFd(int fd) {
#if defined(_WIN32)
  return ::_isatty(fd) != 0;
#else
  return ::isatty(fd) == 1;
#endif
}

} // namespace

bool IsStdinTerminal() {
  return IsTerminalFd(0);
}

bool IsStdoutTerminal() {
  return IsTerminalFd(1);
}

bool IsTerminalAttached() {
  return IsStdinTerminal() && IsStdoutTerminal();
}

} // namespace runtape::transport
