#include "transport/posix_pty_transport.hpp"

#if defined(_WIN32)

namespace runtape::transport {

bool PosixPtyTransport::Run(const RunRequest& /*request*/, const OutputSinks& /*sinks*/,
                            RunResult& /*result*/, TransportError& error) {
  return SetTransportError(error, TransportErrorCode::kUnimplemented,
                           "posix pty mode is unsupported on windows");
}

} // namespace runtape::transport

#else

#include "transport/exit_status.hpp"
#include "transport/posix_process.hpp"
#include "transport/signal_relay.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <thread>
#include <unistd.h>

#if defined(__APPLE__)
#include <util.h>
#else
#include <pty.h>
#endif

namespace runtape::transport {

namespace {

constexpr std::size_t kStdinBufferBytes = 4096;

bool ReadHostWindowSize(struct winsize& size) {
  return ::isatty(STDIN_FILENO) == 1 && ::ioctl(STDIN_FILENO, TIOCGWINSZ, &size) == 0;
}

void InheritWindowSize(int master_fd) {
  struct winsize size {};
  if (ReadHostWindowSize(size)) {
    (void)::ioctl(master_fd, TIOCSWINSZ, &size);
  }
}

void ForwardToProcessGroup(pid_t pid, int signal_number) {
  if (::kill(-pid, signal_number) != 0) {
    (void)::kill(pid, signal_number);
  }
}

bool WriteAll(int fd, const char* data, std::size_t size) {
  while (size > 0) {
    const ssize_t written = ::write(fd, data, size);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data += written;
    size -= static_cast<std::size_t>(written);
  }
  return true;
}

// Relays host stdin into the pty master until stdin closes, the master
// rejects a write, or `stop_fd` becomes readable.
void RelayStdin(int master_fd, int stop_fd) {
  char buffer[kStdinBufferBytes];
  while (true) {
    struct pollfd poll_fds[2] {};
    poll_fds[0].fd = STDIN_FILENO;
    poll_fds[0].events = POLLIN;
    poll_fds[1].fd = stop_fd;
    poll_fds[1].events = POLLIN;
    const int ready = ::poll(poll_fds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    if (poll_fds[1].revents != 0) {
      return;
    }
    if ((poll_fds[0].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) == 0) {
      continue;
    }
    const ssize_t count = ::read(STDIN_FILENO, buffer, sizeof(buffer));
    if (count < 0 && errno == EINTR) {
      continue;
    }
    if (count <= 0 || !WriteAll(master_fd, buffer, static_cast<std::size_t>(count))) {
      return;
    }
  }
}

} // namespace

bool PosixPtyTransport::Run(const RunRequest& request, const OutputSinks& sinks,
                            RunResult& result, TransportError& error) {
  if (request.command.empty()) {
    return SetTransportError(error, TransportErrorCode::kInvalidRequest, "command is empty");
  }

  posix::UniqueFd exec_read;
  posix::UniqueFd exec_write;
  posix::UniqueFd stop_read;
  posix::UniqueFd stop_write;
  std::string pipe_error;
  if (!posix::MakeCloexecPipe(exec_read, exec_write, pipe_error) ||
      !posix::MakeCloexecPipe(stop_read, stop_write, pipe_error)) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "start pty process: " + pipe_error);
  }

  struct winsize size {};
  const bool have_size = ReadHostWindowSize(size);

  posix::ArgvBuffer argv(request.command);
  int raw_master = -1;
  const pid_t pid = ::forkpty(&raw_master, nullptr, nullptr, have_size ? &size : nullptr);
  if (pid < 0) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             std::string("start pty process: forkpty: ") + std::strerror(errno));
  }
  if (pid == 0) {
    posix::ExecChild(argv.Data(), request.working_directory, -1, -1, exec_write.Get());
  }

  posix::UniqueFd master(raw_master);
  const int master_flags = ::fcntl(master.Get(), F_GETFD);
  if (master_flags >= 0) {
    (void)::fcntl(master.Get(), F_SETFD, master_flags | FD_CLOEXEC);
  }
  exec_write.Reset();

  std::string exec_error;
  if (!posix::AwaitExec(exec_read.Get(), request.command.front(), exec_error)) {
    int status = 0;
    std::string ignored;
    (void)posix::WaitForChild(pid, status, ignored);
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "start pty process: " + exec_error);
  }

  if (request.on_start) {
    std::string start_error;
    if (!request.on_start(static_cast<int>(pid), start_error)) {
      posix::KillAndReap(pid);
      return SetTransportError(error, TransportErrorCode::kStartCallbackFailed, start_error);
    }
  }

  const int master_fd = master.Get();
  SignalRelay relay;
  std::string relay_error;
  if (!relay.Start([pid](int signal_number) { ForwardToProcessGroup(pid, signal_number); },
                   [master_fd]() { InheritWindowSize(master_fd); }, request.cancel,
                   relay_error)) {
    posix::KillAndReap(pid);
    return SetTransportError(error, TransportErrorCode::kIo, "forward signals: " + relay_error);
  }

  std::thread stdin_relay([master_fd, stop_fd = stop_read.Get()]() {
    RelayStdin(master_fd, stop_fd);
  });

  std::string copy_error;
  std::thread output_copier([&]() {
    posix::CopyFdToSink(master_fd, sinks.terminal, true, copy_error);
  });

  int status = 0;
  std::string wait_error;
  const bool waited = posix::WaitForChild(pid, status, wait_error);
  output_copier.join();

  // The stdin relay may be blocked in poll on a terminal that never closes.
  const char wake = 0;
  const ssize_t ignored = ::write(stop_write.Get(), &wake, 1);
  (void)ignored;
  stdin_relay.join();
  relay.Stop();

  if (!copy_error.empty()) {
    return SetTransportError(error, TransportErrorCode::kIo, "copy pty output: " + copy_error);
  }
  if (!waited) {
    return SetTransportError(error, TransportErrorCode::kWaitFailed,
                             "wait for pty process: " + wait_error);
  }

  result = DecodeWaitStatus(status);
  return true;
}

} // namespace runtape::transport

#endif
