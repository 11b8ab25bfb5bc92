#include "transport/posix_process.hpp"

#if !defined(_WIN32)

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace runtape::transport::posix {

namespace {

constexpr std::size_t kCopyBufferBytes = 32 * 1024;
constexpr int kExecFailureExitCode = 127;

void WriteAllBestEffort(int fd, const void* data, std::size_t size) {
  const auto* cursor = static_cast<const char*>(data);
  while (size > 0) {
    const ssize_t written = ::write(fd, cursor, size);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    cursor += written;
    size -= static_cast<std::size_t>(written);
  }
}

} // namespace

ArgvBuffer::ArgvBuffer(const std::vector<std::string>& command) : storage_(command) {
  pointers_.reserve(storage_.size() + 1);
  for (auto& arg : storage_) {
    pointers_.push_back(arg.data());
  }
  pointers_.push_back(nullptr);
}

UniqueFd::~UniqueFd() {
  Reset();
}

void UniqueFd::Reset(int fd) {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = fd;
}

bool MakeCloexecPipe(UniqueFd& read_end, UniqueFd& write_end, std::string& error) {
  int fds[2] = {-1, -1};
  if (::pipe(fds) != 0) {
    error = std::string("create pipe: ") + std::strerror(errno);
    return false;
  }
  for (const int fd : fds) {
    const int flags = ::fcntl(fd, F_GETFD);
    if (flags < 0 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) != 0) {
      error = std::string("configure pipe: ") + std::strerror(errno);
      ::close(fds[0]);
      ::close(fds[1]);
      return false;
    }
  }
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
  return true;
}

void ExecChild(char* const* argv, const std::filesystem::path& working_directory,
               int stdout_fd, int stderr_fd, int exec_error_fd) {
  if ((stdout_fd >= 0 && ::dup2(stdout_fd, STDOUT_FILENO) < 0) ||
      (stderr_fd >= 0 && ::dup2(stderr_fd, STDERR_FILENO) < 0)) {
    const int child_errno = errno;
    WriteAllBestEffort(exec_error_fd, &child_errno, sizeof(child_errno));
    ::_exit(kExecFailureExitCode);
  }

  for (const int signal_number : {SIGPIPE, SIGINT, SIGTERM, SIGHUP, SIGWINCH}) {
    ::signal(signal_number, SIG_DFL);
  }
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

  if (!working_directory.empty() && ::chdir(working_directory.c_str()) != 0) {
    const int child_errno = errno;
    WriteAllBestEffort(exec_error_fd, &child_errno, sizeof(child_errno));
    ::_exit(kExecFailureExitCode);
  }

  ::execvp(argv[0], argv);
  const int child_errno = errno;
  WriteAllBestEffort(exec_error_fd, &child_errno, sizeof(child_errno));
  ::_exit(kExecFailureExitCode);
}

bool AwaitExec(int exec_error_fd, const std::string& program, std::string& error) {
  int child_errno = 0;
  std::size_t received = 0;
  auto* cursor = reinterpret_cast<char*>(&child_errno);
  while (received < sizeof(child_errno)) {
    const ssize_t count = ::read(exec_error_fd, cursor + received, sizeof(child_errno) - received);
    if (count < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = std::string("read exec status: ") + std::strerror(errno);
      return false;
    }
    if (count == 0) {
      break;
    }
    received += static_cast<std::size_t>(count);
  }
  if (received == 0) {
    return true;
  }
  error = "exec " + program + ": " + std::strerror(child_errno);
  return false;
}

bool WaitForChild(pid_t pid, int& status, std::string& error) {
  while (true) {
    const pid_t waited = ::waitpid(pid, &status, 0);
    if (waited == pid) {
      return true;
    }
    if (waited < 0 && errno == EINTR) {
      continue;
    }
    error = std::string("waitpid: ") + std::strerror(errno);
    return false;
  }
}

void KillAndReap(pid_t pid) {
  (void)::kill(pid, SIGKILL);
  int status = 0;
  std::string ignored;
  (void)WaitForChild(pid, status, ignored);
}

void CopyFdToSink(int fd, capture::IOutputSink* sink, bool eio_is_eof, std::string& error) {
  std::string buffer(kCopyBufferBytes, '\0');
  while (true) {
    const ssize_t count = ::read(fd, buffer.data(), buffer.size());
    if (count == 0) {
      return;
    }
    if (count < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (eio_is_eof && errno == EIO) {
        return;
      }
      if (error.empty()) {
        error = std::string("read: ") + std::strerror(errno);
      }
      return;
    }
    if (sink == nullptr || !error.empty()) {
      continue;
    }
    std::string sink_error;
    if (!sink->Write(std::string_view(buffer.data(), static_cast<std::size_t>(count)),
                     sink_error)) {
      error = sink_error;
    }
  }
}

} // namespace runtape::transport::posix

#endif
