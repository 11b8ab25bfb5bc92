#pragma once

#if !defined(_WIN32)

#include "capture/output_sink.hpp"

#include <filesystem>
#include <string>
#include <sys/types.h>
#include <vector>

namespace runtape::transport::posix {

// Owns the argv strings handed to execvp in a forked child.
class ArgvBuffer {
public:
  explicit ArgvBuffer(const std::vector<std::string>& command);

  char* const* Data() {
    return pointers_.data();
  }

private:
  std::vector<std::string> storage_;
  std::vector<char*> pointers_;
};

// Closes the descriptor on scope exit unless released.
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd();

  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int Get() const {
    return fd_;
  }
  void Reset(int fd = -1);

private:
  int fd_ = -1;
};

bool MakeCloexecPipe(UniqueFd& read_end, UniqueFd& write_end, std::string& error);

// Runs in a freshly forked child: stdio redirection (-1 keeps the inherited
// descriptor), chdir, default signal dispositions, exec. On failure the errno
// is written to `exec_error_fd` and the child exits 127.
[[noreturn]] void ExecChild(char* const* argv, const std::filesystem::path& working_directory,
                            int stdout_fd, int stderr_fd, int exec_error_fd);

// Reads the exec-status pipe after fork. Returns true when exec succeeded
// (pipe closed with no payload); otherwise fills `error`.
bool AwaitExec(int exec_error_fd, const std::string& program, std::string& error);

// waitpid with EINTR retry.
bool WaitForChild(pid_t pid, int& status, std::string& error);

void KillAndReap(pid_t pid);

// Copies `fd` into `sink` until EOF. EIO is treated as EOF when
// `eio_is_eof` (pty master after the slave closes). Sink failures are
// recorded in `error` but the descriptor keeps draining so the child never
// blocks on a full pipe.
void CopyFdToSink(int fd, capture::IOutputSink* sink, bool eio_is_eof, std::string& error);

} // namespace runtape::transport::posix

#endif
