#include "transport/signal_relay.hpp"

#if !defined(_WIN32)

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace runtape::transport {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr unsigned char kWakeByte = 0;

std::atomic<int> g_relay_write_fd{-1};

void RelaySignalHandler(int signal_number) {
  const int saved_errno = errno;
  const int fd = g_relay_write_fd.load();
  if (fd >= 0) {
    const auto byte = static_cast<unsigned char>(signal_number);
    const ssize_t ignored = ::write(fd, &byte, 1);
    (void)ignored;
  }
  errno = saved_errno;
}

bool SetNonBlockingCloexec(int fd) {
  const int flags = ::fcntl(fd, F_GETFL);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
    return false;
  }
  const int fd_flags = ::fcntl(fd, F_GETFD);
  return fd_flags >= 0 && ::fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC) == 0;
}

} // namespace

SignalRelay::~SignalRelay() {
  Stop();
}

bool SignalRelay::Start(ForwardFn forward, ResizeFn on_resize, const CancellationToken* cancel,
                        std::string& error) {
  if (running_) {
    error = "signal relay already started";
    return false;
  }

  int fds[2] = {-1, -1};
  if (::pipe(fds) != 0) {
    error = std::string("create signal pipe: ") + std::strerror(errno);
    return false;
  }
  if (!SetNonBlockingCloexec(fds[0]) || !SetNonBlockingCloexec(fds[1])) {
    error = std::string("configure signal pipe: ") + std::strerror(errno);
    ::close(fds[0]);
    ::close(fds[1]);
    return false;
  }

  int expected = -1;
  if (!g_relay_write_fd.compare_exchange_strong(expected, fds[1])) {
    ::close(fds[0]);
    ::close(fds[1]);
    error = "another signal relay is already active in this process";
    return false;
  }

  read_fd_ = fds[0];
  write_fd_ = fds[1];
  forward_ = std::move(forward);
  on_resize_ = std::move(on_resize);
  cancel_ = cancel;
  stop_requested_.store(false);

  std::vector<int> signals = {SIGINT, SIGTERM, SIGHUP};
  if (on_resize_) {
    signals.push_back(SIGWINCH);
  }
  for (const int signal_number : signals) {
    struct sigaction action {};
    action.sa_handler = RelaySignalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    struct sigaction previous {};
    if (::sigaction(signal_number, &action, &previous) != 0) {
      error = std::string("install signal handler: ") + std::strerror(errno);
      running_ = true;
      Stop();
      return false;
    }
    previous_actions_.emplace_back(signal_number, previous);
  }

  running_ = true;
  thread_ = std::thread([this]() { Loop(); });
  return true;
}

void SignalRelay::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;

  for (const auto& [signal_number, previous] : previous_actions_) {
    (void)::sigaction(signal_number, &previous, nullptr);
  }
  previous_actions_.clear();
  g_relay_write_fd.store(-1);

  stop_requested_.store(true);
  const ssize_t ignored = ::write(write_fd_, &kWakeByte, 1);
  (void)ignored;
  if (thread_.joinable()) {
    thread_.join();
  }

  ::close(read_fd_);
  ::close(write_fd_);
  read_fd_ = -1;
  write_fd_ = -1;
}

void SignalRelay::Loop() {
  bool cancel_forwarded = false;
  while (!stop_requested_.load()) {
    if (cancel_ != nullptr && !cancel_forwarded && cancel_->IsCancelled()) {
      cancel_forwarded = true;
      if (forward_) {
        forward_(SIGTERM);
      }
    }

    struct pollfd poll_fd {};
    poll_fd.fd = read_fd_;
    poll_fd.events = POLLIN;
    const int ready = ::poll(&poll_fd, 1, kPollIntervalMs);
    if (ready <= 0) {
      continue;
    }

    unsigned char buffer[64];
    while (true) {
      const ssize_t count = ::read(read_fd_, buffer, sizeof(buffer));
      if (count <= 0) {
        break;
      }
      for (ssize_t i = 0; i < count; ++i) {
        const int signal_number = buffer[i];
        if (signal_number == kWakeByte) {
          continue;
        }
        if (signal_number == SIGWINCH) {
          if (on_resize_) {
            on_resize_();
          }
          continue;
        }
        if (forward_) {
          forward_(signal_number);
        }
      }
    }
  }
}

ScopedIgnoreSigpipe::ScopedIgnoreSigpipe() {
  struct sigaction action {};
  action.sa_handler = SIG_IGN;
  sigemptyset(&action.sa_mask);
  installed_ = ::sigaction(SIGPIPE, &action, &previous_) == 0;
}

ScopedIgnoreSigpipe::~ScopedIgnoreSigpipe() {
  if (installed_) {
    (void)::sigaction(SIGPIPE, &previous_, nullptr);
  }
}

} // namespace runtape::transport

#endif
