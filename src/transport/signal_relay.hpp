#pragma once

#if !defined(_WIN32)

#include "transport/cancellation.hpp"

#include <atomic>
#include <csignal>
#include <functional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace runtape::transport {

// Routes SIGINT/SIGTERM/SIGHUP (and optionally SIGWINCH) from async signal
// handlers to a dedicated thread through a self-pipe. The thread also polls
// the cancellation token and forwards SIGTERM once when it fires.
//
// Only one relay may be active per process. Stop restores the previous
// dispositions before joining the thread.
class SignalRelay {
public:
  using ForwardFn = std::function<void(int signal_number)>;
  using ResizeFn = std::function<void()>;

  SignalRelay() = default;
  ~SignalRelay();

  SignalRelay(const SignalRelay&) = delete;
  SignalRelay& operator=(const SignalRelay&) = delete;

  // `on_resize` may be empty, in which case SIGWINCH is left alone.
  bool Start(ForwardFn forward, ResizeFn on_resize, const CancellationToken* cancel,
             std::string& error);
  void Stop();

private:
  void Loop();

  ForwardFn forward_;
  ResizeFn on_resize_;
  const CancellationToken* cancel_ = nullptr;
  int read_fd_ = -1;
  int write_fd_ = -1;
  std::atomic<bool> stop_requested_{false};
  std::thread thread_;
  std::vector<std::pair<int, struct sigaction>> previous_actions_;
  bool running_ = false;
};

// Ignores SIGPIPE for the recorder's lifetime so a closed host stdout shows
// up as EPIPE on write. Children reset it to the default before exec.
class ScopedIgnoreSigpipe {
public:
  ScopedIgnoreSigpipe();
  ~ScopedIgnoreSigpipe();

  ScopedIgnoreSigpipe(const ScopedIgnoreSigpipe&) = delete;
  ScopedIgnoreSigpipe& operator=(const ScopedIgnoreSigpipe&) = delete;

private:
  struct sigaction previous_ {};
  bool installed_ = false;
};

} // namespace runtape::transport

#endif
