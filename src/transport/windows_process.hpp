#pragma once

#if defined(_WIN32)

#include "capture/output_sink.hpp"
#include "transport/cancellation.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

namespace runtape::transport::windows {

// Closes a kernel handle on scope exit unless released.
class UniqueHandle {
public:
  UniqueHandle() = default;
  explicit UniqueHandle(HANDLE handle) : handle_(handle) {}
  ~UniqueHandle();

  UniqueHandle(const UniqueHandle&) = delete;
  UniqueHandle& operator=(const UniqueHandle&) = delete;

  HANDLE Get() const {
    return handle_;
  }
  HANDLE Release();
  void Reset(HANDLE handle = nullptr);

private:
  HANDLE handle_ = nullptr;
};

std::wstring Widen(const std::string& utf8);

// Quotes argv the way CommandLineToArgvW splits it back.
std::wstring ComposeCommandLine(const std::vector<std::string>& command);

std::string FormatWindowsError(DWORD code);

// Both ends inheritable; callers clear inheritance on the parent's side.
bool CreateInheritablePipe(UniqueHandle& read_end, UniqueHandle& write_end, std::string& error);

bool IsBenignPipeError(DWORD code);

// Copies `handle` into `sink` until EOF or a broken pipe. Sink failures are
// recorded in `error` while the handle keeps draining.
void CopyHandleToSink(HANDLE handle, capture::IOutputSink* sink, std::string& error);

// Keeps the recorder alive through console control events and hands each
// one to `forward` on the system's handler thread. A cancelled token is
// reported once as CTRL_CLOSE_EVENT. One relay per process.
class ConsoleControlRelay {
public:
  using ForwardFn = std::function<void(DWORD control_type)>;

  ConsoleControlRelay() = default;
  ~ConsoleControlRelay();

  ConsoleControlRelay(const ConsoleControlRelay&) = delete;
  ConsoleControlRelay& operator=(const ConsoleControlRelay&) = delete;

  bool Start(ForwardFn forward, const CancellationToken* cancel, std::string& error);
  void Stop();

  void Dispatch(DWORD control_type);

private:
  ForwardFn forward_;
  const CancellationToken* cancel_ = nullptr;
  std::atomic<bool> stop_requested_{false};
  std::thread cancel_watcher_;
  bool running_ = false;
};

} // namespace runtape::transport::windows

#endif
