#include "transport/windows_process.hpp"

#if defined(_WIN32)

#include <chrono>

namespace runtape::transport::windows {

namespace {

constexpr DWORD kCopyBufferBytes = 32 * 1024;
constexpr auto kCancelPollInterval = std::chrono::milliseconds(100);

std::atomic<ConsoleControlRelay*> g_active_relay{nullptr};

BOOL WINAPI ConsoleControlHandler(DWORD control_type) {
  ConsoleControlRelay* relay = g_active_relay.load();
  if (relay == nullptr) {
    return FALSE;
  }
  relay->Dispatch(control_type);
  return TRUE;
}

void AppendQuotedArgument(const std::wstring& argument, std::wstring& command_line) {
  if (!argument.empty() && argument.find_first_of(L" \t\n\v\"") == std::wstring::npos) {
    command_line += argument;
    return;
  }

  command_line.push_back(L'"');
  for (auto it = argument.begin();; ++it) {
    std::size_t backslashes = 0;
    while (it != argument.end() && *it == L'\\') {
      ++it;
      ++backslashes;
    }
    if (it == argument.end()) {
      command_line.append(backslashes * 2, L'\\');
      break;
    }
    if (*it == L'"') {
      command_line.append(backslashes * 2 + 1, L'\\');
      command_line.push_back(*it);
    } else {
      command_line.append(backslashes, L'\\');
      command_line.push_back(*it);
    }
  }
  command_line.push_back(L'"');
}

} // namespace

UniqueHandle::~UniqueHandle() {
  Reset();
}

HANDLE UniqueHandle::Release() {
  HANDLE handle = handle_;
  handle_ = nullptr;
  return handle;
}

void UniqueHandle::Reset(HANDLE handle) {
  if (handle_ != nullptr && handle_ != INVALID_HANDLE_VALUE) {
    ::CloseHandle(handle_);
  }
  handle_ = handle;
}

std::wstring Widen(const std::string& utf8) {
  if (utf8.empty()) {
    return {};
  }
  const int length = ::MultiByteToWideChar(CP_UTF8, 0, utf8.data(),
                                           static_cast<int>(utf8.size()), nullptr, 0);
  std::wstring wide(static_cast<std::size_t>(length), L'\0');
  ::MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), wide.data(),
                        length);
  return wide;
}

std::wstring ComposeCommandLine(const std::vector<std::string>& command) {
  std::wstring command_line;
  for (std::size_t i = 0; i < command.size(); ++i) {
    if (i > 0) {
      command_line.push_back(L' ');
    }
    AppendQuotedArgument(Widen(command[i]), command_line);
  }
  return command_line;
}

std::string FormatWindowsError(DWORD code) {
  LPSTR buffer = nullptr;
  const DWORD length = ::FormatMessageA(
      FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
      nullptr, code, 0, reinterpret_cast<LPSTR>(&buffer), 0, nullptr);
  std::string message = length > 0 ? std::string(buffer, length) : std::string();
  if (buffer != nullptr) {
    ::LocalFree(buffer);
  }
  while (!message.empty() && (message.back() == '\n' || message.back() == '\r' ||
                              message.back() == '.' || message.back() == ' ')) {
    message.pop_back();
  }
  if (message.empty()) {
    message = "windows error " + std::to_string(code);
  }
  return message;
}

bool CreateInheritablePipe(UniqueHandle& read_end, UniqueHandle& write_end, std::string& error) {
  SECURITY_ATTRIBUTES attributes{};
  attributes.nLength = sizeof(attributes);
  attributes.bInheritHandle = TRUE;
  HANDLE read_handle = nullptr;
  HANDLE write_handle = nullptr;
  if (!::CreatePipe(&read_handle, &write_handle, &attributes, 0)) {
    error = FormatWindowsError(::GetLastError());
    return false;
  }
  read_end.Reset(read_handle);
  write_end.Reset(write_handle);
  return true;
}

bool IsBenignPipeError(DWORD code) {
  return code == ERROR_BROKEN_PIPE || code == ERROR_NO_DATA || code == ERROR_PIPE_NOT_CONNECTED;
}

void CopyHandleToSink(HANDLE handle, capture::IOutputSink* sink, std::string& error) {
  std::string buffer(kCopyBufferBytes, '\0');
  while (true) {
    DWORD count = 0;
    if (!::ReadFile(handle, buffer.data(), kCopyBufferBytes, &count, nullptr)) {
      const DWORD code = ::GetLastError();
      if (!IsBenignPipeError(code) && error.empty()) {
        error = "read: " + FormatWindowsError(code);
      }
      return;
    }
    if (count == 0) {
      return;
    }
    if (sink == nullptr || !error.empty()) {
      continue;
    }
    std::string sink_error;
    if (!sink->Write(std::string_view(buffer.data(), count), sink_error)) {
      error = sink_error;
    }
  }
}

ConsoleControlRelay::~ConsoleControlRelay() {
  Stop();
}

bool ConsoleControlRelay::Start(ForwardFn forward, const CancellationToken* cancel,
                                std::string& error) {
  ConsoleControlRelay* expected = nullptr;
  if (!g_active_relay.compare_exchange_strong(expected, this)) {
    error = "another console control relay is already active in this process";
    return false;
  }
  forward_ = std::move(forward);
  cancel_ = cancel;
  if (!::SetConsoleCtrlHandler(ConsoleControlHandler, TRUE)) {
    g_active_relay.store(nullptr);
    error = "install console control handler: " + FormatWindowsError(::GetLastError());
    return false;
  }
  running_ = true;
  stop_requested_.store(false);
  if (cancel_ != nullptr) {
    cancel_watcher_ = std::thread([this]() {
      while (!stop_requested_.load()) {
        if (cancel_->IsCancelled()) {
          Dispatch(CTRL_CLOSE_EVENT);
          return;
        }
        std::this_thread::sleep_for(kCancelPollInterval);
      }
    });
  }
  return true;
}

void ConsoleControlRelay::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  stop_requested_.store(true);
  if (cancel_watcher_.joinable()) {
    cancel_watcher_.join();
  }
  ::SetConsoleCtrlHandler(ConsoleControlHandler, FALSE);
  g_active_relay.store(nullptr);
}

void ConsoleControlRelay::Dispatch(DWORD control_type) {
  if (forward_) {
    forward_(control_type);
  }
}

} // namespace runtape::transport::windows

#endif
