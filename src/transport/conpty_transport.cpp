#include "transport/conpty_transport.hpp"

#if !defined(_WIN32)

namespace runtape::transport {

bool ConPtyTransport::Run(const RunRequest& /*request*/, const OutputSinks& /*sinks*/,
                          RunResult& /*result*/, TransportError& error) {
  return SetTransportError(error, TransportErrorCode::kUnimplemented,
                           "windows conpty mode is unsupported on non-windows platforms");
}

} // namespace runtape::transport

#else

#include "transport/windows_process.hpp"

#include <memory>
#include <thread>

namespace runtape::transport {

namespace {

constexpr DWORD kStdinBufferBytes = 4096;

COORD DetectConsoleSize() {
  CONSOLE_SCREEN_BUFFER_INFO info{};
  if (!::GetConsoleScreenBufferInfo(::GetStdHandle(STD_OUTPUT_HANDLE), &info)) {
    return COORD{kDefaultConPtyColumns, kDefaultConPtyRows};
  }
  SHORT columns = static_cast<SHORT>(info.srWindow.Right - info.srWindow.Left + 1);
  SHORT rows = static_cast<SHORT>(info.srWindow.Bottom - info.srWindow.Top + 1);
  if (columns <= 0) {
    columns = kDefaultConPtyColumns;
  }
  if (rows <= 0) {
    rows = kDefaultConPtyRows;
  }
  return COORD{columns, rows};
}

class PseudoConsole {
public:
  PseudoConsole() = default;
  ~PseudoConsole() {
    Close();
  }

  void Close() {
    if (handle_ != nullptr) {
      ::ClosePseudoConsole(handle_);
      handle_ = nullptr;
    }
  }

  PseudoConsole(const PseudoConsole&) = delete;
  PseudoConsole& operator=(const PseudoConsole&) = delete;

  HPCON* Put() {
    return &handle_;
  }
  HPCON Get() const {
    return handle_;
  }

private:
  HPCON handle_ = nullptr;
};

class AttributeList {
public:
  ~AttributeList() {
    if (initialized_) {
      ::DeleteProcThreadAttributeList(List());
    }
  }

  bool Initialize(DWORD count, std::string& error) {
    SIZE_T bytes = 0;
    ::InitializeProcThreadAttributeList(nullptr, count, 0, &bytes);
    storage_ = std::make_unique<unsigned char[]>(bytes);
    if (!::InitializeProcThreadAttributeList(List(), count, 0, &bytes)) {
      error = windows::FormatWindowsError(::GetLastError());
      return false;
    }
    initialized_ = true;
    return true;
  }

  LPPROC_THREAD_ATTRIBUTE_LIST List() {
    return reinterpret_cast<LPPROC_THREAD_ATTRIBUTE_LIST>(storage_.get());
  }

private:
  std::unique_ptr<unsigned char[]> storage_;
  bool initialized_ = false;
};

// Terminates the child when the host input fails for any reason other than
// the pseudo console going away. Takes ownership of both handles.
void RelayConsoleInput(HANDLE input_writer, HANDLE process) {
  windows::UniqueHandle writer_owner(input_writer);
  windows::UniqueHandle process_owner(process);
  const HANDLE host_input = ::GetStdHandle(STD_INPUT_HANDLE);
  char buffer[kStdinBufferBytes];
  while (true) {
    DWORD read = 0;
    if (!::ReadFile(host_input, buffer, kStdinBufferBytes, &read, nullptr)) {
      const DWORD code = ::GetLastError();
      if (!windows::IsBenignPipeError(code) && code != ERROR_OPERATION_ABORTED) {
        ::TerminateProcess(process, 1);
      }
      return;
    }
    if (read == 0) {
      return;
    }
    DWORD offset = 0;
    while (offset < read) {
      DWORD written = 0;
      if (!::WriteFile(input_writer, buffer + offset, read - offset, &written, nullptr)) {
        const DWORD code = ::GetLastError();
        if (!windows::IsBenignPipeError(code)) {
          ::TerminateProcess(process, 1);
        }
        return;
      }
      offset += written;
    }
  }
}

} // namespace

bool ConPtyTransport::Run(const RunRequest& request, const OutputSinks& sinks, RunResult& result,
                          TransportError& error) {
  if (request.command.empty()) {
    return SetTransportError(error, TransportErrorCode::kInvalidRequest, "command is empty");
  }

  const COORD size = DetectConsoleSize();

  windows::UniqueHandle input_read;
  windows::UniqueHandle input_write;
  windows::UniqueHandle output_read;
  windows::UniqueHandle output_write;
  std::string pipe_error;
  if (!windows::CreateInheritablePipe(input_read, input_write, pipe_error)) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "create conpty input pipe: " + pipe_error);
  }
  if (!windows::CreateInheritablePipe(output_read, output_write, pipe_error)) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "create conpty output pipe: " + pipe_error);
  }
  if (!::SetHandleInformation(input_write.Get(), HANDLE_FLAG_INHERIT, 0) ||
      !::SetHandleInformation(output_read.Get(), HANDLE_FLAG_INHERIT, 0)) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "mark conpty parent pipes non-inheritable: " +
                                 windows::FormatWindowsError(::GetLastError()));
  }

  PseudoConsole console;
  const HRESULT created =
      ::CreatePseudoConsole(size, input_read.Get(), output_write.Get(), 0, console.Put());
  if (FAILED(created)) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "create pseudo console: " +
                                 windows::FormatWindowsError(HRESULT_CODE(created)));
  }

  AttributeList attributes;
  std::string attribute_error;
  if (!attributes.Initialize(1, attribute_error)) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "create proc thread attribute list: " + attribute_error);
  }
  HPCON console_handle = console.Get();
  if (!::UpdateProcThreadAttribute(attributes.List(), 0, PROC_THREAD_ATTRIBUTE_PSEUDOCONSOLE,
                                   console_handle, sizeof(console_handle), nullptr, nullptr)) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "set pseudoconsole attribute: " +
                                 windows::FormatWindowsError(::GetLastError()));
  }

  STARTUPINFOEXW startup_info{};
  startup_info.StartupInfo.cb = sizeof(startup_info);
  startup_info.lpAttributeList = attributes.List();

  std::wstring command_line = windows::ComposeCommandLine(request.command);
  const std::wstring working_directory = request.working_directory.wstring();
  PROCESS_INFORMATION process_info{};
  const DWORD creation_flags =
      EXTENDED_STARTUPINFO_PRESENT | CREATE_UNICODE_ENVIRONMENT | CREATE_NEW_PROCESS_GROUP;
  if (!::CreateProcessW(nullptr, command_line.data(), nullptr, nullptr, TRUE, creation_flags,
                        nullptr, working_directory.empty() ? nullptr : working_directory.c_str(),
                        &startup_info.StartupInfo, &process_info)) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "start conpty process: " +
                                 windows::FormatWindowsError(::GetLastError()));
  }
  windows::UniqueHandle process(process_info.hProcess);
  windows::UniqueHandle thread(process_info.hThread);
  const HANDLE process_handle = process.Get();
  const DWORD process_id = process_info.dwProcessId;

  if (request.on_start) {
    std::string start_error;
    if (!request.on_start(static_cast<int>(process_id), start_error)) {
      ::TerminateProcess(process_handle, 1);
      ::WaitForSingleObject(process_handle, INFINITE);
      return SetTransportError(error, TransportErrorCode::kStartCallbackFailed, start_error);
    }
  }

  input_read.Reset();
  output_write.Reset();

  windows::ConsoleControlRelay relay;
  std::string relay_error;
  if (!relay.Start(
          [process_handle, process_id](DWORD control_type) {
            if (control_type == CTRL_C_EVENT) {
              ::GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, process_id);
              return;
            }
            ::TerminateProcess(process_handle, 1);
          },
          request.cancel, relay_error)) {
    ::TerminateProcess(process_handle, 1);
    ::WaitForSingleObject(process_handle, INFINITE);
    return SetTransportError(error, TransportErrorCode::kIo, "forward signals: " + relay_error);
  }

  std::string copy_error;
  std::thread output_copier([&]() {
    windows::CopyHandleToSink(output_read.Get(), sinks.terminal, copy_error);
  });
  // Blocked in ReadFile on host input, so it is detached with its own
  // handles rather than joined.
  HANDLE relay_process = nullptr;
  if (::DuplicateHandle(::GetCurrentProcess(), process_handle, ::GetCurrentProcess(),
                        &relay_process, 0, FALSE, DUPLICATE_SAME_ACCESS)) {
    std::thread(RelayConsoleInput, input_write.Release(), relay_process).detach();
  }

  const DWORD wait_status = ::WaitForSingleObject(process_handle, INFINITE);
  // Closing the pseudo console ends the output pipe.
  console.Close();
  output_copier.join();
  relay.Stop();

  if (wait_status != WAIT_OBJECT_0) {
    return SetTransportError(error, TransportErrorCode::kWaitFailed,
                             "wait for conpty process: " +
                                 windows::FormatWindowsError(::GetLastError()));
  }
  if (!copy_error.empty()) {
    return SetTransportError(error, TransportErrorCode::kIo, "copy conpty output: " + copy_error);
  }
  DWORD exit_code = 0;
  if (!::GetExitCodeProcess(process_handle, &exit_code)) {
    return SetTransportError(error, TransportErrorCode::kWaitFailed,
                             "get conpty exit code: " +
                                 windows::FormatWindowsError(::GetLastError()));
  }

  result = RunResult{};
  result.exit_code = static_cast<int>(exit_code);
  return true;
}

} // namespace runtape::transport

#endif
