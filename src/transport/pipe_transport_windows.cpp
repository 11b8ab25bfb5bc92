#include "transport/pipe_transport.hpp"

#if defined(_WIN32)

#include "transport/windows_process.hpp"

#include <thread>

namespace runtape::transport {

bool PipeTransport::Run(const RunRequest& request, const OutputSinks& sinks, RunResult& result,
                        TransportError& error) {
  if (request.command.empty()) {
    return SetTransportError(error, TransportErrorCode::kInvalidRequest, "command is empty");
  }

  windows::UniqueHandle stdout_read;
  windows::UniqueHandle stdout_write;
  windows::UniqueHandle stderr_read;
  windows::UniqueHandle stderr_write;
  std::string pipe_error;
  if (!windows::CreateInheritablePipe(stdout_read, stdout_write, pipe_error) ||
      !windows::CreateInheritablePipe(stderr_read, stderr_write, pipe_error)) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "start process: create pipe: " + pipe_error);
  }
  if (!::SetHandleInformation(stdout_read.Get(), HANDLE_FLAG_INHERIT, 0) ||
      !::SetHandleInformation(stderr_read.Get(), HANDLE_FLAG_INHERIT, 0)) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "start process: configure pipe: " +
                                 windows::FormatWindowsError(::GetLastError()));
  }

  STARTUPINFOW startup_info{};
  startup_info.cb = sizeof(startup_info);
  startup_info.dwFlags = STARTF_USESTDHANDLES;
  startup_info.hStdInput = ::GetStdHandle(STD_INPUT_HANDLE);
  startup_info.hStdOutput = stdout_write.Get();
  startup_info.hStdError = stderr_write.Get();

  std::wstring command_line = windows::ComposeCommandLine(request.command);
  const std::wstring working_directory = request.working_directory.wstring();
  PROCESS_INFORMATION process_info{};
  if (!::CreateProcessW(nullptr, command_line.data(), nullptr, nullptr, TRUE,
                        CREATE_UNICODE_ENVIRONMENT, nullptr,
                        working_directory.empty() ? nullptr : working_directory.c_str(),
                        &startup_info, &process_info)) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "start process: " + windows::FormatWindowsError(::GetLastError()));
  }
  windows::UniqueHandle process(process_info.hProcess);
  windows::UniqueHandle thread(process_info.hThread);
  stdout_write.Reset();
  stderr_write.Reset();

  // The child shares the console and receives Ctrl+C itself; closing events
  // terminate it so the recorder can still write final metadata.
  windows::ConsoleControlRelay relay;
  std::string relay_error;
  const HANDLE process_handle = process.Get();
  if (!relay.Start(
          [process_handle](DWORD control_type) {
            if (control_type != CTRL_C_EVENT && control_type != CTRL_BREAK_EVENT) {
              ::TerminateProcess(process_handle, 1);
            }
          },
          request.cancel, relay_error)) {
    ::TerminateProcess(process_handle, 1);
    ::WaitForSingleObject(process_handle, INFINITE);
    return SetTransportError(error, TransportErrorCode::kIo, "forward signals: " + relay_error);
  }

  if (request.on_start) {
    std::string start_error;
    if (!request.on_start(static_cast<int>(process_info.dwProcessId), start_error)) {
      relay.Stop();
      ::TerminateProcess(process_handle, 1);
      ::WaitForSingleObject(process_handle, INFINITE);
      return SetTransportError(error, TransportErrorCode::kStartCallbackFailed, start_error);
    }
  }

  std::string stdout_error;
  std::string stderr_error;
  std::thread stdout_copier([&]() {
    windows::CopyHandleToSink(stdout_read.Get(), sinks.stdout_sink, stdout_error);
  });
  std::thread stderr_copier([&]() {
    windows::CopyHandleToSink(stderr_read.Get(), sinks.stderr_sink, stderr_error);
  });

  const DWORD wait_status = ::WaitForSingleObject(process_handle, INFINITE);
  stdout_copier.join();
  stderr_copier.join();
  relay.Stop();

  const std::string& copy_error = !stdout_error.empty() ? stdout_error : stderr_error;
  if (!copy_error.empty()) {
    return SetTransportError(error, TransportErrorCode::kIo,
                             "copy process output: " + copy_error);
  }
  if (wait_status != WAIT_OBJECT_0) {
    return SetTransportError(error, TransportErrorCode::kWaitFailed,
                             "wait for process: " +
                                 windows::FormatWindowsError(::GetLastError()));
  }
  DWORD exit_code = 0;
  if (!::GetExitCodeProcess(process_handle, &exit_code)) {
    return SetTransportError(error, TransportErrorCode::kWaitFailed,
                             "wait for process: " +
                                 windows::FormatWindowsError(::GetLastError()));
  }

  result = RunResult{};
  result.exit_code = static_cast<int>(exit_code);
  return true;
}

} // namespace runtape::transport

#endif
