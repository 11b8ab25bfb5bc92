#include "transport/pipe_transport.hpp"

#if !defined(_WIN32)

#include "transport/exit_status.hpp"
#include "transport/posix_process.hpp"
#include "transport/signal_relay.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <unistd.h>

namespace runtape::transport {

bool PipeTransport::Run(const RunRequest& request, const OutputSinks& sinks, RunResult& result,
                        TransportError& error) {
  if (request.command.empty()) {
    return SetTransportError(error, TransportErrorCode::kInvalidRequest, "command is empty");
  }

  posix::UniqueFd stdout_read;
  posix::UniqueFd stdout_write;
  posix::UniqueFd stderr_read;
  posix::UniqueFd stderr_write;
  posix::UniqueFd exec_read;
  posix::UniqueFd exec_write;
  std::string pipe_error;
  if (!posix::MakeCloexecPipe(stdout_read, stdout_write, pipe_error) ||
      !posix::MakeCloexecPipe(stderr_read, stderr_write, pipe_error) ||
      !posix::MakeCloexecPipe(exec_read, exec_write, pipe_error)) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "start process: " + pipe_error);
  }

  posix::ArgvBuffer argv(request.command);
  const pid_t pid = ::fork();
  if (pid < 0) {
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             std::string("start process: fork: ") + std::strerror(errno));
  }
  if (pid == 0) {
    posix::ExecChild(argv.Data(), request.working_directory, stdout_write.Get(),
                     stderr_write.Get(), exec_write.Get());
  }

  // The parent must drop its write ends or the copiers never see EOF and the
  // exec status pipe never closes.
  stdout_write.Reset();
  stderr_write.Reset();
  exec_write.Reset();

  std::string exec_error;
  if (!posix::AwaitExec(exec_read.Get(), request.command.front(), exec_error)) {
    int status = 0;
    std::string ignored;
    (void)posix::WaitForChild(pid, status, ignored);
    return SetTransportError(error, TransportErrorCode::kSpawnFailed,
                             "start process: " + exec_error);
  }

  SignalRelay relay;
  std::string relay_error;
  if (!relay.Start([pid](int signal_number) { (void)::kill(pid, signal_number); }, {},
                   request.cancel, relay_error)) {
    posix::KillAndReap(pid);
    return SetTransportError(error, TransportErrorCode::kIo,
                             "forward signals: " + relay_error);
  }

  if (request.on_start) {
    std::string start_error;
    if (!request.on_start(static_cast<int>(pid), start_error)) {
      relay.Stop();
      posix::KillAndReap(pid);
      return SetTransportError(error, TransportErrorCode::kStartCallbackFailed, start_error);
    }
  }

  std::string stdout_error;
  std::string stderr_error;
  std::thread stdout_copier([&]() {
    posix::CopyFdToSink(stdout_read.Get(), sinks.stdout_sink, false, stdout_error);
  });
  std::thread stderr_copier([&]() {
    posix::CopyFdToSink(stderr_read.Get(), sinks.stderr_sink, false, stderr_error);
  });

  int status = 0;
  std::string wait_error;
  const bool waited = posix::WaitForChild(pid, status, wait_error);
  // Grandchildren may hold the pipes open after the child exits; the copiers
  // finish only when the last writer closes. Keep forwarding signals until
  // then so an interrupt still reaches the child during the drain.
  stdout_copier.join();
  stderr_copier.join();
  relay.Stop();

  const std::string& copy_error = !stdout_error.empty() ? stdout_error : stderr_error;
  if (!copy_error.empty()) {
    return SetTransportError(error, TransportErrorCode::kIo,
                             "copy process output: " + copy_error);
  }
  if (!waited) {
    return SetTransportError(error, TransportErrorCode::kWaitFailed,
                             "wait for process: " + wait_error);
  }

  result = DecodeWaitStatus(status);
  return true;
}

} // namespace runtape::transport

#endif
