#include "runner/run_orchestrator.hpp"

#include "capture/capture_writer.hpp"
#include "capture/output_sink.hpp"
#include "core/errors/exit_codes.hpp"
#include "retention/sweeper.hpp"
#include "session/session_id.hpp"
#include "state/session_store.hpp"
#include "state/state_paths.hpp"
#include "transport/terminal_probe.hpp"
#include "transport/transport.hpp"

#if !defined(_WIN32)
#include "transport/signal_relay.hpp"
#endif

#include <iostream>
#include <memory>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace runtape::runner {

namespace {

constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

std::string StateTransition(session::SessionState from, session::SessionState to) {
  return std::string(session::ToString(from)) + "->" + session::ToString(to);
}

bool NextSystemSessionId(std::string& id, std::string& error) {
  return session::NewSessionId(std::chrono::system_clock::now(), id, error);
}

// Ids only collide when two runs draw the same millisecond and entropy, or a
// caller-chosen id was reused; a handful of redraws covers both.
bool GenerateUniqueSessionId(const state::SessionStore& store, const SessionIdSource& source,
                             core::logging::Logger& logger, std::string& session_id,
                             std::string& error) {
  for (int attempt = 1; attempt <= kSessionIdAttempts; ++attempt) {
    std::string candidate;
    if (!source(candidate, error)) {
      return false;
    }
    bool has_metadata = false;
    state::StoreError store_error;
    if (!store.HasStartOrFinalMetadata(candidate, has_metadata, store_error)) {
      error = store_error.message;
      return false;
    }
    if (!has_metadata) {
      session_id = std::move(candidate);
      return true;
    }
    logger.Warn("session id collision", {{"event", "session_id_collision"},
                                         {"candidate", candidate},
                                         {"attempt", std::to_string(attempt)}});
  }
  error = "too many session id collisions";
  return false;
}

// Runs the retention sweep on its own thread for the duration of the run.
class BackgroundSweep {
public:
  BackgroundSweep(const state::SessionStore& store, std::chrono::seconds ttl,
                  core::logging::Logger& logger)
      : thread_([&store, ttl, &logger]() {
          retention::SweepResult result;
          std::string error;
          if (!retention::Sweep(store, ttl, logger, result, error)) {
            logger.Warn("retention sweep failed",
                        {{"event", "cleanup_result"}, {"cleanup_result", "error"},
                         {"error", error}});
            return;
          }
          logger.Info("retention sweep completed", {{"event", "cleanup_result"},
                                                    {"cleanup_result", "ok"},
                                                    {"checked", std::to_string(result.checked)},
                                                    {"removed", std::to_string(result.removed)}});
        }) {}

  ~BackgroundSweep() {
    Join();
  }

  BackgroundSweep(const BackgroundSweep&) = delete;
  BackgroundSweep& operator=(const BackgroundSweep&) = delete;

  void Join() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

private:
  std::thread thread_;
};

} // namespace

int ExecuteRun(const RunOptions& options, RunOutcome* outcome) {
  if (outcome != nullptr) {
    *outcome = RunOutcome{};
  }

  if (options.command.empty()) {
    std::cerr << "run command requires target command\n";
    return kExitUsage;
  }
  if (options.retention.count() <= 0) {
    std::cerr << "retention must be positive\n";
    return kExitUsage;
  }

  std::string error;
  fs::path state_root = options.state_root;
  if (state_root.empty() && !state::ResolveStateRoot(state_root, error)) {
    std::cerr << "resolve state root: " << error << '\n';
    return kExitFailure;
  }

  state::SessionStore store;
  state::StoreError store_error;
  if (!store.Open(state_root, store_error)) {
    std::cerr << "init state store: " << store_error.message << '\n';
    return kExitFailure;
  }

  core::logging::Logger logger(options.log_level);
  if (!logger.OpenFile(state::LogFilePath(state_root), error)) {
    std::cerr << "init logger: " << error << '\n';
    return kExitFailure;
  }

  logger.Info("run execution requested",
              {{"event", "run_requested"},
               {"program", options.command.front()},
               {"argc", std::to_string(options.command.size())},
               {"retention_seconds", std::to_string(options.retention.count())},
               {"explicit_session_id", options.session_id.empty() ? "false" : "true"}});

  std::string session_id = options.session_id;
  if (session_id.empty()) {
    const SessionIdSource source =
        options.id_source ? options.id_source : SessionIdSource(NextSystemSessionId);
    if (!GenerateUniqueSessionId(store, source, logger, session_id, error)) {
      logger.Error("session id generation failed", {{"error", error}});
      std::cerr << "generate session id: " << error << '\n';
      return kExitFailure;
    }
  } else {
    bool has_metadata = false;
    if (!store.HasStartOrFinalMetadata(session_id, has_metadata, store_error)) {
      if (store_error.code == state::StoreErrorCode::kInvalidSessionId) {
        logger.Warn("session id rejected", {{"event", "session_id_rejected"},
                                            {"candidate", session_id},
                                            {"reason", "invalid_session_id"}});
        std::cerr << "invalid session id: " << session_id << '\n';
        return kExitUsage;
      }
      std::cerr << "check session metadata: " << store_error.message << '\n';
      return kExitFailure;
    }
    if (has_metadata) {
      logger.Warn("session id rejected", {{"event", "session_id_rejected"},
                                          {"candidate", session_id},
                                          {"reason", "metadata_exists"}});
      std::cerr << "session id already exists: " << session_id << '\n';
      return kExitUsage;
    }
  }
  logger.SetSessionId(session_id);
  if (outcome != nullptr) {
    outcome->session_id = session_id;
  }

  if (!store.EnsureSessionDirectory(session_id, store_error)) {
    std::cerr << "prepare session directory: " << store_error.message << '\n';
    return kExitFailure;
  }

  std::error_code ec;
  const fs::path working_directory = fs::current_path(ec);
  if (ec) {
    std::cerr << "resolve working directory: " << ec.message() << '\n';
    return kExitFailure;
  }

  const bool tty_attached = transport::IsTerminalAttached();
  const session::TransportMode mode =
      transport::SelectTransportMode(tty_attached, transport::IsWindowsHost());
  if (outcome != nullptr) {
    outcome->transport_mode = mode;
    outcome->tty_attached = tty_attached;
  }

  session::StartMetadata meta;
  meta.session_id = session_id;
  meta.command = options.command;
  meta.working_directory = working_directory.string();
  meta.started_at = std::chrono::system_clock::now();
  meta.retention_seconds = options.retention.count();
  meta.transport_mode = mode;
  meta.tty_attached = tty_attached;
  meta.pid = 0;
  if (!store.WriteStartMetadata(meta, store_error)) {
    std::cerr << "write metadata: " << store_error.message << '\n';
    return kExitFailure;
  }

  logger.Info("session started",
              {{"event", "state_transition"},
               {"transport_mode", session::ToString(mode)},
               {"tty_attached", tty_attached ? "true" : "false"},
               {"state_transition", StateTransition(session::SessionState::kStarting,
                                                    session::SessionState::kRunning)}});

  BackgroundSweep sweep(store, options.retention, logger);

#if !defined(_WIN32)
  transport::ScopedIgnoreSigpipe ignore_sigpipe;
#endif

  capture::HostStreamSink host_stdout(capture::HostStream::kStdout);
  capture::HostStreamSink host_stderr(capture::HostStream::kStderr);
  capture::CaptureWriter pty_capture(store, logger, session_id, session::OutputChannel::kPty);
  capture::CaptureWriter stdout_capture(store, logger, session_id,
                                        session::OutputChannel::kStdout);
  capture::CaptureWriter stderr_capture(store, logger, session_id,
                                        session::OutputChannel::kStderr);
  capture::TeeSink terminal_output(pty_capture, host_stdout);
  capture::TeeSink stdout_output(stdout_capture, host_stdout);
  capture::TeeSink stderr_output(stderr_capture, host_stderr);

  transport::OutputSinks sinks;
  sinks.terminal = &terminal_output;
  sinks.stdout_sink = &stdout_output;
  sinks.stderr_sink = &stderr_output;

  transport::RunRequest request;
  request.command = options.command;
  request.working_directory = working_directory;
  request.cancel = options.cancel;
  request.on_start = [&store, &meta](int pid, std::string& start_error) {
    if (pid <= 0) {
      return true;
    }
    meta.pid = pid;
    state::StoreError write_error;
    if (!store.WriteStartMetadata(meta, write_error)) {
      start_error = "write meta file: " + write_error.message;
      return false;
    }
    return true;
  };

  std::unique_ptr<transport::ITransport> engine = transport::CreateTransport(mode);
  transport::RunResult run_result;
  transport::TransportError run_error;
  const bool run_ok = engine->Run(request, sinks, run_result, run_error);

  session::FinalMetadata final_meta;
  final_meta.session_id = session_id;
  final_meta.ended_at = std::chrono::system_clock::now();
  if (!run_ok) {
    final_meta.state = session::SessionState::kFailed;
    final_meta.error = run_error.message;
    logger.Error("session failed",
                 {{"event", "state_transition"},
                  {"error_code", transport::ToStableCode(run_error.code)},
                  {"error", run_error.message},
                  {"state_transition", StateTransition(session::SessionState::kRunning,
                                                       session::SessionState::kFailed)}});
  } else if (!run_result.signal_name.empty()) {
    final_meta.state = session::SessionState::kSignaled;
    final_meta.signal = run_result.signal_name;
    logger.Info("session signaled",
                {{"event", "state_transition"},
                 {"signal", run_result.signal_name},
                 {"state_transition", StateTransition(session::SessionState::kRunning,
                                                      session::SessionState::kSignaled)}});
  } else {
    final_meta.state = session::SessionState::kExited;
    final_meta.exit_code = run_result.exit_code;
    logger.Info("session exited",
                {{"event", "state_transition"},
                 {"exit_code", std::to_string(run_result.exit_code.value_or(0))},
                 {"state_transition", StateTransition(session::SessionState::kRunning,
                                                      session::SessionState::kExited)}});
  }

  sweep.Join();

  if (!store.WriteFinalMetadata(final_meta, store_error)) {
    std::cerr << "write final metadata: " << store_error.message << '\n';
    return kExitFailure;
  }
  if (outcome != nullptr) {
    outcome->final_metadata = final_meta;
  }

  if (!run_ok) {
    std::cerr << "run command: " << run_error.message << '\n';
    return kExitFailure;
  }
  if (run_result.signal_number > 0) {
    return core::errors::SignalExitCode(run_result.signal_number);
  }
  if (run_result.exit_code.has_value()) {
    return *run_result.exit_code;
  }
  return kExitFailure;
}

} // namespace runtape::runner
