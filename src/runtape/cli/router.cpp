#include "runtape/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "mcp/server.hpp"
#include "session/metadata_json.hpp"
#include "state/session_store.hpp"
#include "state/state_paths.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#if defined(_WIN32)
#include <fcntl.h>
#include <io.h>
#include <stdio.h>
#endif

namespace fs = std::filesystem;

namespace runtape::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

constexpr std::string_view kVersion = "runtape 0.1.0";

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  runtape run [--session-id <id>] [--retention <duration>] "
         "[--log-level <debug|info|warn|error>] -- <command> [args...]\n"
      << "  runtape mcp [--retention <duration>] [--gc-interval <duration>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  runtape list [--prefix <id-prefix>] [--state <state>] [--limit <n>]\n"
      << "  runtape show <session-id>\n"
      << "  runtape read <session-id> [--cursor <n>] [--max-bytes <n>]\n"
      << "  runtape version\n";
}

bool ParseUnsigned(std::string_view raw, std::string_view flag, std::uint64_t& value,
                   std::string& error) {
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  if (raw.empty() || ec != std::errc() || ptr != raw.data() + raw.size()) {
    error = "invalid " + std::string(flag) + ": '" + std::string(raw) +
            "' (expected a non-negative integer)";
    return false;
  }
  return true;
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

bool OpenStoreForReading(state::SessionStore& store, std::string& error) {
  fs::path root;
  if (!state::ResolveStateRoot(root, error)) {
    error = "resolve state root: " + error;
    return false;
  }
  state::StoreError store_error;
  if (!store.Open(root, store_error)) {
    error = "init state store: " + store_error.message;
    return false;
  }
  return true;
}

int ExitCodeForStoreError(const state::StoreError& error) {
  return error.code == state::StoreErrorCode::kInvalidSessionId ? kExitUsage : kExitFailure;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << kVersion << '\n';
  return kExitSuccess;
}

int CommandRun(const std::vector<std::string_view>& args) {
  runner::RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return runner::ExecuteRun(options);
}

int CommandMcp(const std::vector<std::string_view>& args) {
  mcp::ServerOptions server_options;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  std::string error;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--retention") {
      if (!TakeValue(args, i, token, value, error) ||
          !ParseRetention(value, token, server_options.retention, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      continue;
    }
    if (token == "--gc-interval") {
      if (!TakeValue(args, i, token, value, error) ||
          !ParseRetention(value, token, server_options.gc_interval, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, token, value, error) ||
          !core::logging::ParseLogLevel(value, log_level, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      continue;
    }
    std::cerr << "error: unknown option: " << token << '\n';
    return kExitUsage;
  }

  fs::path root;
  if (!state::ResolveStateRoot(root, error)) {
    std::cerr << "resolve state root: " << error << '\n';
    return kExitFailure;
  }
  state::SessionStore store;
  state::StoreError store_error;
  if (!store.Open(root, store_error)) {
    std::cerr << "init state store: " << store_error.message << '\n';
    return kExitFailure;
  }
  core::logging::Logger logger(log_level);
  if (!logger.OpenFile(state::LogFilePath(root), error)) {
    std::cerr << "init logger: " << error << '\n';
    return kExitFailure;
  }

#if defined(_WIN32)
  _setmode(_fileno(stdin), _O_BINARY);
  _setmode(_fileno(stdout), _O_BINARY);
#endif

  mcp::Server server(store, logger, server_options);
  if (!server.Serve(std::cin, std::cout, error)) {
    std::cerr << "serve mcp: " << error << '\n';
    return kExitFailure;
  }
  return kExitSuccess;
}

int CommandList(const std::vector<std::string_view>& args) {
  state::ListQuery query;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--prefix") {
      if (!TakeValue(args, i, token, value, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      query.id_prefix = std::string(value);
      continue;
    }
    if (token == "--state") {
      session::SessionState parsed = session::SessionState::kStarting;
      if (!TakeValue(args, i, token, value, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      if (!session::ParseSessionState(value, parsed)) {
        std::cerr << "error: invalid --state '" << value
                  << "' (expected starting|running|exited|signaled|failed|expired)\n";
        return kExitUsage;
      }
      query.state = parsed;
      continue;
    }
    if (token == "--limit") {
      std::uint64_t limit = 0;
      if (!TakeValue(args, i, token, value, error) ||
          !ParseUnsigned(value, token, limit, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      query.limit = static_cast<std::size_t>(limit);
      continue;
    }
    std::cerr << "error: unknown option: " << token << '\n';
    return kExitUsage;
  }

  state::SessionStore store;
  if (!OpenStoreForReading(store, error)) {
    std::cerr << error << '\n';
    return kExitFailure;
  }
  state::SessionListing listing;
  state::StoreError store_error;
  if (!store.ListSessions(query, listing, store_error)) {
    std::cerr << "list sessions: " << store_error.message << '\n';
    return kExitFailure;
  }

  for (const session::SessionSummary& summary : listing.sessions) {
    std::cout << summary.session_id << ' ' << session::ToString(summary.state) << ' '
              << core::FormatUtcTimestamp(summary.started_at) << ' '
              << session::ToString(summary.transport_mode) << ' ' << summary.pid << '\n';
  }
  std::cout << "total: " << listing.total << '\n';
  return kExitSuccess;
}

int CommandShow(const std::vector<std::string_view>& args) {
  if (args.size() != 1U) {
    std::cerr << "error: show requires exactly 1 argument: <session-id>\n";
    return kExitUsage;
  }

  std::string error;
  state::SessionStore store;
  if (!OpenStoreForReading(store, error)) {
    std::cerr << error << '\n';
    return kExitFailure;
  }
  session::SessionDetail detail;
  state::StoreError store_error;
  if (!store.GetSession(args.front(), detail, store_error)) {
    std::cerr << "get session: " << store_error.message << '\n';
    return ExitCodeForStoreError(store_error);
  }
  std::cout << session::ToJson(detail) << '\n';
  return kExitSuccess;
}

int CommandRead(const std::vector<std::string_view>& args) {
  std::optional<std::string_view> session_id;
  std::uint64_t cursor = 0;
  std::uint64_t max_bytes = state::kDefaultReadMaxBytes;
  std::string error;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--cursor") {
      if (!TakeValue(args, i, token, value, error) ||
          !ParseUnsigned(value, token, cursor, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      continue;
    }
    if (token == "--max-bytes") {
      if (!TakeValue(args, i, token, value, error) ||
          !ParseUnsigned(value, token, max_bytes, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      std::cerr << "error: unknown option: " << token << '\n';
      return kExitUsage;
    }
    if (session_id.has_value()) {
      std::cerr << "error: read accepts exactly 1 session id\n";
      return kExitUsage;
    }
    session_id = token;
  }
  if (!session_id.has_value()) {
    std::cerr << "error: read requires a <session-id>\n";
    return kExitUsage;
  }

  state::SessionStore store;
  if (!OpenStoreForReading(store, error)) {
    std::cerr << error << '\n';
    return kExitFailure;
  }
  session::OutputPage page;
  state::StoreError store_error;
  if (!store.ReadOutput(*session_id, cursor, max_bytes, page, store_error)) {
    std::cerr << "read output: " << store_error.message << '\n';
    return ExitCodeForStoreError(store_error);
  }

#if defined(_WIN32)
  _setmode(_fileno(stdout), _O_BINARY);
#endif
  for (const session::OutputChunk& chunk : page.chunks) {
    std::cout.write(chunk.data.data(), static_cast<std::streamsize>(chunk.data.size()));
  }
  std::cout.flush();
  std::cerr << "next_cursor: " << page.next_cursor << '\n'
            << "eof: " << (page.eof ? "true" : "false") << '\n';
  return kExitSuccess;
}

} // namespace

bool ParseRetention(std::string_view raw, std::string_view flag, std::chrono::seconds& retention,
                    std::string& error) {
  std::chrono::milliseconds parsed{0};
  if (!core::ParseDuration(raw, parsed, error)) {
    error = "invalid " + std::string(flag) + " '" + std::string(raw) + "': " + error;
    return false;
  }
  if (parsed.count() <= 0) {
    error = std::string(flag).substr(2) + " must be positive";
    return false;
  }
  if (parsed.count() % 1000 != 0) {
    error = std::string(flag).substr(2) +
            " must be a whole number of seconds (for example: 1s, 30s, 5m)";
    return false;
  }
  retention = std::chrono::duration_cast<std::chrono::seconds>(parsed);
  return true;
}

bool ParseRunOptions(const std::vector<std::string_view>& args, runner::RunOptions& options,
                     std::string& error) {
  std::size_t i = 0;
  for (; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--") {
      ++i;
      break;
    }
    std::string_view value;
    if (token == "--session-id") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.session_id = std::string(value);
      continue;
    }
    if (token == "--retention") {
      if (!TakeValue(args, i, token, value, error) ||
          !ParseRetention(value, token, options.retention, error)) {
        return false;
      }
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, token, value, error) ||
          !core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    break;
  }

  options.command.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
  if (options.command.empty()) {
    error = "run command requires target command";
    return false;
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "run") {
    return CommandRun(args);
  }
  if (command == "mcp") {
    return CommandMcp(args);
  }
  if (command == "list") {
    return CommandList(args);
  }
  if (command == "show") {
    return CommandShow(args);
  }
  if (command == "read") {
    return CommandRead(args);
  }
  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace runtape::cli
