#pragma once

#include "runner/run_orchestrator.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace runtape::cli {

// Parses `run` arguments. Flags come first; the target command follows `--`
// or starts at the first non-flag token.
bool ParseRunOptions(const std::vector<std::string_view>& args, runner::RunOptions& options,
                     std::string& error);

// Accepts whole-second durations such as `90`, `45s`, `30m`, `24h`, `1h30m`.
// `flag` names the option in error messages.
bool ParseRetention(std::string_view raw, std::string_view flag, std::chrono::seconds& retention,
                    std::string& error);

// Routes `runtape` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0 => success
//   1 => command failed after valid invocation
//   2 => usage error (unknown command / invalid args)
// `run` otherwise exits with the recorded child outcome.
int Dispatch(int argc, char** argv);

} // namespace runtape::cli
