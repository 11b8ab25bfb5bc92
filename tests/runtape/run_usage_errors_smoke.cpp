#include "../common/assertions.hpp"
#include "../common/run_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using runtape::tests::common::AssertContains;
using runtape::tests::common::AssertExitCode;
using runtape::tests::common::DispatchWithStateRoot;
using runtape::tests::common::Fail;

constexpr int kExitUsage = runtape::core::errors::ToInt(runtape::core::errors::ExitCode::kUsage);

void ExpectUsageError(const fs::path& state_root, const std::vector<std::string>& args,
                      std::string_view expected_text) {
  const auto outcome = DispatchWithStateRoot(state_root, args);
  std::string joined = "runtape";
  for (const auto& arg : args) {
    joined += " " + arg;
  }
  AssertExitCode(outcome.exit_code, kExitUsage, joined, outcome.err);
  AssertContains(outcome.err, expected_text);
}

} // namespace

int main() {
  using runtape::tests::common::CollectSessionIds;
  using runtape::tests::common::CreateUniqueTempDir;
  using runtape::tests::common::RemovePathBestEffort;

  const fs::path state_root = CreateUniqueTempDir("runtape-usage-errors");

  {
    const std::vector<std::string> argv_storage = {"runtape"};
    std::ostringstream captured;
    std::streambuf* original = std::cerr.rdbuf(captured.rdbuf());
    const int exit_code = runtape::tests::common::DispatchArgs(argv_storage);
    std::cerr.rdbuf(original);
    AssertExitCode(exit_code, kExitUsage, "runtape without a subcommand");
    AssertContains(captured.str(), "usage:");
  }

  ExpectUsageError(state_root, {"run"}, "run command requires target command");
  ExpectUsageError(state_root, {"run", "--"}, "run command requires target command");
  ExpectUsageError(state_root, {"run", "--retention", "0s", "--", "true"},
                   "retention must be positive");
  ExpectUsageError(state_root, {"run", "--retention", "1500ms", "--", "true"},
                   "whole number of seconds");
  ExpectUsageError(state_root, {"run", "--retention", "soon", "--", "true"},
                   "invalid --retention 'soon'");
  ExpectUsageError(state_root, {"run", "--retention"}, "missing value for --retention");
  ExpectUsageError(state_root, {"run", "--session-id"}, "missing value for --session-id");
  ExpectUsageError(state_root, {"run", "--log-level", "loud", "--", "true"}, "loud");
  ExpectUsageError(state_root, {"run", "--bogus", "--", "true"}, "unknown option: --bogus");
  ExpectUsageError(state_root, {"run", "--session-id", "../escape", "--", "true"},
                   "invalid session id: ../escape");
  ExpectUsageError(state_root, {"frobnicate"}, "unknown subcommand: frobnicate");
  ExpectUsageError(state_root, {"mcp", "--gc-interval", "0s"}, "gc-interval must be positive");
  ExpectUsageError(state_root, {"version", "extra"}, "version does not accept arguments");

  const auto help = DispatchWithStateRoot(state_root, {"help"});
  AssertExitCode(help.exit_code, 0, "runtape help", help.err);
  AssertContains(help.out, "runtape run");

  const auto version = DispatchWithStateRoot(state_root, {"version"});
  AssertExitCode(version.exit_code, 0, "runtape version", version.err);
  AssertContains(version.out, "runtape 0.1.0");

  if (!CollectSessionIds(state_root).empty()) {
    Fail("usage errors must not create sessions");
  }
  if (fs::exists(state_root / "escape")) {
    Fail("invalid session id escaped the sessions directory");
  }

  RemovePathBestEffort(state_root);
  return 0;
}
