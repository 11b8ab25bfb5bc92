#pragma once

namespace runtape::core::errors {

// Stable process-exit contract for CLI automation.
//
// - 0 success
// - 1 generic command failure (setup errors, engine failures)
// - 2 usage/argument failure
//
// `runtape run` otherwise exits with the recorded child outcome, and a child
// terminated by signal N maps to kSignalBase + N.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
};

constexpr int kSignalBase = 128;

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

constexpr int SignalExitCode(int signal_number) {
  return kSignalBase + signal_number;
}

} // namespace runtape::core::errors
