#pragma once

#include "transport/transport.hpp"

#include <string>

namespace runtape::transport {

// "SIGTERM"-style name for a signal number, "SIG<n>" when unknown.
std::string SignalName(int signal_number);

#if !defined(_WIN32)
// Decodes a waitpid status into an exit code or a terminating signal.
RunResult DecodeWaitStatus(int status);
#endif

} // namespace runtape::transport
