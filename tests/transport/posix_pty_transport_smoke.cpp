#include "../common/assertions.hpp"
#include "capture/output_sink.hpp"
#include "transport/transport.hpp"

#include <iostream>
#include <mutex>
#include <string>

namespace {

using runtape::tests::common::AssertContains;
using runtape::tests::common::Fail;

class CollectingSink final : public runtape::capture::IOutputSink {
public:
  bool Write(std::string_view bytes, std::string& /*error*/) override {
    std::lock_guard<std::mutex> lock(mutex_);
    text_.append(bytes);
    return true;
  }

  std::string Text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return text_;
  }

private:
  mutable std::mutex mutex_;
  std::string text_;
};

} // namespace

int main() {
#if defined(_WIN32)
  return 0;
#else
  using runtape::transport::TransportErrorCode;

  const auto transport =
      runtape::transport::CreateTransport(runtape::session::TransportMode::kPosixPty);

  CollectingSink terminal;
  runtape::transport::OutputSinks sinks;
  sinks.terminal = &terminal;

  runtape::transport::RunRequest request;
  request.command = {"sh", "-c", "printf 'out\\n'; printf 'err\\n' 1>&2; test -t 1 && exit 7"};
  runtape::transport::RunResult result;
  runtape::transport::TransportError error;
  if (!transport->Run(request, sinks, result, error)) {
    if (error.code == TransportErrorCode::kSpawnFailed &&
        error.message.find("forkpty") != std::string::npos) {
      std::cout << "skipping: no pseudo-terminal available (" << error.message << ")\n";
      return 0;
    }
    Fail("pty run failed: " + error.message);
  }

  // Both streams arrive interleaved on the terminal channel.
  const std::string text = terminal.Text();
  AssertContains(text, "out");
  AssertContains(text, "err");
  if (!result.exit_code.has_value() || *result.exit_code != 7) {
    Fail("child stdout should be a terminal inside the pty transport");
  }

  runtape::transport::RunRequest missing;
  missing.command = {"/nonexistent/runtape-missing-binary"};
  if (transport->Run(missing, sinks, result, error) ||
      error.code != TransportErrorCode::kSpawnFailed) {
    Fail("missing binary should fail with a spawn error under a pty");
  }

  runtape::transport::RunRequest signaled;
  signaled.command = {"sh", "-c", "kill -TERM $$"};
  if (!transport->Run(signaled, sinks, result, error) || result.signal_name != "SIGTERM") {
    Fail("signal death under a pty should be reported as SIGTERM");
  }
  return 0;
#endif
}
