#include "transport/exit_status.hpp"
#include "transport/transport.hpp"

#include <catch2/catch.hpp>

#include <csignal>

TEST_CASE("Transport mode follows terminal attachment and host", "[core][transport]") {
  using runtape::session::TransportMode;
  REQUIRE(runtape::transport::SelectTransportMode(false, false) == TransportMode::kPipe);
  REQUIRE(runtape::transport::SelectTransportMode(false, true) == TransportMode::kPipe);
  REQUIRE(runtape::transport::SelectTransportMode(true, false) == TransportMode::kPosixPty);
  REQUIRE(runtape::transport::SelectTransportMode(true, true) == TransportMode::kWindowsConPty);
}

TEST_CASE("CreateTransport returns the requested mode", "[core][transport]") {
  using runtape::session::TransportMode;
  for (const TransportMode mode :
       {TransportMode::kPipe, TransportMode::kPosixPty, TransportMode::kWindowsConPty}) {
    const auto transport = runtape::transport::CreateTransport(mode);
    REQUIRE(transport != nullptr);
    REQUIRE(transport->Mode() == mode);
  }
}

TEST_CASE("Transport on the wrong host reports unimplemented", "[core][transport]") {
  using runtape::session::TransportMode;
  const TransportMode foreign =
      runtape::transport::IsWindowsHost() ? TransportMode::kPosixPty : TransportMode::kWindowsConPty;
  const auto transport = runtape::transport::CreateTransport(foreign);

  runtape::transport::RunRequest request;
  request.command = {"true"};
  runtape::transport::RunResult result;
  runtape::transport::TransportError error;
  REQUIRE_FALSE(transport->Run(request, runtape::transport::OutputSinks{}, result, error));
  REQUIRE(error.code == runtape::transport::TransportErrorCode::kUnimplemented);
  REQUIRE(runtape::transport::ToStableCode(error.code) == "UNIMPLEMENTED");
}

TEST_CASE("Signal names use the SIG prefix", "[core][transport]") {
  REQUIRE(runtape::transport::SignalName(SIGTERM) == "SIGTERM");
  REQUIRE(runtape::transport::SignalName(SIGINT) == "SIGINT");
  REQUIRE(runtape::transport::SignalName(200) == "SIG200");
}

#if defined(__linux__)
TEST_CASE("Wait statuses decode into exit codes or signals", "[core][transport]") {
  const runtape::transport::RunResult exited = runtape::transport::DecodeWaitStatus(3 << 8);
  REQUIRE(exited.exit_code.has_value());
  REQUIRE(*exited.exit_code == 3);
  REQUIRE(exited.signal_name.empty());

  const runtape::transport::RunResult signaled = runtape::transport::DecodeWaitStatus(SIGTERM);
  REQUIRE_FALSE(signaled.exit_code.has_value());
  REQUIRE(signaled.signal_name == "SIGTERM");
  REQUIRE(signaled.signal_number == SIGTERM);
}
#endif
