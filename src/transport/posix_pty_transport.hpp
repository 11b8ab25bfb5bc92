#pragma once

#include "transport/transport.hpp"

namespace runtape::transport {

// forkpty-based terminal transport. The child runs as its own session leader
// on the pty slave. Window size follows the recorder's stdin terminal, host
// stdin is relayed into the master, and forwarded signals go to the child's
// process group.
class PosixPtyTransport final : public ITransport {
public:
  session::TransportMode Mode() const override {
    return session::TransportMode::kPosixPty;
  }

  bool Run(const RunRequest& request, const OutputSinks& sinks, RunResult& result,
           TransportError& error) override;
};

} // namespace runtape::transport
