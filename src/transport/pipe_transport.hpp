#pragma once

#include "transport/transport.hpp"

namespace runtape::transport {

// Plain pipes for stdout and stderr, copied concurrently. The child inherits
// the recorder's stdin.
class PipeTransport final : public ITransport {
public:
  session::TransportMode Mode() const override {
    return session::TransportMode::kPipe;
  }

  bool Run(const RunRequest& request, const OutputSinks& sinks, RunResult& result,
           TransportError& error) override;
};

} // namespace runtape::transport
