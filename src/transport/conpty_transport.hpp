#pragma once

#include "transport/transport.hpp"

namespace runtape::transport {

inline constexpr short kDefaultConPtyColumns = 120;
inline constexpr short kDefaultConPtyRows = 30;

// Windows pseudo-console transport. On other hosts Run fails with
// kUnimplemented.
class ConPtyTransport final : public ITransport {
public:
  session::TransportMode Mode() const override {
    return session::TransportMode::kWindowsConPty;
  }

  bool Run(const RunRequest& request, const OutputSinks& sinks, RunResult& result,
           TransportError& error) override;
};

} // namespace runtape::transport
