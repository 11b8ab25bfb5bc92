#pragma once

#include "capture/output_sink.hpp"
#include "core/logging/logger.hpp"
#include "session/model.hpp"
#include "state/session_store.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace runtape::capture {

// Records one output channel of a session into the store. Each successful
// write becomes one index record and one debug log line.
class CaptureWriter final : public IOutputSink {
public:
  CaptureWriter(const state::SessionStore& store, core::logging::Logger& logger,
                std::string session_id, session::OutputChannel channel);

  bool Write(std::string_view bytes, std::string& error) override;

  std::uint64_t BytesWritten() const;

private:
  const state::SessionStore& store_;
  core::logging::Logger& logger_;
  std::string session_id_;
  session::OutputChannel channel_;

  mutable std::mutex mutex_;
  std::uint64_t bytes_written_ = 0;
};

} // namespace runtape::capture
