#include "capture/capture_writer.hpp"

#include <chrono>

namespace runtape::capture {

CaptureWriter::CaptureWriter(const state::SessionStore& store, core::logging::Logger& logger,
                             std::string session_id, session::OutputChannel channel)
    : store_(store), logger_(logger), session_id_(std::move(session_id)), channel_(channel) {}

bool CaptureWriter::Write(std::string_view bytes, std::string& error) {
  if (bytes.empty()) {
    return true;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::uint64_t offset = 0;
  state::StoreError store_error;
  if (!store_.AppendOutput(session_id_, channel_, bytes, std::chrono::system_clock::now(), offset,
                           store_error)) {
    error = "append output: " + store_error.message;
    return false;
  }
  bytes_written_ += bytes.size();

  logger_.Debug("chunk written", {{"event", "chunk_written"},
                                  {"channel", session::ToString(channel_)},
                                  {"chunk_offset", std::to_string(offset)},
                                  {"chunk_size", std::to_string(bytes.size())}});
  return true;
}

std::uint64_t CaptureWriter::BytesWritten() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bytes_written_;
}

} // namespace runtape::capture
