#pragma once

#include <atomic>
#include <cstdio>
#include <string>
#include <string_view>

namespace runtape::capture {

// Destination for one channel of child output. Write returns false with
// `error` set when the bytes could not be consumed. Implementations are
// called from a single copy thread per channel.
class IOutputSink {
public:
  virtual ~IOutputSink() = default;

  virtual bool Write(std::string_view bytes, std::string& error) = 0;
};

enum class HostStream {
  kStdout,
  kStderr,
};

// Mirrors output to the recorder's own stdout/stderr. A closed reader (EPIPE)
// silently turns the mirror off; recording continues.
class HostStreamSink final : public IOutputSink {
public:
  explicit HostStreamSink(HostStream stream);

  bool Write(std::string_view bytes, std::string& error) override;

  bool Disabled() const {
    return disabled_.load();
  }

private:
  HostStream stream_;
  std::atomic<bool> disabled_{false};
};

// Writes to `primary` first (the durable record), then `mirror`. A primary
// failure is reported without touching the mirror.
class TeeSink final : public IOutputSink {
public:
  TeeSink(IOutputSink& primary, IOutputSink& mirror) : primary_(primary), mirror_(mirror) {}

  bool Write(std::string_view bytes, std::string& error) override;

private:
  IOutputSink& primary_;
  IOutputSink& mirror_;
};

} // namespace runtape::capture
