#pragma once

#include <atomic>

namespace runtape::transport {

// One-shot cancellation flag shared between the caller and a running
// transport. Transports poll it from their signal-relay thread.
class CancellationToken {
public:
  void Cancel() {
    cancelled_.store(true);
  }

  bool IsCancelled() const {
    return cancelled_.load();
  }

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace runtape::transport
