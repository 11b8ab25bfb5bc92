#ifndef RUNTAPE_TESTS_COMMON_TEMP_DIR_HPP_
#define RUNTAPE_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#if defined(_WIN32)
#include <process.h>
#else
#include <unistd.h>
#endif

namespace runtape::tests::common {

inline long CurrentProcessId() {
#if defined(_WIN32)
  return static_cast<long>(_getpid());
#else
  return static_cast<long>(::getpid());
#endif
}

// Smoke tests run in parallel under ctest and some fork recorders, so the
// directory name carries the pid and a per-process counter next to the clock.
inline std::filesystem::path CreateUniqueTempDir(std::string_view prefix) {
  static std::atomic<unsigned> counter{0};
  std::error_code ec;
  const std::filesystem::path base = std::filesystem::temp_directory_path(ec);
  if (ec) {
    Fail("failed to resolve temp directory: " + ec.message());
  }

  for (int attempt = 0; attempt < 16; ++attempt) {
    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    const std::filesystem::path root =
        base / (std::string(prefix) + "-" + std::to_string(CurrentProcessId()) + "-" +
                std::to_string(now_ms) + "-" + std::to_string(counter.fetch_add(1)));
    if (std::filesystem::create_directory(root, ec)) {
      return root;
    }
  }
  Fail("failed to create unique temp root for prefix: " + std::string(prefix));
}

inline void RemovePathBestEffort(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

} // namespace runtape::tests::common

#endif // RUNTAPE_TESTS_COMMON_TEMP_DIR_HPP_
