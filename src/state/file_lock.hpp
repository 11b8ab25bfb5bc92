#pragma once

#include <filesystem>
#include <string>

namespace runtape::state {

// Exclusive advisory lock held on a lock file for the lifetime of the object.
// Blocks until the lock is granted. Unlocks and closes on destruction.
class ExclusiveFileLock {
public:
  ExclusiveFileLock() = default;
  ~ExclusiveFileLock();

  ExclusiveFileLock(const ExclusiveFileLock&) = delete;
  ExclusiveFileLock& operator=(const ExclusiveFileLock&) = delete;

  bool Acquire(const std::filesystem::path& lock_path, std::string& error);
  void Release();

  bool IsHeld() const;

private:
#if defined(_WIN32)
  void* handle_ = nullptr;
#else
  int fd_ = -1;
#endif
};

} // namespace runtape::state
