#include "state/file_lock.hpp"

#include <cerrno>
#include <cstring>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace runtape::state {

ExclusiveFileLock::~ExclusiveFileLock() {
  Release();
}

#if defined(_WIN32)

bool ExclusiveFileLock::Acquire(const std::filesystem::path& lock_path, std::string& error) {
  if (IsHeld()) {
    error = "lock is already held";
    return false;
  }

  HANDLE handle = CreateFileW(lock_path.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                              FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                              OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
  if (handle == INVALID_HANDLE_VALUE) {
    error = "open lock file '" + lock_path.string() +
            "' failed with error " + std::to_string(GetLastError());
    return false;
  }

  OVERLAPPED overlapped{};
  if (!LockFileEx(handle, LOCKFILE_EXCLUSIVE_LOCK, 0, MAXDWORD, MAXDWORD, &overlapped)) {
    const DWORD code = GetLastError();
    CloseHandle(handle);
    error = "lock file '" + lock_path.string() + "' failed with error " + std::to_string(code);
    return false;
  }

  handle_ = handle;
  return true;
}

void ExclusiveFileLock::Release() {
  if (handle_ == nullptr) {
    return;
  }
  OVERLAPPED overlapped{};
  UnlockFileEx(static_cast<HANDLE>(handle_), 0, MAXDWORD, MAXDWORD, &overlapped);
  CloseHandle(static_cast<HANDLE>(handle_));
  handle_ = nullptr;
}

bool ExclusiveFileLock::IsHeld() const {
  return handle_ != nullptr;
}

#else

bool ExclusiveFileLock::Acquire(const std::filesystem::path& lock_path, std::string& error) {
  if (IsHeld()) {
    error = "lock is already held";
    return false;
  }

  const int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (fd < 0) {
    error = "open lock file '" + lock_path.string() + "': " + std::strerror(errno);
    return false;
  }

  int rc = 0;
  do {
    rc = ::flock(fd, LOCK_EX);
  } while (rc != 0 && errno == EINTR);
  if (rc != 0) {
    const int saved_errno = errno;
    ::close(fd);
    error = "lock file '" + lock_path.string() + "': " + std::strerror(saved_errno);
    return false;
  }

  fd_ = fd;
  return true;
}

void ExclusiveFileLock::Release() {
  if (fd_ < 0) {
    return;
  }
  (void)::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
}

bool ExclusiveFileLock::IsHeld() const {
  return fd_ >= 0;
}

#endif

} // namespace runtape::state
