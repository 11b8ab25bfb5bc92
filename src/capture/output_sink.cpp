#include "capture/output_sink.hpp"

#include <cerrno>
#include <cstring>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace runtape::capture {

HostStreamSink::HostStreamSink(HostStream stream) : stream_(stream) {}

bool HostStreamSink::Write(std::string_view bytes, std::string& error) {
  if (bytes.empty() || disabled_.load()) {
    return true;
  }

#if defined(_WIN32)
  HANDLE handle =
      GetStdHandle(stream_ == HostStream::kStdout ? STD_OUTPUT_HANDLE : STD_ERROR_HANDLE);
  if (handle == nullptr || handle == INVALID_HANDLE_VALUE) {
    disabled_.store(true);
    return true;
  }
  std::size_t written_total = 0;
  while (written_total < bytes.size()) {
    DWORD written = 0;
    const auto to_write = static_cast<DWORD>(bytes.size() - written_total);
    if (!WriteFile(handle, bytes.data() + written_total, to_write, &written, nullptr)) {
      const DWORD code = GetLastError();
      if (code == ERROR_BROKEN_PIPE || code == ERROR_NO_DATA) {
        disabled_.store(true);
        return true;
      }
      error = "write host stream failed with error " + std::to_string(code);
      return false;
    }
    written_total += written;
  }
  return true;
#else
  const int fd = stream_ == HostStream::kStdout ? STDOUT_FILENO : STDERR_FILENO;
  std::size_t written_total = 0;
  while (written_total < bytes.size()) {
    const ssize_t written =
        ::write(fd, bytes.data() + written_total, bytes.size() - written_total);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EPIPE) {
        disabled_.store(true);
        return true;
      }
      error = std::string("write host stream: ") + std::strerror(errno);
      return false;
    }
    written_total += static_cast<std::size_t>(written);
  }
  return true;
#endif
}

bool TeeSink::Write(std::string_view bytes, std::string& error) {
  if (!primary_.Write(bytes, error)) {
    return false;
  }
  return mirror_.Write(bytes, error);
}

} // namespace runtape::capture
