#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace runtape::mcp {

// Upper bound for one request body; larger frames are rejected.
inline constexpr std::size_t kMaxFrameBytes = 16U * 1024U * 1024U;

enum class FrameReadStatus {
  kFrame,
  kEndOfStream,
  kError,
};

// Reads one `Content-Length: N\r\n\r\n<body>` frame. Header names are matched
// case-insensitively and unknown headers are ignored. End of input before any
// header byte is a clean end of stream.
FrameReadStatus ReadFrame(std::istream& in, std::string& body, std::string& error);

bool WriteFrame(std::ostream& out, std::string_view body, std::string& error);

} // namespace runtape::mcp
