#include "mcp/rpc_framing.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace runtape::mcp {

namespace {

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) ==
                  std::tolower(static_cast<unsigned char>(b));
         });
}

} // namespace

FrameReadStatus ReadFrame(std::istream& in, std::string& body, std::string& error) {
  body.clear();
  bool saw_header_line = false;
  bool have_length = false;
  std::size_t content_length = 0;

  std::string line;
  while (true) {
    if (!std::getline(in, line)) {
      if (!saw_header_line && line.empty()) {
        return FrameReadStatus::kEndOfStream;
      }
      error = "unexpected end of input in frame header";
      return FrameReadStatus::kError;
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      if (!saw_header_line) {
        continue;
      }
      break;
    }
    saw_header_line = true;

    const std::size_t colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string_view key = Trim(std::string_view(line).substr(0, colon));
    const std::string_view value = Trim(std::string_view(line).substr(colon + 1));
    if (!EqualsIgnoreCase(key, "Content-Length")) {
      continue;
    }
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(),
                                           content_length);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
      error = "invalid content length: " + std::string(value);
      return FrameReadStatus::kError;
    }
    have_length = true;
  }

  if (!have_length) {
    error = "missing content length header";
    return FrameReadStatus::kError;
  }
  if (content_length > kMaxFrameBytes) {
    error = "frame too large: " + std::to_string(content_length) + " bytes";
    return FrameReadStatus::kError;
  }

  body.resize(content_length);
  in.read(body.data(), static_cast<std::streamsize>(content_length));
  if (static_cast<std::size_t>(in.gcount()) != content_length) {
    error = "read request body: unexpected end of input";
    return FrameReadStatus::kError;
  }
  return FrameReadStatus::kFrame;
}

bool WriteFrame(std::ostream& out, std::string_view body, std::string& error) {
  out << "Content-Length: " << body.size() << "\r\n\r\n";
  out.write(body.data(), static_cast<std::streamsize>(body.size()));
  out.flush();
  if (!out) {
    error = "write response: output stream failed";
    return false;
  }
  return true;
}

} // namespace runtape::mcp
