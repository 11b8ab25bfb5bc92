#include "session/session_id.hpp"

#include <exception>
#include <random>

namespace runtape::session {

bool EncodeSessionId(std::uint64_t timestamp_ms, const SessionIdEntropy& entropy, std::string& id,
                     std::string& error) {
  if (timestamp_ms > kMaxSessionIdTimestampMs) {
    error = "timestamp exceeds 48-bit session id range: " + std::to_string(timestamp_ms);
    return false;
  }

  std::array<std::uint8_t, 16> raw{};
  for (std::size_t i = 0; i < 6; ++i) {
    raw[i] = static_cast<std::uint8_t>((timestamp_ms >> (8U * (5U - i))) & 0xFFU);
  }
  for (std::size_t i = 0; i < entropy.size(); ++i) {
    raw[6 + i] = entropy[i];
  }

  std::string out;
  out.reserve(kSessionIdLength);
  std::uint32_t buffer = 0;
  unsigned bits = 0;
  for (const std::uint8_t byte : raw) {
    buffer = (buffer << 8U) | byte;
    bits += 8U;
    while (bits >= 5U) {
      bits -= 5U;
      out.push_back(kCrockfordAlphabet[(buffer >> bits) & 31U]);
    }
  }
  // 128 bits leave three trailing bits for the final symbol.
  if (bits > 0U) {
    out.push_back(kCrockfordAlphabet[(buffer << (5U - bits)) & 31U]);
  }
  while (out.size() < kSessionIdLength) {
    out.push_back(kCrockfordAlphabet[0]);
  }

  id = std::move(out);
  return true;
}

bool NewSessionId(std::chrono::system_clock::time_point now, std::string& id, std::string& error) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  if (millis < 0) {
    error = "timestamp precedes the unix epoch";
    return false;
  }

  SessionIdEntropy entropy{};
  try {
    std::random_device device;
    std::uniform_int_distribution<unsigned int> byte_dist(0U, 255U);
    for (auto& byte : entropy) {
      byte = static_cast<std::uint8_t>(byte_dist(device));
    }
  } catch (const std::exception& ex) {
    error = std::string("read random bytes: ") + ex.what();
    return false;
  }

  return EncodeSessionId(static_cast<std::uint64_t>(millis), entropy, id, error);
}

} // namespace runtape::session
