#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace runtape::session {

inline constexpr std::size_t kSessionIdLength = 26;
inline constexpr std::string_view kCrockfordAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
inline constexpr std::uint64_t kMaxSessionIdTimestampMs = (std::uint64_t{1} << 48U) - 1U;

using SessionIdEntropy = std::array<std::uint8_t, 10>;

// Renders a 48-bit millisecond timestamp followed by 80 entropy bits as 26
// Crockford base-32 symbols, most significant first. Identifiers generated
// later sort after earlier ones at millisecond granularity.
bool EncodeSessionId(std::uint64_t timestamp_ms, const SessionIdEntropy& entropy, std::string& id,
                     std::string& error);

// Generates a fresh identifier for `now` using the OS random source.
bool NewSessionId(std::chrono::system_clock::time_point now, std::string& id, std::string& error);

} // namespace runtape::session
