#include "session/session_id.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <string>

namespace {

bool UsesCrockfordAlphabet(const std::string& id) {
  return id.find_first_not_of(runtape::session::kCrockfordAlphabet) == std::string::npos;
}

} // namespace

TEST_CASE("Session ids are 26 Crockford symbols", "[core][session_id]") {
  std::string id;
  std::string error;
  REQUIRE(runtape::session::NewSessionId(std::chrono::system_clock::now(), id, error));
  REQUIRE(id.size() == runtape::session::kSessionIdLength);
  REQUIRE(UsesCrockfordAlphabet(id));
  REQUIRE(id.find_first_of("ILOU") == std::string::npos);
}

TEST_CASE("Zero timestamp and entropy encode to all zero symbols", "[core][session_id]") {
  std::string id;
  std::string error;
  REQUIRE(runtape::session::EncodeSessionId(0, runtape::session::SessionIdEntropy{}, id, error));
  REQUIRE(id == std::string(26, '0'));
}

TEST_CASE("Later timestamps sort after earlier ones", "[core][session_id]") {
  runtape::session::SessionIdEntropy high{};
  high.fill(0xFF);
  const runtape::session::SessionIdEntropy low{};

  std::string earlier;
  std::string later;
  std::string error;
  REQUIRE(runtape::session::EncodeSessionId(1'700'000'000'000ULL, high, earlier, error));
  REQUIRE(runtape::session::EncodeSessionId(1'700'000'000'001ULL, low, later, error));
  REQUIRE(earlier < later);
  REQUIRE(earlier.substr(0, 10) != later.substr(0, 10));
}

TEST_CASE("Ids generated in the same millisecond differ", "[core][session_id]") {
  const auto now = std::chrono::system_clock::now();
  std::string first;
  std::string second;
  std::string error;
  REQUIRE(runtape::session::NewSessionId(now, first, error));
  REQUIRE(runtape::session::NewSessionId(now, second, error));
  REQUIRE(first != second);
  REQUIRE(first.substr(0, 10) == second.substr(0, 10));
}

TEST_CASE("Timestamps beyond 48 bits are rejected", "[core][session_id]") {
  std::string id;
  std::string error;
  REQUIRE_FALSE(runtape::session::EncodeSessionId(runtape::session::kMaxSessionIdTimestampMs + 1,
                                                  runtape::session::SessionIdEntropy{}, id,
                                                  error));
  REQUIRE(error.find("48-bit") != std::string::npos);
}
