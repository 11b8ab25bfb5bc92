#ifndef RUNTAPE_CORE_TIME_UTILS_HPP_
#define RUNTAPE_CORE_TIME_UTILS_HPP_

#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace runtape::core {

// Canonical UTC timestamp formatter used by session metadata, index records
// and log lines. Millisecond precision is enough to order chunks for readers.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds =
      static_cast<std::time_t>((millis_since_epoch - millis_component) / 1000);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

namespace detail {

// Days since 1970-01-01 for a proleptic Gregorian civil date.
inline std::int64_t DaysFromCivil(std::int64_t year, unsigned month, unsigned day) {
  year -= month <= 2 ? 1 : 0;
  const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
  const auto yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

inline bool ReadFixedDigits(std::string_view text, std::size_t& pos, std::size_t count,
                            int& value) {
  if (pos + count > text.size()) {
    return false;
  }
  value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char c = text[pos + i];
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  pos += count;
  return true;
}

inline bool Expect(std::string_view text, std::size_t& pos, char expected) {
  if (pos >= text.size() || text[pos] != expected) {
    return false;
  }
  ++pos;
  return true;
}

} // namespace detail

// Parses RFC 3339 timestamps ("2024-05-01T10:00:00.123Z", "...+02:00").
// Fractional seconds beyond millisecond precision are truncated.
inline bool ParseUtcTimestamp(std::string_view text,
                              std::chrono::system_clock::time_point& timestamp,
                              std::string& error) {
  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  const bool date_ok = detail::ReadFixedDigits(text, pos, 4, year) &&
                       detail::Expect(text, pos, '-') &&
                       detail::ReadFixedDigits(text, pos, 2, month) &&
                       detail::Expect(text, pos, '-') &&
                       detail::ReadFixedDigits(text, pos, 2, day);
  if (!date_ok || pos >= text.size() || (text[pos] != 'T' && text[pos] != 't')) {
    error = "invalid timestamp '" + std::string(text) + "'";
    return false;
  }
  ++pos;
  const bool time_ok = detail::ReadFixedDigits(text, pos, 2, hour) &&
                       detail::Expect(text, pos, ':') &&
                       detail::ReadFixedDigits(text, pos, 2, minute) &&
                       detail::Expect(text, pos, ':') &&
                       detail::ReadFixedDigits(text, pos, 2, second);
  if (!time_ok || month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 60) {
    error = "invalid timestamp '" + std::string(text) + "'";
    return false;
  }

  std::int64_t millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      error = "invalid timestamp fraction in '" + std::string(text) + "'";
      return false;
    }
    for (std::size_t i = digits; i < 3; ++i) {
      millis *= 10;
    }
  }

  std::int64_t offset_seconds = 0;
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    const int sign = text[pos] == '-' ? -1 : 1;
    ++pos;
    int offset_hours = 0;
    int offset_minutes = 0;
    if (!detail::ReadFixedDigits(text, pos, 2, offset_hours) || !detail::Expect(text, pos, ':') ||
        !detail::ReadFixedDigits(text, pos, 2, offset_minutes)) {
      error = "invalid timestamp offset in '" + std::string(text) + "'";
      return false;
    }
    offset_seconds = sign * (offset_hours * 3600 + offset_minutes * 60);
  } else {
    error = "timestamp '" + std::string(text) + "' is missing a zone designator";
    return false;
  }
  if (pos != text.size()) {
    error = "unexpected trailing content in timestamp '" + std::string(text) + "'";
    return false;
  }

  const std::int64_t days =
      detail::DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  const std::int64_t epoch_seconds =
      days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
  timestamp = std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::milliseconds(epoch_seconds * 1000 + millis)));
  return true;
}

// Parses CLI durations: a bare integer means seconds, otherwise a sequence of
// <number><unit> terms with units ms, s, m, h ("1h30m", "45s", "1500ms").
inline bool ParseDuration(std::string_view text, std::chrono::milliseconds& duration,
                          std::string& error) {
  if (text.empty()) {
    error = "duration value cannot be empty";
    return false;
  }

  bool all_digits = true;
  for (const char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      all_digits = false;
      break;
    }
  }
  if (all_digits) {
    if (text.size() > 12) {
      error = "duration '" + std::string(text) + "' is out of range";
      return false;
    }
    duration = std::chrono::seconds(std::stoll(std::string(text)));
    return true;
  }

  std::int64_t total_ms = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::int64_t number = 0;
    std::size_t digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
      number = number * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
      if (digits > 12) {
        error = "duration '" + std::string(text) + "' is out of range";
        return false;
      }
    }
    if (digits == 0) {
      error = "invalid duration '" + std::string(text) + "' (expected e.g. 90, 45s, 30m, 24h)";
      return false;
    }

    std::int64_t unit_ms = 0;
    if (text.substr(pos, 2) == "ms") {
      unit_ms = 1;
      pos += 2;
    } else if (pos < text.size() && text[pos] == 's') {
      unit_ms = 1000;
      ++pos;
    } else if (pos < text.size() && text[pos] == 'm') {
      unit_ms = 60 * 1000;
      ++pos;
    } else if (pos < text.size() && text[pos] == 'h') {
      unit_ms = 60 * 60 * 1000;
      ++pos;
    } else {
      error = "invalid duration unit in '" + std::string(text) + "' (expected ms, s, m or h)";
      return false;
    }
    total_ms += number * unit_ms;
  }

  duration = std::chrono::milliseconds(total_ms);
  return true;
}

} // namespace runtape::core

#endif // RUNTAPE_CORE_TIME_UTILS_HPP_
