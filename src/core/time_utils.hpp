#ifndef CHAOSSCORE_CORE_TIME_UTILS_HPP_
#define CHAOSSCORE_CORE_TIME_UTILS_HPP_

#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace chaosscore::core {

// Canonical UTC timestamp formatter used by logs and report metadata.
// Millisecond precision keeps traces readable while preserving triage value.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
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
constexpr std::int64_t DaysFromCivil(std::int64_t year, unsigned month, unsigned day) {
  year -= month <= 2U ? 1 : 0;
  const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
  const auto year_of_era = static_cast<unsigned>(year - era * 400);
  const unsigned day_of_year = (153U * (month > 2U ? month - 3U : month + 9U) + 2U) / 5U + day - 1U;
  const unsigned day_of_era = year_of_era * 365U + year_of_era / 4U - year_of_era / 100U + day_of_year;
  return era * 146097 + static_cast<std::int64_t>(day_of_era) - 719468;
}

inline bool ReadFixedDigits(std::string_view text, std::size_t& pos, std::size_t count, int& value) {
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

inline bool IsLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

inline int DaysInMonth(int year, int month) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeapYear(year)) {
    return 29;
  }
  return kDays[month - 1];
}

} // namespace detail

// Parses ISO-8601 timestamps as written by the interception layer:
//   YYYY-MM-DD
//   YYYY-MM-DD[T| ]HH:MM[:SS[.fraction]][Z|+HH:MM|-HH:MM|+HHMM]
//
// Timestamps without an offset are interpreted as UTC. Fractions beyond
// microseconds are truncated. Returns false with `error` populated when the
// text does not match.
inline bool ParseIso8601Timestamp(std::string_view text,
                                  std::chrono::system_clock::time_point& timestamp,
                                  std::string& error) {
  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  auto fail = [&](std::string_view reason) {
    error = "invalid ISO-8601 timestamp '" + std::string(text) + "': " + std::string(reason);
    return false;
  };

  if (!detail::ReadFixedDigits(text, pos, 4, year) || pos >= text.size() || text[pos++] != '-' ||
      !detail::ReadFixedDigits(text, pos, 2, month) || pos >= text.size() || text[pos++] != '-' ||
      !detail::ReadFixedDigits(text, pos, 2, day)) {
    return fail("expected YYYY-MM-DD date");
  }
  if (month < 1 || month > 12 || day < 1 || day > detail::DaysInMonth(year, month)) {
    return fail("date out of range");
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  std::int64_t micros = 0;
  int offset_minutes = 0;

  if (pos < text.size()) {
    if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') {
      return fail("expected 'T' between date and time");
    }
    ++pos;

    if (!detail::ReadFixedDigits(text, pos, 2, hour) || pos >= text.size() || text[pos++] != ':' ||
        !detail::ReadFixedDigits(text, pos, 2, minute)) {
      return fail("expected HH:MM time");
    }
    if (pos < text.size() && text[pos] == ':') {
      ++pos;
      if (!detail::ReadFixedDigits(text, pos, 2, second)) {
        return fail("expected seconds after ':'");
      }
      if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
          if (digits < 6U) {
            micros = micros * 10 + (text[pos] - '0');
          }
          ++digits;
          ++pos;
        }
        if (digits == 0U) {
          return fail("expected digits after decimal point");
        }
        for (std::size_t i = digits; i < 6U; ++i) {
          micros *= 10;
        }
      }
    }
    if (hour > 23 || minute > 59 || second > 59) {
      return fail("time out of range");
    }

    if (pos < text.size()) {
      const char sign = text[pos];
      if (sign == 'Z' || sign == 'z') {
        ++pos;
      } else if (sign == '+' || sign == '-') {
        ++pos;
        int offset_hours = 0;
        int offset_mins = 0;
        if (!detail::ReadFixedDigits(text, pos, 2, offset_hours)) {
          return fail("expected offset hours");
        }
        if (pos < text.size() && text[pos] == ':') {
          ++pos;
        }
        if (!detail::ReadFixedDigits(text, pos, 2, offset_mins)) {
          return fail("expected offset minutes");
        }
        if (offset_hours > 23 || offset_mins > 59) {
          return fail("offset out of range");
        }
        offset_minutes = (offset_hours * 60 + offset_mins) * (sign == '-' ? -1 : 1);
      } else {
        return fail("unexpected character after time");
      }
    }
  }

  if (pos != text.size()) {
    return fail("unexpected trailing content");
  }

  const std::int64_t days =
      detail::DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  const std::int64_t seconds_since_epoch =
      days * 86400 + hour * 3600 + minute * 60 + second - static_cast<std::int64_t>(offset_minutes) * 60;

  timestamp = std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::seconds(seconds_since_epoch) + std::chrono::microseconds(micros)));
  error.clear();
  return true;
}

} // namespace chaosscore::core

#endif // CHAOSSCORE_CORE_TIME_UTILS_HPP_
