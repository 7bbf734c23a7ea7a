#include "core/time_utils.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <string>

namespace core = chaosscore::core;

namespace {

std::chrono::system_clock::time_point ParseOrFail(const std::string& text) {
  std::chrono::system_clock::time_point parsed{};
  std::string error;
  REQUIRE(core::ParseIso8601Timestamp(text, parsed, error));
  return parsed;
}

} // namespace

TEST_CASE("Naive ISO-8601 timestamps are interpreted as UTC", "[core][time]") {
  REQUIRE(ParseOrFail("1970-01-01T00:00:02") ==
          std::chrono::system_clock::time_point(std::chrono::seconds(2)));
  REQUIRE(ParseOrFail("1970-01-01 00:00:02Z") ==
          std::chrono::system_clock::time_point(std::chrono::seconds(2)));
}

TEST_CASE("Offsets and fractional seconds are honored", "[core][time]") {
  const auto utc = ParseOrFail("2024-05-01T10:00:00Z");
  REQUIRE(ParseOrFail("2024-05-01T12:00:00+02:00") == utc);
  REQUIRE(ParseOrFail("2024-05-01T05:30:00-0430") == utc);
  REQUIRE(ParseOrFail("2024-05-01T10:00:00.250Z") - utc == std::chrono::milliseconds(250));
}

TEST_CASE("Invalid timestamps are rejected with a reason", "[core][time]") {
  std::chrono::system_clock::time_point parsed{};
  std::string error;
  REQUIRE_FALSE(core::ParseIso8601Timestamp("10:00:00", parsed, error));
  REQUIRE_FALSE(error.empty());
  REQUIRE_FALSE(core::ParseIso8601Timestamp("2024-02-30T10:00:00", parsed, error));
  REQUIRE_FALSE(core::ParseIso8601Timestamp("2024-05-01T10:00:00 trailing", parsed, error));
}

TEST_CASE("UTC timestamps format with millisecond precision", "[core][time]") {
  REQUIRE(core::FormatUtcTimestamp(std::chrono::system_clock::time_point(
              std::chrono::milliseconds(2'000))) == "1970-01-01T00:00:02.000Z");
}
