#include "analysis/text_extractor.hpp"

#include <catch2/catch.hpp>

#include <optional>
#include <string>
#include <variant>

namespace analysis = chaosscore::analysis;
namespace events = chaosscore::events;
namespace metrics = chaosscore::metrics;

TEST_CASE("HTTP tool lines produce classified tool calls", "[analysis][text]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;
  analysis::ExtractTextEvents("2024-05-01 10:00:00 HTTP Tool POST http://mock/Book_Ticket?id=1",
                              4, stream, m);

  REQUIRE(m.total_tool_calls == 1U);
  REQUIRE(stream.tool_calls.size() == 1U);
  REQUIRE(stream.tool_calls[0].type == "book_ticket");
  REQUIRE(stream.tool_calls[0].line == 4U);
  REQUIRE(stream.tool_calls[0].timestamp == std::optional<std::string>("2024-05-01 10:00:00"));
  REQUIRE(stream.events.size() == 1U);
  REQUIRE(std::get<events::ToolCall>(stream.events[0].detail).url ==
          "http://mock/Book_Ticket?id=1");
}

TEST_CASE("HTTP tool line without a POST target emits nothing", "[analysis][text]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;
  analysis::ExtractTextEvents("HTTP Tool POST", 1, stream, m);
  REQUIRE(m.total_tool_calls == 0U);
  REQUIRE(stream.events.empty());
}

TEST_CASE("POST target is the first whitespace-delimited token after the verb",
          "[analysis][text]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;
  analysis::ExtractTextEvents("HTTP Tool POSTED then POST \t http://mock/search_flights next", 2,
                              stream, m);
  REQUIRE(m.total_tool_calls == 1U);
  REQUIRE(stream.tool_calls.size() == 1U);
  REQUIRE(stream.tool_calls[0].url == "http://mock/search_flights");
  REQUIRE(stream.tool_calls[0].type == "search_flights");
}

TEST_CASE("Very long POST lines are extracted in full", "[analysis][text]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;
  const std::string url = "http://mock/flight?q=" + std::string(200000, 'x');
  analysis::ExtractTextEvents("[HTTP Tool] POST " + url, 1, stream, m);
  REQUIRE(m.total_tool_calls == 1U);
  REQUIRE(stream.tool_calls[0].url == url);
  REQUIRE(stream.tool_calls[0].type == "flight_related");
}

TEST_CASE("URL classification follows fixed precedence", "[analysis][text]") {
  REQUIRE(analysis::ClassifyToolUrl("/api/SEARCH_FLIGHTS") == "search_flights");
  REQUIRE(analysis::ClassifyToolUrl("/booking") == "book_ticket");
  REQUIRE(analysis::ClassifyToolUrl("/flight/status") == "flight_related");
  REQUIRE(analysis::ClassifyToolUrl("/weather") == "unknown");
}

TEST_CASE("One line can fire several rules", "[analysis][text]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;
  analysis::ExtractTextEvents("[12:00:01] Error during retry, Response: 500 Internal Server Error",
                              2, stream, m);

  REQUIRE(stream.events.size() == 3U);
  REQUIRE(events::TypeOf(stream.events[0]) == events::EventType::kError);
  REQUIRE(events::TypeOf(stream.events[1]) == events::EventType::kRetry);
  REQUIRE(events::TypeOf(stream.events[2]) == events::EventType::kResponse);
  REQUIRE(stream.events[0].timestamp == std::optional<std::string>("12:00:01"));

  // Error tally plus the >=400 response both count as failures.
  REQUIRE(m.failed_tool_calls == 2U);
  REQUIRE(m.tool_call_errors.Count("server_error") == 1U);
  REQUIRE(m.retry_attempts == 1U);
  REQUIRE(std::get<events::Response>(stream.events[2].detail).status_code == 500);
}

TEST_CASE("Error lines are classified by marker", "[analysis][text]") {
  REQUIRE(analysis::ClassifyErrorLine("Error: 400 Bad Request") == "validation_error");
  REQUIRE(analysis::ClassifyErrorLine("Error: Not Found") == "not_found");
  REQUIRE(analysis::ClassifyErrorLine("error 500") == "server_error");
  REQUIRE(analysis::ClassifyErrorLine("ERROR request TIMEOUT") == "timeout");
  REQUIRE(analysis::ClassifyErrorLine("error: Network unreachable") == "network_error");
  REQUIRE(analysis::ClassifyErrorLine("error: something else") == "unknown");
}

TEST_CASE("Fuzzing lines record kind and field count", "[analysis][text]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;
  analysis::ExtractTextEvents("Schema-aware fuzzing applied type_mismatch: 3 fields fuzzed", 1,
                              stream, m);
  analysis::ExtractTextEvents("MCP protocol fuzzing: 0 fields fuzzed", 2, stream, m);

  REQUIRE(m.fuzzing_attempts == 2U);
  REQUIRE(m.fuzzing_successful == 1U);
  REQUIRE(m.fuzzing_types.Count("type_mismatch") == 1U);
  REQUIRE(m.fuzzing_types.Count("unknown") == 1U);
  REQUIRE(std::get<events::Fuzzing>(stream.events[0].detail).fields_fuzzed == 3U);
}

TEST_CASE("Crash and completion markers are counted", "[analysis][text]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;
  analysis::ExtractTextEvents("Traceback (most recent call last):", 1, stream, m);
  analysis::ExtractTextEvents("Agent processing complete", 2, stream, m);
  analysis::ExtractTextEvents("Workflow Complete", 3, stream, m);

  REQUIRE(m.agent_crashes == 1U);
  REQUIRE(m.agent_successful_completion == 2U);
}

TEST_CASE("Response requires a known status token in the line", "[analysis][text]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;
  analysis::ExtractTextEvents("Response: 302 redirect", 1, stream, m);
  REQUIRE(stream.events.empty());

  analysis::ExtractTextEvents("Response: 200 OK", 2, stream, m);
  REQUIRE(m.successful_tool_calls == 1U);
}

TEST_CASE("Timestamp extraction uses the first matching pattern", "[analysis][text]") {
  REQUIRE(analysis::ExtractTimestamp("at 2024-05-01T10:00:00 and [11:00:00]") ==
          std::optional<std::string>("2024-05-01T10:00:00"));
  REQUIRE(analysis::ExtractTimestamp("05/01/2024 10:00:00 go") ==
          std::optional<std::string>("05/01/2024 10:00:00"));
  REQUIRE(analysis::ExtractTimestamp("[09:15:00] ready") == std::optional<std::string>("09:15:00"));
  REQUIRE_FALSE(analysis::ExtractTimestamp("no time here").has_value());
}

TEST_CASE("Messages are truncated on code point boundaries", "[analysis][text]") {
  const std::string text = std::string(199, 'a') + "\xC3\xA9" + "tail";
  const std::string truncated = analysis::TruncateUtf8(text, analysis::kMaxEventMessageChars);
  REQUIRE(truncated == std::string(199, 'a') + "\xC3\xA9");
  REQUIRE(analysis::TruncateUtf8("short", 200U) == "short");
}
