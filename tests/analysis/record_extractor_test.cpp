#include "analysis/record_extractor.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <variant>

namespace analysis = chaosscore::analysis;
namespace events = chaosscore::events;
namespace logs = chaosscore::logs;
namespace metrics = chaosscore::metrics;

namespace {

logs::LogRecord MakeRecord(std::string url, std::optional<std::int64_t> status_code) {
  logs::LogRecord record;
  record.line = 1;
  record.timestamp = "2024-05-01T10:00:00Z";
  record.method = "POST";
  record.url = std::move(url);
  record.status_code = status_code;
  return record;
}

} // namespace

TEST_CASE("Structured POST with a tool name yields tool call then response",
          "[analysis][record]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;
  analysis::ExtractRecordEvents(MakeRecord("http://mock/search_flights", 200), stream, m);

  REQUIRE(m.total_tool_calls == 1U);
  REQUIRE(m.successful_tool_calls == 1U);
  REQUIRE(stream.records.size() == 1U);
  REQUIRE(stream.tool_calls[0].type == "search_flights");
  REQUIRE(stream.events.size() == 2U);
  REQUIRE(events::TypeOf(stream.events[0]) == events::EventType::kToolCall);
  REQUIRE(events::TypeOf(stream.events[1]) == events::EventType::kResponse);
}

TEST_CASE("Failing structured statuses are tallied by code", "[analysis][record]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;
  analysis::ExtractRecordEvents(MakeRecord("http://mock/book_ticket", 400), stream, m);
  analysis::ExtractRecordEvents(MakeRecord("http://mock/book_ticket", 404), stream, m);
  analysis::ExtractRecordEvents(MakeRecord("http://mock/book_ticket", 503), stream, m);
  analysis::ExtractRecordEvents(MakeRecord("http://mock/book_ticket", 418), stream, m);
  analysis::ExtractRecordEvents(MakeRecord("http://mock/book_ticket", 302), stream, m);

  REQUIRE(m.failed_tool_calls == 4U);
  REQUIRE(m.tool_call_errors.Count("validation_error") == 1U);
  REQUIRE(m.tool_call_errors.Count("not_found") == 1U);
  REQUIRE(m.tool_call_errors.Count("server_error") == 1U);
  REQUIRE(m.tool_call_errors.Count("unknown") == 1U);
  REQUIRE(m.successful_tool_calls == 0U);
}

TEST_CASE("GET requests and unknown tools are not tool calls", "[analysis][record]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;
  logs::LogRecord get = MakeRecord("http://mock/search_flights", 200);
  get.method = "GET";
  analysis::ExtractRecordEvents(get, stream, m);
  analysis::ExtractRecordEvents(MakeRecord("http://mock/health", std::nullopt), stream, m);

  REQUIRE(m.total_tool_calls == 0U);
  REQUIRE(m.successful_tool_calls == 1U);
  REQUIRE(stream.events.size() == 1U);
  REQUIRE(stream.records.size() == 2U);
}

TEST_CASE("Chaos annotations drive fuzzing and injection counters", "[analysis][record]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;

  logs::LogRecord fuzzed = MakeRecord("http://mock/v1/chat", 200);
  fuzzed.fuzzed = true;
  fuzzed.chaos_applied = {"MCP_Null_Fields"};
  analysis::ExtractRecordEvents(fuzzed, stream, m);

  logs::LogRecord not_fuzzed = MakeRecord("http://mock/v1/chat", 200);
  not_fuzzed.chaos_applied = {"latency", "fuzzing:garbage"};
  analysis::ExtractRecordEvents(not_fuzzed, stream, m);

  REQUIRE(m.chaos_injections == 2U);
  REQUIRE(m.fuzzing_attempts == 2U);
  REQUIRE(m.fuzzing_successful == 1U);
  REQUIRE(m.fuzzing_types.Count("null_injection") == 1U);
  REQUIRE(m.fuzzing_types.Count("garbage_value") == 1U);
  REQUIRE(stream.tool_calls[0].type == "llm_request");
}

TEST_CASE("Agent-to-agent traffic feeds swarm counters", "[analysis][record]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;
  logs::LogRecord record = MakeRecord("http://agent-b/message", 503);
  record.traffic_type = "AGENT_TO_AGENT";
  record.traffic_subtype = "handoff";
  record.chaos_applied = {"swarm_disruption", "consensus_delay", "agent_isolation"};
  analysis::ExtractRecordEvents(record, stream, m);

  REQUIRE(m.agent_to_agent_disruptions == 1U);
  REQUIRE(m.message_mutations == 1U);
  REQUIRE(m.consensus_delays == 1U);
  REQUIRE(m.agent_isolations == 1U);
  REQUIRE(m.swarm_communication_errors.Count("swarm_handoff") == 1U);
  REQUIRE(m.swarm_communication_errors.Count("swarm_error_503") == 1U);
  REQUIRE(events::TypeOf(stream.events.back()) == events::EventType::kAgentToAgent);
  REQUIRE(std::get<events::AgentToAgent>(stream.events.back().detail).subtype ==
          std::optional<std::string>("handoff"));
}

TEST_CASE("Empty traffic subtype is not tallied as a swarm error", "[analysis][record]") {
  analysis::EventStream stream;
  metrics::ResilienceMetrics m;
  logs::LogRecord record = MakeRecord("http://agent-b/message", 200);
  record.traffic_type = "AGENT_TO_AGENT";
  record.traffic_subtype = "";
  analysis::ExtractRecordEvents(record, stream, m);

  REQUIRE(m.agent_to_agent_disruptions == 1U);
  REQUIRE(m.swarm_communication_errors.Empty());
  REQUIRE(m.swarm_communication_errors.Count("swarm_") == 0U);
}

TEST_CASE("Chaos fuzz kinds follow fixed precedence", "[analysis][record]") {
  REQUIRE(analysis::ClassifyChaosFuzzType("mcp,schema_violation,null") == "schema_violation");
  REQUIRE(analysis::ClassifyChaosFuzzType("type_mismatch,null") == "type_mismatch");
  REQUIRE(analysis::ClassifyChaosFuzzType("mcp_null") == "null_injection");
  REQUIRE(analysis::ClassifyChaosFuzzType("garbage") == "garbage_value");
  REQUIRE(analysis::ClassifyChaosFuzzType("fuzzing") == "unknown");
}
