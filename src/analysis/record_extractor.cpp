#include "analysis/record_extractor.hpp"

#include <optional>

namespace chaosscore::analysis {

namespace {

bool Contains(std::string_view text, std::string_view token) {
  return text.find(token) != std::string_view::npos;
}

bool IsFailureStatus(std::int64_t status_code) {
  return status_code >= 400;
}

void ExtractSwarmSignals(const logs::LogRecord& record, const std::string& chaos_text,
                         EventStream& stream, metrics::ResilienceMetrics& metrics) {
  ++metrics.agent_to_agent_disruptions;
  stream.events.push_back({
      .line = record.line,
      .timestamp = record.timestamp,
      .detail = events::AgentToAgent{.subtype = record.traffic_subtype},
  });

  if (record.traffic_subtype.has_value() && !record.traffic_subtype->empty()) {
    metrics.swarm_communication_errors.Increment("swarm_" + record.traffic_subtype.value());
  }

  if (Contains(chaos_text, "swarm_disruption") || Contains(chaos_text, "message_mutation")) {
    ++metrics.message_mutations;
  }
  if (Contains(chaos_text, "consensus_delay")) {
    ++metrics.consensus_delays;
  }
  if (Contains(chaos_text, "agent_isolation")) {
    ++metrics.agent_isolations;
  }

  if (record.status_code.has_value() && IsFailureStatus(record.status_code.value())) {
    metrics.swarm_communication_errors.Increment("swarm_error_" +
                                                 std::to_string(record.status_code.value()));
  }
}

} // namespace

std::string ClassifyStatusCode(const std::int64_t status_code) {
  if (status_code == 400) {
    return "validation_error";
  }
  if (status_code == 404) {
    return "not_found";
  }
  if (status_code >= 500) {
    return "server_error";
  }
  return "unknown";
}

std::string ClassifyChaosFuzzType(std::string_view chaos_text) {
  if (Contains(chaos_text, "schema_violation")) {
    return "schema_violation";
  }
  if (Contains(chaos_text, "type_mismatch")) {
    return "type_mismatch";
  }
  if (Contains(chaos_text, "null")) {
    return "null_injection";
  }
  if (Contains(chaos_text, "garbage")) {
    return "garbage_value";
  }
  return "unknown";
}

void ExtractRecordEvents(const logs::LogRecord& record, EventStream& stream,
                         metrics::ResilienceMetrics& metrics) {
  stream.records.push_back(record);

  const std::optional<std::string> tool_name = logs::ResolveToolName(record);
  if (tool_name.has_value() && record.method == "POST") {
    ++metrics.total_tool_calls;
    stream.tool_calls.push_back({
        .line = record.line,
        .url = record.url,
        .timestamp = record.timestamp,
        .type = tool_name.value(),
    });
    stream.events.push_back({
        .line = record.line,
        .timestamp = record.timestamp,
        .detail = events::ToolCall{.url = record.url, .tool_name = tool_name.value()},
    });
  }

  if (record.status_code.has_value()) {
    const std::int64_t status_code = record.status_code.value();
    stream.events.push_back({
        .line = record.line,
        .timestamp = record.timestamp,
        .detail = events::Response{.status_code = status_code},
    });

    if (status_code == 200) {
      ++metrics.successful_tool_calls;
    } else if (IsFailureStatus(status_code)) {
      metrics::RecordToolCallFailure(metrics, ClassifyStatusCode(status_code));
    }
  }

  const std::string chaos_text = record.ChaosSearchText();
  if (!record.chaos_applied.empty()) {
    ++metrics.chaos_injections;
  }

  if (record.fuzzed || Contains(chaos_text, "fuzzing") || Contains(chaos_text, "mcp")) {
    ++metrics.fuzzing_attempts;
    const std::string fuzz_type = ClassifyChaosFuzzType(chaos_text);
    metrics.fuzzing_types.Increment(fuzz_type);

    // Structured records only say whether a payload was fuzzed, not how many
    // fields, so the count is 0 or 1.
    const std::uint64_t fields_fuzzed = record.fuzzed ? 1U : 0U;
    if (fields_fuzzed > 0U) {
      ++metrics.fuzzing_successful;
    }
    stream.events.push_back({
        .line = record.line,
        .timestamp = record.timestamp,
        .detail = events::Fuzzing{.fuzz_type = fuzz_type, .fields_fuzzed = fields_fuzzed},
    });
  }

  if (record.traffic_type == kAgentToAgentTraffic) {
    ExtractSwarmSignals(record, chaos_text, stream, metrics);
  }
}

} // namespace chaosscore::analysis
