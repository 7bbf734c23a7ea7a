#pragma once

#include "analysis/event_stream.hpp"
#include "logs/log_record.hpp"
#include "metrics/resilience_metrics.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace chaosscore::analysis {

inline constexpr std::string_view kAgentToAgentTraffic = "AGENT_TO_AGENT";

// Extracts events and counter updates from one decoded structured record.
//
// Emission order per record: ToolCall (POST with a resolved tool name),
// Response (status present), Fuzzing, AgentToAgent. The record itself is
// appended to `stream.records` for the race detector.
void ExtractRecordEvents(const logs::LogRecord& record, EventStream& stream,
                         metrics::ResilienceMetrics& metrics);

// 400 -> validation_error, 404 -> not_found, >=500 -> server_error, else unknown.
std::string ClassifyStatusCode(std::int64_t status_code);

// Fuzz kind from normalized chaos text: schema_violation, type_mismatch,
// null -> null_injection, garbage -> garbage_value, else unknown.
std::string ClassifyChaosFuzzType(std::string_view chaos_text);

} // namespace chaosscore::analysis
