#pragma once

#include "analysis/event_stream.hpp"
#include "metrics/resilience_metrics.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace chaosscore::analysis {

// Longest message kept on Error and Crash events, in characters.
inline constexpr std::size_t kMaxEventMessageChars = 200U;

// Applies every free-text rule to one trimmed, non-empty line. Rules are
// independent: one line can yield, for example, both an Error and a Response.
//
// Rules, in evaluation order:
// - "HTTP Tool" + "POST"                       -> ToolCall
// - "Schema-aware fuzzing" / "MCP protocol fuzzing" -> Fuzzing
// - "Error" or case-insensitive "error"        -> Error
// - case-insensitive "retry"                   -> Retry
// - "Agent processing complete" / "Workflow Complete" -> Completion
// - "Exception", "Traceback", case-insensitive "crash" -> Crash
// - "Response:" with 200/400/500 in the line   -> Response
void ExtractTextEvents(std::string_view line, std::size_t line_number, EventStream& stream,
                       metrics::ResilienceMetrics& metrics);

// First timestamp found using, in order: `YYYY-MM-DD[ T]HH:MM:SS`,
// `MM/DD/YYYY HH:MM:SS`, `[HH:MM:SS]` (brackets stripped).
std::optional<std::string> ExtractTimestamp(std::string_view line);

// search_flights / book_ticket / flight_related / unknown.
std::string ClassifyToolUrl(std::string_view url);

// validation_error / not_found / server_error / timeout / network_error / unknown.
std::string ClassifyErrorLine(std::string_view line);

// First of schema_violation, type_mismatch, null_injection, garbage_value; else unknown.
std::string ClassifyFuzzLine(std::string_view line);

// Keeps at most `max_chars` UTF-8 code points.
std::string TruncateUtf8(std::string_view text, std::size_t max_chars);

} // namespace chaosscore::analysis
