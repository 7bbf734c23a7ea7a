#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace chaosscore::events {

// Normalized event categories reconstructed from proxy log lines. Keep this
// enum compact and stable because report consumers key off the string form.
enum class EventType {
  kToolCall,
  kFuzzing,
  kError,
  kRetry,
  kCompletion,
  kCrash,
  kResponse,
  kAgentToAgent,
};

struct ToolCall {
  std::string url;
  // Explicit or URL-inferred tool name; empty for free-text lines.
  std::string tool_name;
};

struct Fuzzing {
  std::string fuzz_type;
  std::uint64_t fields_fuzzed = 0;
};

struct Error {
  std::string error_type;
  std::string message;
};

struct Retry {};

struct Completion {};

struct Crash {
  std::string message;
};

struct Response {
  std::int64_t status_code = 0;
};

struct AgentToAgent {
  std::optional<std::string> subtype;
};

using EventDetail =
    std::variant<ToolCall, Fuzzing, Error, Retry, Completion, Crash, Response, AgentToAgent>;

// One event reconstructed from a log line.
//
// - `line`: 1-based source line number (blank lines are counted).
// - `timestamp`: raw timestamp text when the line carried one.
// - `detail`: kind-specific fields.
struct Event {
  std::size_t line = 0;
  std::optional<std::string> timestamp;
  EventDetail detail;
};

EventType TypeOf(const Event& event);

// JSON serializers used by the report writer and tests.
std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace chaosscore::events
