#include "events/event_model.hpp"

#include "core/json_utils.hpp"

#include <sstream>
#include <type_traits>

namespace chaosscore::events {

namespace {

// Per-kind trailing fields, written after the shared type/line/timestamp keys.
struct DetailWriter {
  std::ostringstream& out;

  void operator()(const ToolCall& detail) const {
    out << ",\"url\":" << core::QuoteJson(detail.url);
    if (!detail.tool_name.empty()) {
      out << ",\"tool_name\":" << core::QuoteJson(detail.tool_name);
    }
  }
  void operator()(const Fuzzing& detail) const {
    out << ",\"fuzz_type\":" << core::QuoteJson(detail.fuzz_type)
        << ",\"fields_fuzzed\":" << detail.fields_fuzzed;
  }
  void operator()(const Error& detail) const {
    out << ",\"error_type\":" << core::QuoteJson(detail.error_type)
        << ",\"message\":" << core::QuoteJson(detail.message);
  }
  void operator()(const Retry&) const {}
  void operator()(const Completion&) const {}
  void operator()(const Crash& detail) const {
    out << ",\"message\":" << core::QuoteJson(detail.message);
  }
  void operator()(const Response& detail) const {
    out << ",\"status_code\":" << detail.status_code;
  }
  void operator()(const AgentToAgent& detail) const {
    out << ",\"subtype\":";
    if (detail.subtype.has_value()) {
      out << core::QuoteJson(detail.subtype.value());
    } else {
      out << "null";
    }
  }
};

} // namespace

EventType TypeOf(const Event& event) {
  return std::visit(
      [](const auto& detail) -> EventType {
        using T = std::decay_t<decltype(detail)>;
        if constexpr (std::is_same_v<T, ToolCall>) {
          return EventType::kToolCall;
        } else if constexpr (std::is_same_v<T, Fuzzing>) {
          return EventType::kFuzzing;
        } else if constexpr (std::is_same_v<T, Error>) {
          return EventType::kError;
        } else if constexpr (std::is_same_v<T, Retry>) {
          return EventType::kRetry;
        } else if constexpr (std::is_same_v<T, Completion>) {
          return EventType::kCompletion;
        } else if constexpr (std::is_same_v<T, Crash>) {
          return EventType::kCrash;
        } else if constexpr (std::is_same_v<T, Response>) {
          return EventType::kResponse;
        } else {
          return EventType::kAgentToAgent;
        }
      },
      event.detail);
}

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kToolCall:
    return "tool_call";
  case EventType::kFuzzing:
    return "fuzzing";
  case EventType::kError:
    return "error";
  case EventType::kRetry:
    return "retry";
  case EventType::kCompletion:
    return "completion";
  case EventType::kCrash:
    return "crash";
  case EventType::kResponse:
    return "response";
  case EventType::kAgentToAgent:
    return "agent_to_agent";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"type\":\"" << ToJson(TypeOf(event)) << "\","
      << "\"line\":" << event.line << ","
      << "\"timestamp\":";
  if (event.timestamp.has_value()) {
    out << core::QuoteJson(event.timestamp.value());
  } else {
    out << "null";
  }

  std::visit(DetailWriter{out}, event.detail);

  out << "}";
  return out.str();
}

} // namespace chaosscore::events
