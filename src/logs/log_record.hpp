#pragma once

#include "core/json_dom.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chaosscore::logs {

// Typed view of one structured proxy log line.
//
// `chaos_applied` is normalized at decode time: the proxy writes either one
// string or an ordered list of strings, and both become an ordered list here.
struct LogRecord {
  std::size_t line = 0;
  std::optional<std::string> timestamp;
  std::string method;
  std::string url;
  std::optional<std::int64_t> status_code;
  std::optional<std::string> tool_name;
  std::vector<std::string> chaos_applied;
  bool fuzzed = false;
  std::optional<std::string> agent_role;
  std::string traffic_type = "UNKNOWN";
  std::optional<std::string> traffic_subtype;

  // Lowercased, comma-joined `chaos_applied`, used for substring matching.
  std::string ChaosSearchText() const;
};

// A decoded JSON value is a structured record iff it is an object carrying a
// `timestamp` key. The key's value type is not inspected.
bool IsStructuredRecord(const core::json::Value& root);

// Decodes `root` into `record`.
//
// Contract:
// - returns false with `error` populated when `root` is not a structured record.
// - fields of an unexpected JSON type are treated as absent.
// - non-string entries in a `chaos_applied` list are dropped.
bool DecodeLogRecord(const core::json::Value& root, std::size_t line, LogRecord& record,
                     std::string& error);

// Tool name from the explicit `tool_name` field, otherwise inferred from the
// URL path (`/search_flights`, `/book_ticket` or `/book`, `/api/` or `/v1/chat`).
std::optional<std::string> ResolveToolName(const LogRecord& record);

std::string ToLowerAscii(std::string_view text);

} // namespace chaosscore::logs
