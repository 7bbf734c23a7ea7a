#pragma once

#include "events/event_model.hpp"
#include "logs/log_record.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace chaosscore::analysis {

// One tool invocation as listed in the report's `tool_calls` section.
// `type` is the URL classification for free-text lines and the resolved tool
// name for structured records.
struct ToolCallRecord {
  std::size_t line = 0;
  std::string url;
  std::optional<std::string> timestamp;
  std::string type;
};

// Output of the line-parsing pass, consumed by the correlation stages.
//
// `raw_lines` keeps every line of the file (blank ones included) so windowed
// lookback can index by the 1-based line numbers carried on events.
struct EventStream {
  std::vector<std::string> raw_lines;
  std::vector<events::Event> events;
  std::vector<ToolCallRecord> tool_calls;
  std::vector<logs::LogRecord> records;
};

} // namespace chaosscore::analysis
