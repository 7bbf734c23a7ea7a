#include "logs/log_record.hpp"

#include <algorithm>
#include <cctype>

namespace chaosscore::logs {

std::string ToLowerAscii(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

std::string LogRecord::ChaosSearchText() const {
  std::string joined;
  for (std::size_t i = 0; i < chaos_applied.size(); ++i) {
    if (i != 0U) {
      joined.push_back(',');
    }
    joined += chaos_applied[i];
  }
  return ToLowerAscii(joined);
}

bool IsStructuredRecord(const core::json::Value& root) {
  return root.IsObject() && core::json::HasMember(root, "timestamp");
}

bool DecodeLogRecord(const core::json::Value& root, const std::size_t line, LogRecord& record,
                     std::string& error) {
  if (!IsStructuredRecord(root)) {
    error = "line " + std::to_string(line) + " is not a structured record (object with timestamp)";
    return false;
  }

  namespace json = core::json;

  record = LogRecord{};
  record.line = line;
  record.timestamp = json::GetString(root, "timestamp");
  record.method = json::GetString(root, "method").value_or("");
  record.url = json::GetString(root, "url").value_or("");
  record.status_code = json::GetInteger(root, "status_code");
  record.tool_name = json::GetString(root, "tool_name");
  record.fuzzed = json::GetBool(root, "fuzzed").value_or(false);
  record.agent_role = json::GetString(root, "agent_role");
  record.traffic_type = json::GetString(root, "traffic_type").value_or("UNKNOWN");
  record.traffic_subtype = json::GetString(root, "traffic_subtype");

  if (const json::Value* chaos = json::FindMember(root, "chaos_applied"); chaos != nullptr) {
    if (chaos->IsString()) {
      if (!chaos->string_value.empty()) {
        record.chaos_applied.push_back(chaos->string_value);
      }
    } else if (chaos->IsArray()) {
      for (const auto& item : chaos->array_value) {
        if (item.IsString()) {
          record.chaos_applied.push_back(item.string_value);
        }
      }
    }
  }

  error.clear();
  return true;
}

std::optional<std::string> ResolveToolName(const LogRecord& record) {
  if (record.tool_name.has_value() && !record.tool_name->empty()) {
    return record.tool_name;
  }
  if (record.url.empty()) {
    return std::nullopt;
  }

  const std::string url = ToLowerAscii(record.url);
  if (url.find("/search_flights") != std::string::npos) {
    return std::string("search_flights");
  }
  if (url.find("/book_ticket") != std::string::npos || url.find("/book") != std::string::npos) {
    return std::string("book_ticket");
  }
  if (url.find("/api/") != std::string::npos || url.find("/v1/chat") != std::string::npos) {
    return std::string("llm_request");
  }
  return std::nullopt;
}

} // namespace chaosscore::logs
