#include "analysis/text_extractor.hpp"

#include "logs/log_record.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <regex>
#include <string>
#include <system_error>

namespace chaosscore::analysis {

namespace {

bool Contains(std::string_view text, std::string_view token) {
  return text.find(token) != std::string_view::npos;
}

// `lowered` must already be lowercase; `token` is given in lowercase.
bool ContainsLowered(const std::string& lowered, std::string_view token) {
  return lowered.find(token) != std::string::npos;
}

std::optional<std::string> FirstGroup(std::string_view line, const std::regex& pattern) {
  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_search(line.begin(), line.end(), match, pattern)) {
    return std::nullopt;
  }
  return match[1].str();
}

bool IsSpace(const char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// First `POST<whitespace><url>` in the line; the url runs to the next
// whitespace. Linear in the line length.
std::optional<std::string> FindPostUrl(std::string_view line) {
  static constexpr std::string_view kVerb = "POST";
  for (std::size_t verb = line.find(kVerb); verb != std::string_view::npos;
       verb = line.find(kVerb, verb + 1U)) {
    std::size_t begin = verb + kVerb.size();
    if (begin >= line.size() || !IsSpace(line[begin])) {
      continue;
    }
    while (begin < line.size() && IsSpace(line[begin])) {
      ++begin;
    }
    std::size_t end = begin;
    while (end < line.size() && !IsSpace(line[end])) {
      ++end;
    }
    if (end > begin) {
      return std::string(line.substr(begin, end - begin));
    }
  }
  return std::nullopt;
}

template <typename T>
bool ParseUnsignedDigits(const std::string& digits, T& value) {
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  return ec == std::errc() && ptr == digits.data() + digits.size();
}

void ExtractToolCall(std::string_view line, std::size_t line_number,
                     const std::optional<std::string>& timestamp, EventStream& stream,
                     metrics::ResilienceMetrics& metrics) {
  const std::optional<std::string> url = FindPostUrl(line);
  if (!url.has_value()) {
    return;
  }

  ++metrics.total_tool_calls;
  stream.tool_calls.push_back({
      .line = line_number,
      .url = url.value(),
      .timestamp = timestamp,
      .type = ClassifyToolUrl(url.value()),
  });
  stream.events.push_back({
      .line = line_number,
      .timestamp = timestamp,
      .detail = events::ToolCall{.url = url.value(), .tool_name = ""},
  });
}

void ExtractFuzzing(std::string_view line, std::size_t line_number,
                    const std::optional<std::string>& timestamp, EventStream& stream,
                    metrics::ResilienceMetrics& metrics) {
  static const std::regex kFieldsFuzzed(R"((\d+)\s+fields?\s+fuzzed)");

  ++metrics.fuzzing_attempts;
  const std::string fuzz_type = ClassifyFuzzLine(line);
  metrics.fuzzing_types.Increment(fuzz_type);

  std::uint64_t fields_fuzzed = 0;
  if (const auto digits = FirstGroup(line, kFieldsFuzzed); digits.has_value()) {
    if (!ParseUnsignedDigits(digits.value(), fields_fuzzed)) {
      fields_fuzzed = 0;
    }
  }
  if (fields_fuzzed > 0U) {
    ++metrics.fuzzing_successful;
  }

  stream.events.push_back({
      .line = line_number,
      .timestamp = timestamp,
      .detail = events::Fuzzing{.fuzz_type = fuzz_type, .fields_fuzzed = fields_fuzzed},
  });
}

void ExtractResponse(std::string_view line, std::size_t line_number,
                     const std::optional<std::string>& timestamp, EventStream& stream,
                     metrics::ResilienceMetrics& metrics) {
  static const std::regex kResponseStatus(R"(Response:\s*(\d+))");
  const std::optional<std::string> digits = FirstGroup(line, kResponseStatus);
  if (!digits.has_value()) {
    return;
  }

  std::int64_t status_code = 0;
  if (!ParseUnsignedDigits(digits.value(), status_code)) {
    return;
  }

  if (status_code == 200) {
    ++metrics.successful_tool_calls;
  } else if (status_code >= 400) {
    ++metrics.failed_tool_calls;
  }

  stream.events.push_back({
      .line = line_number,
      .timestamp = timestamp,
      .detail = events::Response{.status_code = status_code},
  });
}

} // namespace

std::optional<std::string> ExtractTimestamp(std::string_view line) {
  static const std::array<std::regex, 3> kPatterns = {
      std::regex(R"((\d{4}-\d{2}-\d{2}[\sT]\d{2}:\d{2}:\d{2}))"),
      std::regex(R"((\d{2}/\d{2}/\d{4}\s\d{2}:\d{2}:\d{2}))"),
      std::regex(R"(\[(\d{2}:\d{2}:\d{2})\])"),
  };

  for (const auto& pattern : kPatterns) {
    if (auto match = FirstGroup(line, pattern); match.has_value()) {
      return match;
    }
  }
  return std::nullopt;
}

std::string ClassifyToolUrl(std::string_view url) {
  const std::string lowered = logs::ToLowerAscii(url);
  if (ContainsLowered(lowered, "search_flights")) {
    return "search_flights";
  }
  if (ContainsLowered(lowered, "book_ticket") || ContainsLowered(lowered, "book")) {
    return "book_ticket";
  }
  if (ContainsLowered(lowered, "flight")) {
    return "flight_related";
  }
  return "unknown";
}

std::string ClassifyErrorLine(std::string_view line) {
  if (Contains(line, "400") || Contains(line, "Bad Request")) {
    return "validation_error";
  }
  if (Contains(line, "404") || Contains(line, "Not Found")) {
    return "not_found";
  }
  if (Contains(line, "500") || Contains(line, "Internal Server Error")) {
    return "server_error";
  }
  const std::string lowered = logs::ToLowerAscii(line);
  if (ContainsLowered(lowered, "timeout")) {
    return "timeout";
  }
  if (ContainsLowered(lowered, "network")) {
    return "network_error";
  }
  return "unknown";
}

std::string ClassifyFuzzLine(std::string_view line) {
  static constexpr std::array<std::string_view, 4> kFuzzTypes = {
      "schema_violation",
      "type_mismatch",
      "null_injection",
      "garbage_value",
  };
  for (const std::string_view fuzz_type : kFuzzTypes) {
    if (Contains(line, fuzz_type)) {
      return std::string(fuzz_type);
    }
  }
  return "unknown";
}

std::string TruncateUtf8(std::string_view text, const std::size_t max_chars) {
  std::size_t chars = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    // Continuation bytes (10xxxxxx) never start a character.
    if ((lead & 0xC0U) != 0x80U) {
      if (chars == max_chars) {
        break;
      }
      ++chars;
    }
    ++pos;
  }
  return std::string(text.substr(0, pos));
}

void ExtractTextEvents(std::string_view line, const std::size_t line_number, EventStream& stream,
                       metrics::ResilienceMetrics& metrics) {
  const std::optional<std::string> timestamp = ExtractTimestamp(line);
  const std::string lowered = logs::ToLowerAscii(line);

  if (Contains(line, "HTTP Tool") && Contains(line, "POST")) {
    ExtractToolCall(line, line_number, timestamp, stream, metrics);
  }

  if (Contains(line, "Schema-aware fuzzing") || Contains(line, "MCP protocol fuzzing")) {
    ExtractFuzzing(line, line_number, timestamp, stream, metrics);
  }

  if (Contains(line, "Error") || ContainsLowered(lowered, "error")) {
    const std::string error_type = ClassifyErrorLine(line);
    metrics::RecordToolCallFailure(metrics, error_type);
    stream.events.push_back({
        .line = line_number,
        .timestamp = timestamp,
        .detail = events::Error{.error_type = error_type,
                                .message = TruncateUtf8(line, kMaxEventMessageChars)},
    });
  }

  if (ContainsLowered(lowered, "retry")) {
    ++metrics.retry_attempts;
    stream.events.push_back({.line = line_number, .timestamp = timestamp, .detail = events::Retry{}});
  }

  if (Contains(line, "Agent processing complete") || Contains(line, "Workflow Complete")) {
    ++metrics.agent_successful_completion;
    stream.events.push_back(
        {.line = line_number, .timestamp = timestamp, .detail = events::Completion{}});
  }

  if (Contains(line, "Exception") || Contains(line, "Traceback") ||
      ContainsLowered(lowered, "crash")) {
    ++metrics.agent_crashes;
    stream.events.push_back({
        .line = line_number,
        .timestamp = timestamp,
        .detail = events::Crash{.message = TruncateUtf8(line, kMaxEventMessageChars)},
    });
  }

  if (Contains(line, "Response:") &&
      (Contains(line, "200") || Contains(line, "400") || Contains(line, "500"))) {
    ExtractResponse(line, line_number, timestamp, stream, metrics);
  }
}

} // namespace chaosscore::analysis
