#include "analysis/line_parser.hpp"

#include "analysis/record_extractor.hpp"
#include "analysis/text_extractor.hpp"
#include "core/json_dom.hpp"
#include "logs/log_record.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>

namespace chaosscore::analysis {

namespace {

bool IsSpace(const char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

enum class LinePath {
  kStructured,
  kFreeText,
  kMalformedJson,
};

// Only lines that look like a JSON object are handed to the DOM parser.
LinePath DecodeStructured(std::string_view trimmed, const std::size_t line_number,
                          logs::LogRecord& record, std::string& error) {
  if (trimmed.empty() || trimmed.front() != '{') {
    return LinePath::kFreeText;
  }

  core::json::Value root;
  if (!core::json::Parse(trimmed, root, error)) {
    return LinePath::kMalformedJson;
  }
  if (!logs::IsStructuredRecord(root)) {
    return LinePath::kFreeText;
  }
  if (!logs::DecodeLogRecord(root, line_number, record, error)) {
    return LinePath::kMalformedJson;
  }
  return LinePath::kStructured;
}

} // namespace

std::string_view TrimWhitespace(std::string_view text) {
  while (!text.empty() && IsSpace(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && IsSpace(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

ParseSummary ParseLogLines(const std::vector<std::string>& lines, EventStream& stream,
                           metrics::ResilienceMetrics& metrics, core::logging::Logger& logger) {
  ParseSummary summary;
  stream.raw_lines = lines;
  summary.total_lines = lines.size();

  for (std::size_t index = 0; index < lines.size(); ++index) {
    const std::size_t line_number = index + 1U;
    const std::string_view trimmed = TrimWhitespace(lines[index]);
    if (trimmed.empty()) {
      ++summary.blank_lines;
      continue;
    }

    logs::LogRecord record;
    std::string error;
    switch (DecodeStructured(trimmed, line_number, record, error)) {
    case LinePath::kStructured:
      ++summary.structured_lines;
      ExtractRecordEvents(record, stream, metrics);
      break;
    case LinePath::kMalformedJson:
      ++summary.malformed_json_lines;
      logger.Debug("line is not a valid JSON record, using text heuristics",
                   {{"line", std::to_string(line_number)}, {"error", error}});
      [[fallthrough]];
    case LinePath::kFreeText:
      ++summary.free_text_lines;
      ExtractTextEvents(trimmed, line_number, stream, metrics);
      break;
    }
  }

  return summary;
}

std::optional<std::string> FindSavedTapePath(std::string_view line) {
  static constexpr std::string_view kMarker = "Tape saved:";
  static constexpr std::string_view kTapeSuffix = ".tape";

  const std::size_t tape_end = line.rfind(kTapeSuffix);
  if (tape_end == std::string_view::npos) {
    return std::nullopt;
  }
  for (std::size_t marker = line.find(kMarker); marker != std::string_view::npos;
       marker = line.find(kMarker, marker + 1U)) {
    const std::size_t gap = marker + kMarker.size();
    if (gap >= line.size() || !IsSpace(line[gap])) {
      continue;
    }
    // The path needs at least one character before its `.tape` suffix.
    const std::size_t path_begin = gap + 1U;
    if (tape_end <= path_begin) {
      return std::nullopt;
    }
    const std::string_view path =
        TrimWhitespace(line.substr(path_begin, tape_end + kTapeSuffix.size() - path_begin));
    return std::string(path);
  }
  return std::nullopt;
}

std::vector<std::string> ExtractEvidenceTapes(const std::vector<std::string>& lines) {
  std::vector<std::string> tapes;
  for (const std::string& line : lines) {
    const std::optional<std::string> tape_path = FindSavedTapePath(line);
    if (!tape_path.has_value()) {
      continue;
    }
    std::string file_name = std::filesystem::path(tape_path.value()).filename().string();
    if (std::find(tapes.begin(), tapes.end(), file_name) == tapes.end()) {
      tapes.push_back(std::move(file_name));
    }
  }
  return tapes;
}

} // namespace chaosscore::analysis
