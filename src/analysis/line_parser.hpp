#pragma once

#include "analysis/event_stream.hpp"
#include "core/logging/logger.hpp"
#include "metrics/resilience_metrics.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chaosscore::analysis {

// Per-path line counts for one parsing pass. Every line lands in exactly one
// of blank/structured/free_text; malformed_json is a subset of free_text.
struct ParseSummary {
  std::size_t total_lines = 0;
  std::size_t blank_lines = 0;
  std::size_t structured_lines = 0;
  std::size_t free_text_lines = 0;
  std::size_t malformed_json_lines = 0;
};

// Classifies and extracts every line of one log.
//
// Contract:
// - `lines` are copied into `stream.raw_lines` untouched; events carry
//   1-based numbers into that vector.
// - lines are trimmed before matching; blank lines produce nothing.
// - a line whose JSON decodes to an object with `timestamp` takes the
//   structured path, anything else (malformed or non-object JSON included)
//   takes the free-text path.
// - malformed JSON is logged at DEBUG and never aborts the pass.
ParseSummary ParseLogLines(const std::vector<std::string>& lines, EventStream& stream,
                           metrics::ResilienceMetrics& metrics, core::logging::Logger& logger);

// File names of `Tape saved: <path>.tape` announcements, deduplicated in
// first-seen order.
std::vector<std::string> ExtractEvidenceTapes(const std::vector<std::string>& lines);

// Path announced by `Tape saved:<whitespace><path>.tape`, trimmed, running to
// the last `.tape` on the line.
std::optional<std::string> FindSavedTapePath(std::string_view line);

std::string_view TrimWhitespace(std::string_view text);

} // namespace chaosscore::analysis
