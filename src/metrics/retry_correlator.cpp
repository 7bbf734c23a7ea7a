#include "metrics/retry_correlator.hpp"

#include <algorithm>
#include <string_view>
#include <variant>

namespace chaosscore::metrics {

namespace {

constexpr std::string_view kSuccessMarker = "Response: 200";

bool WindowHasSuccess(const std::vector<std::string>& raw_lines, const std::size_t retry_line,
                      const std::size_t window_lines) {
  const std::size_t window_end = std::min(retry_line + window_lines, raw_lines.size());
  for (std::size_t line_number = retry_line; line_number < window_end; ++line_number) {
    if (line_number == 0U) {
      continue;
    }
    if (raw_lines[line_number - 1U].find(kSuccessMarker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

void CorrelateRetries(const std::vector<events::Event>& events,
                      const std::vector<std::string>& raw_lines, ResilienceMetrics& metrics,
                      const std::size_t window_lines) {
  for (const events::Event& event : events) {
    if (!std::holds_alternative<events::Retry>(event.detail)) {
      continue;
    }
    if (WindowHasSuccess(raw_lines, event.line, window_lines)) {
      ++metrics.successful_retries;
    }
  }
}

} // namespace chaosscore::metrics
