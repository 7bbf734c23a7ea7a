#pragma once

#include "events/event_model.hpp"
#include "metrics/resilience_metrics.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace chaosscore::metrics {

inline constexpr std::size_t kDefaultRetryWindowLines = 10U;

// Counts retries that were followed by a successful response.
//
// Contract:
// - for a Retry event on 1-based line N, raw lines N through
//   min(N + window_lines, raw_lines.size()) - 1 are scanned in order.
// - the window therefore includes the retry line itself and never includes
//   the final line of the file.
// - the first line containing `Response: 200` increments
//   `successful_retries` once; later matches in the same window are ignored.
// - overlapping windows are evaluated independently, so one success line can
//   credit several retries.
void CorrelateRetries(const std::vector<events::Event>& events,
                      const std::vector<std::string>& raw_lines, ResilienceMetrics& metrics,
                      std::size_t window_lines = kDefaultRetryWindowLines);

} // namespace chaosscore::metrics
