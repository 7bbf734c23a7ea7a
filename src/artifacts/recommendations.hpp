#pragma once

#include "metrics/resilience_metrics.hpp"

#include <string>
#include <vector>

namespace chaosscore::artifacts {

// Rule-based recommendations derived only from metric thresholds.
//
// Rules fire in this order and all matching rules are kept:
// 1) grade D or F
// 2) tool call success rate < 70
// 3) system recovery rate < 50
// 4) any crash
// 5) fuzzing success rate < 50 with at least one attempt
// 6) failures without any retry attempt
// 7) race conditions (two fixed critical items)
// A single affirmative item is returned when no rule fired. The empty
// scorecard runs the same rules over zeroed metrics and grade N/A.
std::vector<std::string> BuildRecommendations(const metrics::ResilienceMetrics& metrics,
                                              const std::string& grade);

} // namespace chaosscore::artifacts
