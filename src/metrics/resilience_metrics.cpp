#include "metrics/resilience_metrics.hpp"

namespace chaosscore::metrics {

void Tally::Increment(const std::string& key, const std::uint64_t amount) {
  counts_[key] += amount;
}

std::uint64_t Tally::Count(std::string_view key) const {
  const auto it = counts_.find(key);
  if (it == counts_.end()) {
    return 0U;
  }
  return it->second;
}

void RecordToolCallFailure(ResilienceMetrics& metrics, const std::string& error_type) {
  metrics.tool_call_errors.Increment(error_type);
  ++metrics.failed_tool_calls;
}

} // namespace chaosscore::metrics
