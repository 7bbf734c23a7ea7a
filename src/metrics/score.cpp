#include "metrics/score.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace chaosscore::metrics {

namespace {

double Percent(const std::uint64_t numerator, const std::uint64_t denominator) {
  if (denominator == 0U) {
    return 0.0;
  }
  return static_cast<double>(numerator) / static_cast<double>(denominator) * 100.0;
}

} // namespace

double RoundToHundredths(const double value) {
  return std::round(value * 100.0) / 100.0;
}

double ComputeCompletionScore(const ResilienceMetrics& metrics) {
  if (metrics.agent_crashes == 0U) {
    return 100.0;
  }
  return Percent(metrics.agent_successful_completion,
                 metrics.agent_successful_completion + metrics.agent_crashes);
}

double ComputeResilienceScore(const ResilienceMetrics& metrics) {
  const double success = std::min(metrics.tool_call_success_rate, 100.0);
  const double recovery = std::min(metrics.system_recovery_rate, 100.0);
  const double completion = ComputeCompletionScore(metrics);
  return RoundToHundredths(kSuccessWeight * success + kRecoveryWeight * recovery +
                           kCompletionWeight * completion);
}

void ComputeDerivedRates(ResilienceMetrics& metrics) {
  metrics.tool_call_success_rate =
      Percent(metrics.successful_tool_calls, metrics.total_tool_calls);
  metrics.fuzzing_success_rate = Percent(metrics.fuzzing_successful, metrics.fuzzing_attempts);
  metrics.retry_success_rate = Percent(metrics.successful_retries, metrics.retry_attempts);

  if (metrics.failed_tool_calls == 0U) {
    metrics.system_recovery_rate = 100.0;
  } else {
    metrics.system_recovery_rate =
        Percent(metrics.successful_retries + metrics.agent_successful_completion,
                metrics.failed_tool_calls);
  }

  metrics.resilience_score = ComputeResilienceScore(metrics);
}

std::string GradeForScore(const double score) {
  if (score >= 90.0) {
    return "A";
  }
  if (score >= 80.0) {
    return "B";
  }
  if (score >= 70.0) {
    return "C";
  }
  if (score >= 60.0) {
    return "D";
  }
  return "F";
}

} // namespace chaosscore::metrics
