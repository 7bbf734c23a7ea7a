#include "artifacts/scorecard.hpp"

#include "artifacts/recommendations.hpp"
#include "core/json_utils.hpp"
#include "metrics/score.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace chaosscore::artifacts {

namespace {

template <typename T>
std::vector<T> TakeLast(const std::vector<T>& items, const std::size_t limit) {
  const std::size_t count = std::min(limit, items.size());
  return std::vector<T>(items.end() - static_cast<std::ptrdiff_t>(count), items.end());
}

std::string JoinFirstDescriptions(const std::vector<metrics::LogicError>& logic_errors,
                                  const std::size_t limit) {
  std::string joined;
  const std::size_t count = std::min(limit, logic_errors.size());
  for (std::size_t i = 0; i < count; ++i) {
    if (i > 0U) {
      joined += "; ";
    }
    joined += logic_errors[i].description;
  }
  return joined;
}

} // namespace

std::vector<SummaryEntry> BuildSummary(const metrics::ResilienceMetrics& metrics,
                                       const std::string& grade) {
  std::vector<SummaryEntry> summary;
  summary.push_back({"grade", grade});
  summary.push_back(
      {"resilience_score", core::FormatFixedDouble(metrics.resilience_score, 1) + "/100"});
  summary.push_back({"tool_calls", "Total: " + std::to_string(metrics.total_tool_calls) +
                                       ", Successful: " +
                                       std::to_string(metrics.successful_tool_calls) +
                                       ", Failed: " + std::to_string(metrics.failed_tool_calls)});
  summary.push_back({"fuzzing", "Attempted: " + std::to_string(metrics.fuzzing_attempts) +
                                    ", Successful: " + std::to_string(metrics.fuzzing_successful)});
  summary.push_back({"recovery", "System recovered from " +
                                     core::FormatFixedDouble(metrics.system_recovery_rate, 1) +
                                     "% of failures"});
  summary.push_back({"outcome",
                     "Completions: " + std::to_string(metrics.agent_successful_completion) +
                         ", Crashes: " + std::to_string(metrics.agent_crashes)});

  if (metrics.fuzzing_attempts > 0U) {
    const std::uint64_t outcomes = metrics.agent_successful_completion + metrics.agent_crashes;
    const double survival_rate =
        outcomes == 0U ? 0.0
                       : static_cast<double>(metrics.agent_successful_completion) /
                             static_cast<double>(outcomes) * 100.0;
    summary.push_back({"protocol_attacks", "System survived " +
                                               core::FormatFixedDouble(survival_rate, 1) +
                                               "% of protocol attacks"});
  } else {
    summary.push_back({"protocol_attacks", "No protocol attacks detected"});
  }

  if (metrics.race_conditions_detected > 0U) {
    summary.push_back({"race_conditions",
                       "CRITICAL: " + std::to_string(metrics.race_conditions_detected) +
                           " race condition(s) detected - Agent called dependent tools before "
                           "dependencies completed"});
    if (!metrics.logic_errors.empty()) {
      summary.push_back({"logic_errors", JoinFirstDescriptions(metrics.logic_errors, 3U)});
    }
  } else {
    summary.push_back({"race_conditions", "No race conditions detected"});
  }

  return summary;
}

Scorecard BuildScorecard(ScorecardMetadata metadata, metrics::ResilienceMetrics metrics,
                         const analysis::EventStream& stream, const RecentLimits& limits) {
  std::string grade = metrics::GradeForScore(metrics.resilience_score);
  std::vector<SummaryEntry> summary = BuildSummary(metrics, grade);
  std::vector<std::string> recommendations = BuildRecommendations(metrics, grade);
  return Scorecard(std::move(metadata), std::move(metrics), std::move(grade), std::move(summary),
                   std::move(recommendations), TakeLast(stream.tool_calls, limits.tool_calls),
                   TakeLast(stream.events, limits.events));
}

Scorecard BuildEmptyScorecard(ScorecardMetadata metadata) {
  if (!metadata.warning.has_value()) {
    metadata.warning = kNoLogFileWarning;
  }
  std::vector<SummaryEntry> summary = {
      {"grade", metrics::kNoDataGrade},
      {"message", "No log data available for analysis"},
  };
  metrics::ResilienceMetrics zeroed;
  std::vector<std::string> recommendations = BuildRecommendations(zeroed, metrics::kNoDataGrade);
  return Scorecard(std::move(metadata), std::move(zeroed), metrics::kNoDataGrade,
                   std::move(summary), std::move(recommendations), {}, {});
}

} // namespace chaosscore::artifacts
