#pragma once

#include "analysis/event_stream.hpp"
#include "events/event_model.hpp"
#include "metrics/resilience_metrics.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chaosscore::artifacts {

inline constexpr const char* kAnalyzerVersion = "1.0.0";
inline constexpr const char* kNoLogFileWarning = "No log file found";

struct ScorecardMetadata {
  std::string generated_at;
  std::string analyzer_version = kAnalyzerVersion;
  // Empty when no log was resolved.
  std::string log_file;
  std::optional<std::string> warning;
};

// Human-readable summary line keyed by metric name. Kept as an ordered list so
// both renderers print entries in the same order.
struct SummaryEntry {
  std::string key;
  std::string value;
};

// Immutable result of one analysis run.
//
// Both report writers render the same instance; nothing recomputes metrics
// after construction. `generated_at` is the only wall-clock-derived field.
class Scorecard {
public:
  Scorecard(ScorecardMetadata metadata, metrics::ResilienceMetrics metrics, std::string grade,
            std::vector<SummaryEntry> summary, std::vector<std::string> recommendations,
            std::vector<analysis::ToolCallRecord> recent_tool_calls,
            std::vector<events::Event> recent_events)
      : metadata_(std::move(metadata)),
        metrics_(std::move(metrics)),
        grade_(std::move(grade)),
        summary_(std::move(summary)),
        recommendations_(std::move(recommendations)),
        recent_tool_calls_(std::move(recent_tool_calls)),
        recent_events_(std::move(recent_events)) {}

  const ScorecardMetadata& Metadata() const {
    return metadata_;
  }
  const metrics::ResilienceMetrics& Metrics() const {
    return metrics_;
  }
  const std::string& Grade() const {
    return grade_;
  }
  const std::vector<SummaryEntry>& Summary() const {
    return summary_;
  }
  const std::vector<std::string>& Recommendations() const {
    return recommendations_;
  }
  const std::vector<analysis::ToolCallRecord>& RecentToolCalls() const {
    return recent_tool_calls_;
  }
  const std::vector<events::Event>& RecentEvents() const {
    return recent_events_;
  }

  bool HasLogData() const {
    return !metadata_.log_file.empty() && !metadata_.warning.has_value();
  }

private:
  ScorecardMetadata metadata_;
  metrics::ResilienceMetrics metrics_;
  std::string grade_;
  std::vector<SummaryEntry> summary_;
  std::vector<std::string> recommendations_;
  std::vector<analysis::ToolCallRecord> recent_tool_calls_;
  std::vector<events::Event> recent_events_;
};

struct RecentLimits {
  std::size_t tool_calls = 10U;
  std::size_t events = 20U;
};

// Assembles the scorecard for an analyzed log. `metrics` must already carry
// derived rates (see `metrics::ComputeDerivedRates`).
Scorecard BuildScorecard(ScorecardMetadata metadata, metrics::ResilienceMetrics metrics,
                         const analysis::EventStream& stream, const RecentLimits& limits);

// Scorecard for a run with no analyzable log: grade N/A, zero metrics and a
// single recommendation to enable proxy logging.
Scorecard BuildEmptyScorecard(ScorecardMetadata metadata);

// Summary lines in render order: grade, resilience_score, tool_calls, fuzzing,
// recovery, outcome, protocol_attacks, race_conditions, then logic_errors
// when any were recorded.
std::vector<SummaryEntry> BuildSummary(const metrics::ResilienceMetrics& metrics,
                                       const std::string& grade);

} // namespace chaosscore::artifacts
