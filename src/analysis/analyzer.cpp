#include "analysis/analyzer.hpp"

#include "analysis/line_parser.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "logs/log_locator.hpp"
#include "metrics/score.hpp"

#include <string>
#include <utility>
#include <vector>

namespace chaosscore::analysis {

artifacts::Scorecard AnalyzeLogs(const AnalyzeOptions& options, core::logging::Logger& logger,
                                 const std::chrono::system_clock::time_point generated_at) {
  artifacts::ScorecardMetadata metadata;
  metadata.generated_at = core::FormatUtcTimestamp(generated_at);

  const std::optional<std::filesystem::path> log_path = logs::LocateLogFile({
      .explicit_path = options.log_file,
      .log_dir = options.log_dir,
      .search_root = options.search_root,
  });
  if (!log_path.has_value()) {
    logger.Warn("no log file found, using empty results",
                {{"log_dir", options.log_dir.string()}});
    metadata.warning = artifacts::kNoLogFileWarning;
    return artifacts::BuildEmptyScorecard(std::move(metadata));
  }

  metadata.log_file = log_path->string();
  logger.SetLogFile(metadata.log_file);
  logger.Info("analyzing log file");

  std::vector<std::string> lines;
  std::string error;
  if (!core::ReadTextFileLines(log_path.value(), lines, error)) {
    logger.Error("failed to read log file", {{"error", error}});
    metadata.warning = "Failed to read log file: " + error;
    return artifacts::BuildEmptyScorecard(std::move(metadata));
  }

  EventStream stream;
  metrics::ResilienceMetrics metrics;
  const ParseSummary summary = ParseLogLines(lines, stream, metrics, logger);
  logger.Info("parsed log lines",
              {{"lines", std::to_string(summary.total_lines)},
               {"structured", std::to_string(summary.structured_lines)},
               {"free_text", std::to_string(summary.free_text_lines)},
               {"blank", std::to_string(summary.blank_lines)},
               {"malformed_json", std::to_string(summary.malformed_json_lines)},
               {"events", std::to_string(stream.events.size())}});

  metrics.evidence_tapes = ExtractEvidenceTapes(stream.raw_lines);
  metrics::CorrelateRetries(stream.events, stream.raw_lines, metrics,
                            options.tuning.retry_window_lines);
  metrics::DetectRaceConditions(stream.records, options.tuning.race, metrics, logger);
  metrics::ComputeDerivedRates(metrics);

  artifacts::Scorecard scorecard = artifacts::BuildScorecard(
      std::move(metadata), std::move(metrics), stream, options.tuning.recent);
  logger.Info("analysis complete",
              {{"grade", scorecard.Grade()},
               {"resilience_score",
                core::FormatFixedDouble(scorecard.Metrics().resilience_score, 2)},
               {"race_conditions",
                std::to_string(scorecard.Metrics().race_conditions_detected)}});
  return scorecard;
}

artifacts::Scorecard AnalyzeLogs(const AnalyzeOptions& options, core::logging::Logger& logger) {
  return AnalyzeLogs(options, logger, std::chrono::system_clock::now());
}

} // namespace chaosscore::analysis
