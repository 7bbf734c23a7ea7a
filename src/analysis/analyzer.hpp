#pragma once

#include "artifacts/scorecard.hpp"
#include "core/logging/logger.hpp"
#include "metrics/race_detector.hpp"
#include "metrics/retry_correlator.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>

namespace chaosscore::analysis {

// Knobs for the correlation stages. Defaults reproduce the documented
// scoring behavior; tests narrow them to exercise edges.
struct AnalysisTuning {
  std::size_t retry_window_lines = metrics::kDefaultRetryWindowLines;
  metrics::RaceDetectorOptions race;
  artifacts::RecentLimits recent;
};

struct AnalyzeOptions {
  std::optional<std::filesystem::path> log_file;
  std::filesystem::path log_dir = "logs";
  // Base for conventional log names; empty means the working directory.
  std::filesystem::path search_root;
  AnalysisTuning tuning;
};

// Runs the whole pipeline once: locate, read, parse, correlate, score.
//
// Contract:
// - never throws for missing or unreadable input; both yield the empty N/A
//   scorecard with `metadata.warning` set.
// - `logger` gets the resolved log file as its context field.
// - `generated_at` is the only wall-clock input.
artifacts::Scorecard AnalyzeLogs(const AnalyzeOptions& options, core::logging::Logger& logger,
                                 std::chrono::system_clock::time_point generated_at);

artifacts::Scorecard AnalyzeLogs(const AnalyzeOptions& options, core::logging::Logger& logger);

} // namespace chaosscore::analysis
