#pragma once

#include "core/logging/logger.hpp"
#include "logs/log_record.hpp"
#include "metrics/resilience_metrics.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace chaosscore::metrics {

// Two tools where `consumer` needs a value that only `producer` returns.
struct DependencyPair {
  std::string producer = "search_flights";
  std::string consumer = "book_ticket";
};

struct RaceDetectorOptions {
  DependencyPair pair;
  // Producer calls closer than this to a consumer call count as simultaneous.
  std::chrono::milliseconds simultaneity_window{2000};
};

// Flags consumer calls that likely ran ahead of their producer.
//
// Contract:
// - only records whose resolved tool name matches the pair and whose
//   timestamp parses as ISO-8601 take part; the rest are skipped silently
//   (unparseable timestamps are logged at DEBUG).
// - a consumer call at T with status S is flagged iff S is 400 or 404 and
//   either no producer call before T returned 200, or some producer call
//   lies within the simultaneity window of T.
// - every flag increments `race_conditions_detected` and appends one
//   `LogicError`.
//
// This is a heuristic: a consumer that failed for an unrelated reason with no
// prior successful producer call is also flagged.
void DetectRaceConditions(const std::vector<logs::LogRecord>& records,
                          const RaceDetectorOptions& options, ResilienceMetrics& metrics,
                          core::logging::Logger& logger);

// "<consumer> called before <producer> completed or with invalid flight_id"
std::string DescribeRace(const DependencyPair& pair);

} // namespace chaosscore::metrics
