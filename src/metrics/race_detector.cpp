#include "metrics/race_detector.hpp"

#include "core/time_utils.hpp"

#include <cstdint>
#include <optional>

namespace chaosscore::metrics {

namespace {

struct TimedCall {
  std::chrono::system_clock::time_point time{};
  std::string raw_time;
  std::optional<std::int64_t> status_code;
};

bool IsInvalidInputStatus(const std::optional<std::int64_t>& status_code) {
  return status_code.has_value() && (status_code.value() == 400 || status_code.value() == 404);
}

} // namespace

std::string DescribeRace(const DependencyPair& pair) {
  return pair.consumer + " called before " + pair.producer +
         " completed or with invalid flight_id";
}

void DetectRaceConditions(const std::vector<logs::LogRecord>& records,
                          const RaceDetectorOptions& options, ResilienceMetrics& metrics,
                          core::logging::Logger& logger) {
  std::vector<TimedCall> producer_calls;
  std::vector<TimedCall> consumer_calls;

  for (const logs::LogRecord& record : records) {
    const std::optional<std::string> tool_name = logs::ResolveToolName(record);
    if (!tool_name.has_value() || !record.timestamp.has_value()) {
      continue;
    }

    const bool is_producer = tool_name.value() == options.pair.producer;
    const bool is_consumer = tool_name.value() == options.pair.consumer;
    if (!is_producer && !is_consumer) {
      continue;
    }

    TimedCall call;
    std::string error;
    if (!core::ParseIso8601Timestamp(record.timestamp.value(), call.time, error)) {
      logger.Debug("skipping record with unparseable timestamp in race detection",
                   {{"line", std::to_string(record.line)}, {"error", error}});
      continue;
    }
    call.raw_time = record.timestamp.value();
    call.status_code = record.status_code;

    if (is_producer) {
      producer_calls.push_back(std::move(call));
    } else {
      consumer_calls.push_back(std::move(call));
    }
  }

  for (const TimedCall& consumer_call : consumer_calls) {
    if (!IsInvalidInputStatus(consumer_call.status_code)) {
      continue;
    }

    bool producer_succeeded_before = false;
    bool simultaneous = false;
    for (const TimedCall& producer_call : producer_calls) {
      if (producer_call.time < consumer_call.time && producer_call.status_code.has_value() &&
          producer_call.status_code.value() == 200) {
        producer_succeeded_before = true;
      }
      const auto delta = producer_call.time > consumer_call.time
                             ? producer_call.time - consumer_call.time
                             : consumer_call.time - producer_call.time;
      if (delta < options.simultaneity_window) {
        simultaneous = true;
      }
    }

    if (producer_succeeded_before && !simultaneous) {
      continue;
    }

    ++metrics.race_conditions_detected;
    metrics.logic_errors.push_back({
        .type = "race_condition",
        .description = DescribeRace(options.pair),
        .producer_tool = options.pair.producer,
        .consumer_tool = options.pair.consumer,
        .dependent_call_time = consumer_call.raw_time,
        .dependent_call_status = consumer_call.status_code.value(),
        .dependency_available = producer_succeeded_before,
        .simultaneous_calls = simultaneous,
    });
    logger.Debug("race condition detected",
                 {{"consumer", options.pair.consumer},
                  {"time", consumer_call.raw_time},
                  {"status", std::to_string(consumer_call.status_code.value())}});
  }
}

} // namespace chaosscore::metrics
