#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace chaosscore::metrics {

// Open-keyed counter with a defined zero value. Lookups never insert, so a
// read of an unseen key cannot create an empty row in reports.
class Tally {
public:
  void Increment(const std::string& key, std::uint64_t amount = 1U);

  // Returns 0 for keys that were never incremented.
  std::uint64_t Count(std::string_view key) const;

  bool Empty() const {
    return counts_.empty();
  }

  // Ordered by key so serialized output is deterministic.
  const std::map<std::string, std::uint64_t, std::less<>>& Entries() const {
    return counts_;
  }

private:
  std::map<std::string, std::uint64_t, std::less<>> counts_;
};

// One flagged dependency-ordering defect. Only the race detector creates these.
struct LogicError {
  std::string type = "race_condition";
  std::string description;
  // Names of the dependency pair, used for serialized key names.
  std::string producer_tool;
  std::string consumer_tool;
  std::string dependent_call_time;
  std::int64_t dependent_call_status = 0;
  bool dependency_available = false;
  bool simultaneous_calls = false;
};

// Every counter, tally and derived rate of one analysis run.
//
// Extraction stages receive this by reference and only ever add to it; rates
// are filled once by `ComputeDerivedRates` after all stages ran.
struct ResilienceMetrics {
  std::uint64_t total_tool_calls = 0;
  std::uint64_t successful_tool_calls = 0;
  std::uint64_t failed_tool_calls = 0;
  std::uint64_t fuzzing_attempts = 0;
  std::uint64_t fuzzing_successful = 0;
  std::uint64_t retry_attempts = 0;
  std::uint64_t successful_retries = 0;
  std::uint64_t agent_crashes = 0;
  std::uint64_t agent_successful_completion = 0;
  std::uint64_t race_conditions_detected = 0;
  std::uint64_t agent_to_agent_disruptions = 0;
  std::uint64_t message_mutations = 0;
  std::uint64_t consensus_delays = 0;
  std::uint64_t agent_isolations = 0;
  std::uint64_t chaos_injections = 0;

  Tally tool_call_errors;
  Tally fuzzing_types;
  Tally swarm_communication_errors;

  std::vector<LogicError> logic_errors;
  // Replay tape file names announced in the log, first-seen order.
  std::vector<std::string> evidence_tapes;

  double tool_call_success_rate = 0.0;
  double fuzzing_success_rate = 0.0;
  double system_recovery_rate = 0.0;
  double retry_success_rate = 0.0;
  double resilience_score = 0.0;
};

// Records one failed tool call and its classified error kind.
void RecordToolCallFailure(ResilienceMetrics& metrics, const std::string& error_type);

} // namespace chaosscore::metrics
