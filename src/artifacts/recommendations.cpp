#include "artifacts/recommendations.hpp"

namespace chaosscore::artifacts {

std::vector<std::string> BuildRecommendations(const metrics::ResilienceMetrics& metrics,
                                              const std::string& grade) {
  std::vector<std::string> recommendations;

  if (grade == "D" || grade == "F") {
    recommendations.push_back(
        "**Critical**: System resilience is low. Implement error handling and retry logic.");
  }

  if (metrics.tool_call_success_rate < 70.0) {
    recommendations.push_back("Improve tool call error handling. Many tool calls are failing.");
  }

  if (metrics.system_recovery_rate < 50.0) {
    recommendations.push_back(
        "Implement retry logic. System is not recovering from failures effectively.");
  }

  if (metrics.agent_crashes > 0U) {
    recommendations.push_back("Add exception handling. Agent is crashing on errors.");
  }

  if (metrics.fuzzing_attempts > 0U && metrics.fuzzing_success_rate < 50.0) {
    recommendations.push_back(
        "Fuzzing is not being applied effectively. Check proxy configuration.");
  }

  if (metrics.retry_attempts == 0U && metrics.failed_tool_calls > 0U) {
    recommendations.push_back(
        "No retry attempts detected. Consider implementing retry mechanisms.");
  }

  if (metrics.race_conditions_detected > 0U) {
    recommendations.push_back(
        "**CRITICAL**: Race condition detected! Agent is calling dependent tools before "
        "dependencies complete. Implement sequential tool execution or dependency validation "
        "before calling dependent tools.");
    recommendations.push_back(
        "**Solution**: Ensure tools that depend on other tools' results wait for those results. "
        "For example, `book_ticket` should only be called after `search_flights` returns a "
        "valid `flight_id`.");
  }

  if (recommendations.empty()) {
    recommendations.push_back("System shows good resilience. Continue monitoring and testing.");
  }

  return recommendations;
}

} // namespace chaosscore::artifacts
