#pragma once

namespace chaosscore::core::errors {

// Process-exit contract for the analyzer CLI.
//
// A missing or unreadable log is reported inside the scorecard and still exits
// with kSuccess; only invocation mistakes and report publication failures are
// surfaced through the exit status.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace chaosscore::core::errors
