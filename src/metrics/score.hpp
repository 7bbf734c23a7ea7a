#pragma once

#include "metrics/resilience_metrics.hpp"

#include <string>

namespace chaosscore::metrics {

inline constexpr double kSuccessWeight = 0.4;
inline constexpr double kRecoveryWeight = 0.4;
inline constexpr double kCompletionWeight = 0.2;

// Grade reported when no log could be analyzed.
inline constexpr const char* kNoDataGrade = "N/A";

// Fills every rate on `metrics` and then `resilience_score`.
//
// Rates are percentages in [0, 100] for well-formed input. Zero denominators
// yield 0.0, except `system_recovery_rate` which is 100.0 when nothing failed.
void ComputeDerivedRates(ResilienceMetrics& metrics);

// 0.4 * success + 0.4 * recovery + 0.2 * completion, rounded to 2 decimals.
// Success and recovery are capped at 100 before weighting.
double ComputeResilienceScore(const ResilienceMetrics& metrics);

// 100 with no crashes, else completions / (completions + crashes) * 100.
double ComputeCompletionScore(const ResilienceMetrics& metrics);

// >=90 A, >=80 B, >=70 C, >=60 D, else F.
std::string GradeForScore(double score);

double RoundToHundredths(double value);

} // namespace chaosscore::metrics
