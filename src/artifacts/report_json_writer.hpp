#pragma once

#include "artifacts/scorecard.hpp"

#include <filesystem>
#include <string>

namespace chaosscore::artifacts {

inline constexpr const char* kJsonReportFileName = "resilience_report.json";

// Renders the machine-readable report as 2-space indented JSON.
//
// Top-level keys, in order: metadata, metrics, grade, summary,
// recommendations, tool_calls, events. Tallies are objects keyed by kind;
// rates are fixed to 2 decimals.
std::string RenderScorecardJson(const Scorecard& scorecard);

// Writes `<output_dir>/resilience_report.json`.
//
// Contract:
// - creates `output_dir` when missing.
// - publishes atomically (temp file + rename).
// - returns false and populates `error` on failure.
bool WriteScorecardJson(const Scorecard& scorecard, const std::filesystem::path& output_dir,
                        std::filesystem::path& written_path, std::string& error);

} // namespace chaosscore::artifacts
