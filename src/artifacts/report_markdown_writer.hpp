#pragma once

#include "artifacts/scorecard.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace chaosscore::artifacts {

inline constexpr const char* kMarkdownReportFileName = "resilience_report.md";

// Renders the narrative report.
//
// Section order is fixed: title, grade, score, Summary, Detailed Metrics
// (Tool Calls, Swarm Communication Errors when any, Fuzzing, System Recovery,
// Agent Outcome, Race Conditions when any, Error Breakdown when any),
// Recommendations, then Evidence when replay tapes were captured.
std::string RenderScorecardMarkdown(const Scorecard& scorecard);

// Writes `<output_dir>/resilience_report.md`.
//
// Contract:
// - creates `output_dir` when missing.
// - publishes atomically (temp file + rename).
// - returns false and populates `error` on failure.
bool WriteScorecardMarkdown(const Scorecard& scorecard, const std::filesystem::path& output_dir,
                            std::filesystem::path& written_path, std::string& error);

// "resilience_score" -> "Resilience Score".
std::string TitleCaseKey(std::string_view key);

} // namespace chaosscore::artifacts
