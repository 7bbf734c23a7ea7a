#include "analysis/analyzer.hpp"
#include "artifacts/report_json_writer.hpp"
#include "artifacts/report_markdown_writer.hpp"
#include "common/assertions.hpp"
#include "common/log_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
namespace analysis = chaosscore::analysis;
namespace common = chaosscore::tests::common;
namespace logging = chaosscore::core::logging;

int main() {
  const fs::path root = common::CreateUniqueTempDir("chaosscore-analyzer-pipeline");
  const fs::path log_path = root / "session.log";
  common::WriteLogLines(log_path, common::MixedSessionLog());

  std::ostringstream log_sink;
  logging::Logger logger(logging::LogLevel::kDebug, log_sink);
  const auto generated_at = std::chrono::system_clock::time_point(std::chrono::seconds(0));

  const analysis::AnalyzeOptions options{
      .log_file = log_path,
      .log_dir = root / "logs",
      .search_root = root,
      .tuning = {},
  };
  const auto scorecard = analysis::AnalyzeLogs(options, logger, generated_at);
  const auto& m = scorecard.Metrics();

  if (!scorecard.HasLogData() || scorecard.Metadata().log_file != log_path.string()) {
    common::Fail("expected the explicit log file to be analyzed");
  }
  if (scorecard.Metadata().generated_at != "1970-01-01T00:00:00.000Z") {
    common::Fail("generated_at must come from the supplied clock");
  }
  if (m.total_tool_calls != 4U || m.successful_tool_calls != 3U || m.failed_tool_calls != 1U) {
    common::Fail("unexpected tool call counters");
  }
  if (m.retry_attempts != 1U || m.successful_retries != 1U) {
    common::Fail("retry followed by Response: 200 should be credited");
  }
  if (m.race_conditions_detected != 1U || m.logic_errors.size() != 1U) {
    common::Fail("expected one race condition for the early booking");
  }
  if (m.evidence_tapes.size() != 1U || m.evidence_tapes[0] != "session-1.tape") {
    common::Fail("expected one evidence tape");
  }
  if (m.chaos_injections != 2U || m.fuzzing_successful != 1U) {
    common::Fail("unexpected chaos counters");
  }
  if (scorecard.Grade() != "A" || scorecard.Metrics().resilience_score != 90.0) {
    common::Fail("expected grade A with score 90");
  }
  if (scorecard.Recommendations().size() != 2U) {
    common::Fail("race conditions should yield exactly the two critical recommendations");
  }
  if (scorecard.RecentEvents().size() != 11U || scorecard.RecentToolCalls().size() != 4U) {
    common::Fail("unexpected recent event or tool call counts");
  }

  const std::string log_text = log_sink.str();
  common::AssertContains(log_text, "msg=\"analyzing log file\"");
  common::AssertContains(log_text, "structured=\"3\"");
  common::AssertContains(log_text, "msg=\"race condition detected\"");
  common::AssertContains(log_text, "log_file=\"" + log_path.string() + "\"");

  // Same log, same clock: byte-identical reports.
  std::ostringstream second_sink;
  logging::Logger second_logger(logging::LogLevel::kInfo, second_sink);
  const auto again = analysis::AnalyzeLogs(options, second_logger, generated_at);
  if (chaosscore::artifacts::RenderScorecardJson(again) !=
          chaosscore::artifacts::RenderScorecardJson(scorecard) ||
      chaosscore::artifacts::RenderScorecardMarkdown(again) !=
          chaosscore::artifacts::RenderScorecardMarkdown(scorecard)) {
    common::Fail("analysis must be deterministic for a fixed log and clock");
  }

  // The same content with CRLF line endings scores identically.
  const fs::path crlf_path = root / "session_crlf.log";
  {
    std::ofstream out(crlf_path, std::ios::binary);
    for (const auto& line : common::MixedSessionLog()) {
      out << line << "\r\n";
    }
  }
  const auto crlf = analysis::AnalyzeLogs(
      {.log_file = crlf_path, .log_dir = root / "logs", .search_root = root, .tuning = {}},
      second_logger, generated_at);
  if (crlf.Metrics().resilience_score != m.resilience_score ||
      crlf.Metrics().successful_retries != m.successful_retries) {
    common::Fail("CRLF line endings must not change the analysis");
  }

  common::RemovePathBestEffort(root);
  std::cout << "analyzer_pipeline_smoke: ok\n";
  return 0;
}
