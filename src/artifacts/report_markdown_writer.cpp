#include "artifacts/report_markdown_writer.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace fs = std::filesystem;

namespace chaosscore::artifacts {

namespace {

constexpr std::size_t kMaxRaceDetails = 5U;

void WriteTallyList(std::ostringstream& out, const metrics::Tally& tally) {
  for (const auto& [key, count] : tally.Entries()) {
    out << "- " << key << ": " << count << '\n';
  }
}

void WriteHeader(std::ostringstream& out, const Scorecard& scorecard) {
  const ScorecardMetadata& metadata = scorecard.Metadata();
  out << "# Resilience Scorecard\n\n";
  out << "**Generated:** " << metadata.generated_at << "\n\n";
  if (!metadata.log_file.empty()) {
    out << "**Log File:** `" << metadata.log_file << "`\n\n";
  }
  if (metadata.warning.has_value()) {
    out << "**Warning:** " << metadata.warning.value() << "\n\n";
  }
  out << "## Overall Grade: " << scorecard.Grade() << "\n\n";
  out << "**Resilience Score:** "
      << core::FormatFixedDouble(scorecard.Metrics().resilience_score, 1) << "/100\n\n";
}

void WriteSummarySection(std::ostringstream& out, const std::vector<SummaryEntry>& summary) {
  out << "## Summary\n\n";
  for (const SummaryEntry& entry : summary) {
    if (entry.key == "grade") {
      continue;
    }
    out << "- **" << TitleCaseKey(entry.key) << ":** " << entry.value << '\n';
  }
  out << '\n';
}

void WriteSwarmSection(std::ostringstream& out, const metrics::ResilienceMetrics& metrics) {
  if (metrics.swarm_communication_errors.Empty()) {
    return;
  }
  out << "### Swarm Communication Errors\n\n";
  WriteTallyList(out, metrics.swarm_communication_errors);
  out << '\n';
  out << "- Agent-to-Agent Disruptions: " << metrics.agent_to_agent_disruptions << '\n';
  out << "- Message Mutations: " << metrics.message_mutations << '\n';
  out << "- Consensus Delays: " << metrics.consensus_delays << '\n';
  out << "- Agent Isolations: " << metrics.agent_isolations << "\n\n";
}

void WriteRaceSection(std::ostringstream& out, const metrics::ResilienceMetrics& metrics) {
  if (metrics.race_conditions_detected == 0U) {
    return;
  }
  out << "### Race Conditions Detected\n\n";
  out << "**Critical Issue**: " << metrics.race_conditions_detected
      << " race condition(s) found!\n\n";
  out << "**What this means**: The agent called dependent tools (e.g., `book_ticket`) before "
         "their dependencies (e.g., `search_flights`) completed, or with invalid data.\n\n";

  if (metrics.logic_errors.empty()) {
    return;
  }
  out << "**Details**:\n";
  const std::size_t count = std::min(kMaxRaceDetails, metrics.logic_errors.size());
  for (std::size_t i = 0; i < count; ++i) {
    const metrics::LogicError& error = metrics.logic_errors[i];
    out << (i + 1U) << ". " << error.description << '\n';
    out << "   - Time: " << error.dependent_call_time << '\n';
    out << "   - Status: " << error.dependent_call_status << '\n';
  }
  out << '\n';
}

void WriteDetailedMetrics(std::ostringstream& out, const metrics::ResilienceMetrics& metrics) {
  out << "## Detailed Metrics\n\n";

  out << "### Tool Calls\n\n";
  out << "- Total Tool Calls: " << metrics.total_tool_calls << '\n';
  out << "- Successful: " << metrics.successful_tool_calls << '\n';
  out << "- Failed: " << metrics.failed_tool_calls << '\n';
  out << "- Success Rate: " << core::FormatFixedDouble(metrics.tool_call_success_rate, 1)
      << "%\n";
  out << "- Chaos Injections: " << metrics.chaos_injections << "\n\n";

  WriteSwarmSection(out, metrics);

  out << "### Fuzzing\n\n";
  out << "- Fuzzing Attempts: " << metrics.fuzzing_attempts << '\n';
  out << "- Successful Injections: " << metrics.fuzzing_successful << '\n';
  out << "- Fuzzing Success Rate: " << core::FormatFixedDouble(metrics.fuzzing_success_rate, 1)
      << "%\n\n";
  if (!metrics.fuzzing_types.Empty()) {
    out << "**Fuzzing Types:**\n";
    WriteTallyList(out, metrics.fuzzing_types);
    out << '\n';
  }

  out << "### System Recovery\n\n";
  out << "- Retry Attempts: " << metrics.retry_attempts << '\n';
  out << "- Successful Retries: " << metrics.successful_retries << '\n';
  out << "- Recovery Rate: " << core::FormatFixedDouble(metrics.system_recovery_rate, 1)
      << "%\n\n";

  out << "### Agent Outcome\n\n";
  out << "- Successful Completions: " << metrics.agent_successful_completion << '\n';
  out << "- Crashes: " << metrics.agent_crashes << "\n\n";

  WriteRaceSection(out, metrics);

  if (!metrics.tool_call_errors.Empty()) {
    out << "### Error Breakdown\n\n";
    WriteTallyList(out, metrics.tool_call_errors);
    out << '\n';
  }
}

void WriteEvidenceSection(std::ostringstream& out, const std::vector<std::string>& tapes) {
  if (tapes.empty()) {
    return;
  }
  out << "## Evidence\n\n";
  for (const std::string& tape : tapes) {
    out << "- Tape Replay ID: `" << tape << "`\n";
  }
  out << '\n';
}

} // namespace

std::string TitleCaseKey(std::string_view key) {
  std::string titled;
  titled.reserve(key.size());
  bool word_start = true;
  for (const char c : key) {
    if (c == '_') {
      titled.push_back(' ');
      word_start = true;
      continue;
    }
    const auto uc = static_cast<unsigned char>(c);
    titled.push_back(static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc)));
    word_start = false;
  }
  return titled;
}

std::string RenderScorecardMarkdown(const Scorecard& scorecard) {
  std::ostringstream out;
  WriteHeader(out, scorecard);
  WriteSummarySection(out, scorecard.Summary());
  WriteDetailedMetrics(out, scorecard.Metrics());

  out << "## Recommendations\n\n";
  for (const std::string& recommendation : scorecard.Recommendations()) {
    out << "- " << recommendation << '\n';
  }
  out << '\n';

  WriteEvidenceSection(out, scorecard.Metrics().evidence_tapes);
  return out.str();
}

bool WriteScorecardMarkdown(const Scorecard& scorecard, const fs::path& output_dir,
                            fs::path& written_path, std::string& error) {
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }

  written_path = output_dir / kMarkdownReportFileName;
  return core::WriteTextFileAtomic(written_path, RenderScorecardMarkdown(scorecard), error);
}

} // namespace chaosscore::artifacts
