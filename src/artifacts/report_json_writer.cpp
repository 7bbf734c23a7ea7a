#include "artifacts/report_json_writer.hpp"

#include "artifacts/output_dir_utils.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"

#include <cstdint>
#include <sstream>

namespace fs = std::filesystem;

namespace chaosscore::artifacts {

namespace {

std::string FormatRate(const double value) {
  return core::FormatFixedDouble(value, 2);
}

void WriteTallyObject(std::ostringstream& out, const metrics::Tally& tally) {
  if (tally.Empty()) {
    out << "{}";
    return;
  }
  out << "{\n";
  bool first = true;
  for (const auto& [key, count] : tally.Entries()) {
    if (!first) {
      out << ",\n";
    }
    first = false;
    out << "      " << core::QuoteJson(key) << ": " << count;
  }
  out << "\n    }";
}

void WriteLogicErrors(std::ostringstream& out, const std::vector<metrics::LogicError>& errors) {
  if (errors.empty()) {
    out << "[]";
    return;
  }
  out << "[\n";
  for (std::size_t i = 0; i < errors.size(); ++i) {
    const metrics::LogicError& error = errors[i];
    out << "      {"
        << "\"type\": " << core::QuoteJson(error.type)
        << ", \"description\": " << core::QuoteJson(error.description) << ", "
        << core::QuoteJson(error.consumer_tool + "_time") << ": "
        << core::QuoteJson(error.dependent_call_time) << ", "
        << core::QuoteJson(error.consumer_tool + "_status") << ": "
        << error.dependent_call_status << ", "
        << core::QuoteJson(error.producer_tool + "_available") << ": "
        << (error.dependency_available ? "true" : "false")
        << ", \"simultaneous_calls\": " << (error.simultaneous_calls ? "true" : "false") << "}";
    out << (i + 1U < errors.size() ? ",\n" : "\n");
  }
  out << "    ]";
}

void WriteStringArray(std::ostringstream& out, const std::vector<std::string>& values,
                      const char* indent, const char* closing_indent) {
  if (values.empty()) {
    out << "[]";
    return;
  }
  out << "[\n";
  for (std::size_t i = 0; i < values.size(); ++i) {
    out << indent << core::QuoteJson(values[i]) << (i + 1U < values.size() ? ",\n" : "\n");
  }
  out << closing_indent << "]";
}

void WriteMetadata(std::ostringstream& out, const ScorecardMetadata& metadata) {
  out << "  \"metadata\": {\n"
      << "    \"generated_at\": " << core::QuoteJson(metadata.generated_at) << ",\n"
      << "    \"analyzer_version\": " << core::QuoteJson(metadata.analyzer_version) << ",\n"
      << "    \"log_file\": ";
  if (metadata.log_file.empty()) {
    out << "null";
  } else {
    out << core::QuoteJson(metadata.log_file);
  }
  if (metadata.warning.has_value()) {
    out << ",\n    \"warning\": " << core::QuoteJson(metadata.warning.value());
  }
  out << "\n  },\n";
}

void WriteMetrics(std::ostringstream& out, const metrics::ResilienceMetrics& metrics) {
  out << "  \"metrics\": {\n"
      << "    \"total_tool_calls\": " << metrics.total_tool_calls << ",\n"
      << "    \"successful_tool_calls\": " << metrics.successful_tool_calls << ",\n"
      << "    \"failed_tool_calls\": " << metrics.failed_tool_calls << ",\n"
      << "    \"fuzzing_attempts\": " << metrics.fuzzing_attempts << ",\n"
      << "    \"fuzzing_successful\": " << metrics.fuzzing_successful << ",\n"
      << "    \"retry_attempts\": " << metrics.retry_attempts << ",\n"
      << "    \"successful_retries\": " << metrics.successful_retries << ",\n"
      << "    \"agent_crashes\": " << metrics.agent_crashes << ",\n"
      << "    \"agent_successful_completion\": " << metrics.agent_successful_completion << ",\n"
      << "    \"race_conditions_detected\": " << metrics.race_conditions_detected << ",\n"
      << "    \"agent_to_agent_disruptions\": " << metrics.agent_to_agent_disruptions << ",\n"
      << "    \"message_mutations\": " << metrics.message_mutations << ",\n"
      << "    \"consensus_delays\": " << metrics.consensus_delays << ",\n"
      << "    \"agent_isolations\": " << metrics.agent_isolations << ",\n"
      << "    \"chaos_injections\": " << metrics.chaos_injections << ",\n"
      << "    \"tool_call_success_rate\": " << FormatRate(metrics.tool_call_success_rate) << ",\n"
      << "    \"fuzzing_success_rate\": " << FormatRate(metrics.fuzzing_success_rate) << ",\n"
      << "    \"system_recovery_rate\": " << FormatRate(metrics.system_recovery_rate) << ",\n"
      << "    \"retry_success_rate\": " << FormatRate(metrics.retry_success_rate) << ",\n"
      << "    \"resilience_score\": " << FormatRate(metrics.resilience_score) << ",\n";

  out << "    \"tool_call_errors\": ";
  WriteTallyObject(out, metrics.tool_call_errors);
  out << ",\n    \"fuzzing_types\": ";
  WriteTallyObject(out, metrics.fuzzing_types);
  out << ",\n    \"swarm_communication_errors\": ";
  WriteTallyObject(out, metrics.swarm_communication_errors);
  out << ",\n    \"logic_errors\": ";
  WriteLogicErrors(out, metrics.logic_errors);
  out << ",\n    \"evidence_tapes\": ";
  WriteStringArray(out, metrics.evidence_tapes, "      ", "    ");
  out << "\n  },\n";
}

void WriteSummary(std::ostringstream& out, const std::vector<SummaryEntry>& summary) {
  out << "  \"summary\": {\n";
  for (std::size_t i = 0; i < summary.size(); ++i) {
    out << "    " << core::QuoteJson(summary[i].key) << ": " << core::QuoteJson(summary[i].value)
        << (i + 1U < summary.size() ? ",\n" : "\n");
  }
  out << "  },\n";
}

std::string ToolCallToJson(const analysis::ToolCallRecord& tool_call) {
  std::ostringstream out;
  out << "{\"line\": " << tool_call.line << ", \"url\": " << core::QuoteJson(tool_call.url)
      << ", \"timestamp\": "
      << (tool_call.timestamp.has_value() ? core::QuoteJson(tool_call.timestamp.value())
                                          : std::string("null"))
      << ", \"type\": " << core::QuoteJson(tool_call.type) << "}";
  return out.str();
}

template <typename T, typename Serializer>
void WriteObjectLines(std::ostringstream& out, const std::vector<T>& items,
                      Serializer serialize) {
  if (items.empty()) {
    out << "[]";
    return;
  }
  out << "[\n";
  for (std::size_t i = 0; i < items.size(); ++i) {
    out << "    " << serialize(items[i]) << (i + 1U < items.size() ? ",\n" : "\n");
  }
  out << "  ]";
}

} // namespace

std::string RenderScorecardJson(const Scorecard& scorecard) {
  std::ostringstream out;
  out << "{\n";
  WriteMetadata(out, scorecard.Metadata());
  WriteMetrics(out, scorecard.Metrics());
  out << "  \"grade\": " << core::QuoteJson(scorecard.Grade()) << ",\n";
  WriteSummary(out, scorecard.Summary());
  out << "  \"recommendations\": ";
  WriteStringArray(out, scorecard.Recommendations(), "    ", "  ");
  out << ",\n  \"tool_calls\": ";
  WriteObjectLines(out, scorecard.RecentToolCalls(), ToolCallToJson);
  out << ",\n  \"events\": ";
  WriteObjectLines(out, scorecard.RecentEvents(),
                   [](const events::Event& event) { return events::ToJson(event); });
  out << "\n}\n";
  return out.str();
}

bool WriteScorecardJson(const Scorecard& scorecard, const fs::path& output_dir,
                        fs::path& written_path, std::string& error) {
  if (!EnsureOutputDir(output_dir, error)) {
    return false;
  }

  written_path = output_dir / kJsonReportFileName;
  return core::WriteTextFileAtomic(written_path, RenderScorecardJson(scorecard), error);
}

} // namespace chaosscore::artifacts
