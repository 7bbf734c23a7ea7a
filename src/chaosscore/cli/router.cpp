#include "chaosscore/cli/router.hpp"

#include "analysis/analyzer.hpp"
#include "artifacts/report_json_writer.hpp"
#include "artifacts/report_markdown_writer.hpp"
#include "artifacts/scorecard.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/json_utils.hpp"

#include <iostream>

namespace fs = std::filesystem;

namespace chaosscore::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  chaosscore [--log-file <path>] [--log-dir <dir>] [--output-dir <dir>] "
         "[--json-only | --md-only] [--log-level <"
      << core::logging::ExpectedLogLevelList() << ">]\n"
      << "  chaosscore --help\n"
      << "  chaosscore --version\n";
}

bool ReadFlagValue(const std::vector<std::string_view>& args, std::size_t& i,
                   std::string_view flag, std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

void PrintConsoleSummary(const artifacts::Scorecard& scorecard,
                         const std::vector<fs::path>& written_paths) {
  std::cout << "grade: " << scorecard.Grade() << '\n';
  std::cout << "resilience_score: "
            << core::FormatFixedDouble(scorecard.Metrics().resilience_score, 2) << "/100\n";
  if (scorecard.Metadata().warning.has_value()) {
    std::cout << "warning: " << scorecard.Metadata().warning.value() << '\n';
  }
  for (const fs::path& path : written_paths) {
    std::cout << "report: " << path.string() << '\n';
  }
}

} // namespace

bool ParseAnalyzeOptions(const std::vector<std::string_view>& args,
                         AnalyzeCommandOptions& options, std::string& error) {
  bool json_only = false;
  bool md_only = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;

    if (token == "--help" || token == "-h") {
      options.show_help = true;
      continue;
    }
    if (token == "--version") {
      options.show_version = true;
      continue;
    }
    if (token == "--json-only") {
      json_only = true;
      continue;
    }
    if (token == "--md-only") {
      md_only = true;
      continue;
    }
    if (token == "--log-file") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.log_file = fs::path(value);
      continue;
    }
    if (token == "--log-dir") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.log_dir = fs::path(value);
      continue;
    }
    if (token == "--output-dir") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.output_dir = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!ReadFlagValue(args, i, token, value, error)) {
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
    } else {
      error = "unexpected argument: " + std::string(token);
    }
    return false;
  }

  if (json_only && md_only) {
    error = "--json-only and --md-only cannot be combined";
    return false;
  }
  options.write_json = !md_only;
  options.write_markdown = !json_only;
  return true;
}

int ExecuteAnalyze(const AnalyzeCommandOptions& options) {
  core::logging::Logger logger(options.log_level);

  const analysis::AnalyzeOptions analyze_options{
      .log_file = options.log_file,
      .log_dir = options.log_dir,
      .search_root = {},
      .tuning = {},
  };
  const artifacts::Scorecard scorecard = analysis::AnalyzeLogs(analyze_options, logger);

  std::vector<fs::path> written_paths;
  std::string error;
  if (options.write_json) {
    fs::path json_path;
    if (!artifacts::WriteScorecardJson(scorecard, options.output_dir, json_path, error)) {
      logger.Error("failed to write JSON report", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    logger.Info("JSON report generated", {{"path", json_path.string()}});
    written_paths.push_back(json_path);
  }
  if (options.write_markdown) {
    fs::path markdown_path;
    if (!artifacts::WriteScorecardMarkdown(scorecard, options.output_dir, markdown_path, error)) {
      logger.Error("failed to write Markdown report", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    logger.Info("Markdown report generated", {{"path", markdown_path.string()}});
    written_paths.push_back(markdown_path);
  }

  PrintConsoleSummary(scorecard, written_paths);
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  AnalyzeCommandOptions options;
  std::string error;
  if (!ParseAnalyzeOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  if (options.show_help) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }
  if (options.show_version) {
    std::cout << "chaosscore " << artifacts::kAnalyzerVersion << '\n';
    return kExitSuccess;
  }

  return ExecuteAnalyze(options);
}

} // namespace chaosscore::cli
