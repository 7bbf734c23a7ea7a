#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chaosscore::cli {

// Parsed `chaosscore` flags. Defaults match running with no arguments.
struct AnalyzeCommandOptions {
  std::optional<std::filesystem::path> log_file;
  std::filesystem::path log_dir = "logs";
  std::filesystem::path output_dir = ".";
  bool write_json = true;
  bool write_markdown = true;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  bool show_help = false;
  bool show_version = false;
};

// Parses flags (program name excluded). Returns false with `error` set on an
// unknown flag, a missing value, or `--json-only` combined with `--md-only`.
bool ParseAnalyzeOptions(const std::vector<std::string_view>& args,
                         AnalyzeCommandOptions& options, std::string& error);

// Runs one analysis and writes the requested reports.
int ExecuteAnalyze(const AnalyzeCommandOptions& options);

// Entry point for `chaosscore` with a stable exit-code contract:
//   0 => success (including "no log file found")
//   1 => a report could not be written
//   2 => usage error
int Dispatch(int argc, char** argv);

} // namespace chaosscore::cli
