#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace chaosscore::logs {

// Relative file names tried, in order, when no explicit log path resolves.
const std::vector<std::string_view>& ConventionalLogNames();

struct LocateRequest {
  // Explicit `--log-file`; used only when it exists.
  std::optional<std::filesystem::path> explicit_path;
  // Directory scanned for the first `*.log` file.
  std::filesystem::path log_dir = "logs";
  // Base for conventional names; empty means the process working directory.
  std::filesystem::path search_root;
};

// Resolves which log file to analyze:
// 1) explicit path when it exists
// 2) first existing conventional name under `search_root`
// 3) first regular `*.log` file in `log_dir` (directory iteration order)
//
// Returns nullopt when nothing resolves. Callers treat that as a normal
// outcome, not an error. The locator never creates directories.
std::optional<std::filesystem::path> LocateLogFile(const LocateRequest& request);

} // namespace chaosscore::logs
