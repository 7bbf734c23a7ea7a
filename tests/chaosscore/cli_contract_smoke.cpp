#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/log_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
namespace common = chaosscore::tests::common;

namespace {

struct CliResult {
  int exit_code = 0;
  std::string out;
  std::string err;
};

CliResult RunCli(const std::vector<std::string>& args) {
  std::vector<std::string> argv_storage = {"chaosscore"};
  argv_storage.insert(argv_storage.end(), args.begin(), args.end());

  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
  const int exit_code = common::DispatchArgs(argv_storage);
  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);

  return {exit_code, captured_out.str(), captured_err.str()};
}

void ExpectExit(const CliResult& result, int expected, std::string_view context) {
  if (result.exit_code == expected) {
    return;
  }
  std::cerr << "stdout: " << result.out << "\nstderr: " << result.err << '\n';
  common::Fail(std::string(context) + ": unexpected exit code " +
               std::to_string(result.exit_code));
}

} // namespace

int main() {
  const fs::path root = common::CreateUniqueTempDir("chaosscore-cli-contract");
  const fs::path log_path = root / "session.log";
  common::WriteLogLines(log_path, common::MixedSessionLog());

  const CliResult help = RunCli({"--help"});
  ExpectExit(help, 0, "--help");
  common::AssertContains(help.out, "usage:");
  common::AssertContains(help.out, "--json-only | --md-only");

  const CliResult version = RunCli({"--version"});
  ExpectExit(version, 0, "--version");
  common::AssertContains(version.out, "chaosscore 1.0.0");

  const CliResult both_only = RunCli({"--json-only", "--md-only"});
  ExpectExit(both_only, 2, "--json-only --md-only");
  common::AssertContains(both_only.err, "cannot be combined");

  ExpectExit(RunCli({"--bogus"}), 2, "unknown flag");
  ExpectExit(RunCli({"stray"}), 2, "positional argument");
  ExpectExit(RunCli({"--log-file"}), 2, "missing value");
  ExpectExit(RunCli({"--log-level", "loud"}), 2, "invalid log level");

  // Full run into a directory that does not exist yet.
  const fs::path out_dir = root / "out" / "reports";
  const CliResult full = RunCli({"--log-file", log_path.string(), "--output-dir", out_dir.string(),
                                 "--log-level", "warn"});
  ExpectExit(full, 0, "full run");
  common::AssertContains(full.out, "grade: A");
  common::AssertContains(full.out, "resilience_score: 90.00/100");
  common::AssertContains(full.out, (out_dir / "resilience_report.json").string());
  common::AssertContains(full.out, (out_dir / "resilience_report.md").string());
  common::AssertNotContains(full.err, "level=INFO");
  if (!fs::exists(out_dir / "resilience_report.json") ||
      !fs::exists(out_dir / "resilience_report.md")) {
    common::Fail("expected both reports to be written");
  }

  const fs::path json_only_dir = root / "json_only";
  ExpectExit(RunCli({"--log-file", log_path.string(), "--output-dir", json_only_dir.string(),
                     "--json-only"}),
             0, "--json-only");
  if (!fs::exists(json_only_dir / "resilience_report.json") ||
      fs::exists(json_only_dir / "resilience_report.md")) {
    common::Fail("--json-only must write only the JSON report");
  }

  const fs::path md_only_dir = root / "md_only";
  ExpectExit(RunCli({"--log-file", log_path.string(), "--output-dir", md_only_dir.string(),
                     "--md-only"}),
             0, "--md-only");
  if (fs::exists(md_only_dir / "resilience_report.json") ||
      !fs::exists(md_only_dir / "resilience_report.md")) {
    common::Fail("--md-only must write only the Markdown report");
  }

  // A regular file where the output directory should be is a write failure.
  const fs::path blocked = root / "blocked";
  {
    std::ofstream blocker(blocked);
    blocker << "x";
  }
  const CliResult write_failure =
      RunCli({"--log-file", log_path.string(), "--output-dir", blocked.string()});
  ExpectExit(write_failure, 1, "blocked output dir");
  common::AssertContains(write_failure.err, "error:");

  // No log anywhere: soft condition, still exit 0 with N/A reports. Conventional
  // names resolve against the working directory, so run from an empty one.
  const fs::path empty_cwd = root / "empty_cwd";
  fs::create_directories(empty_cwd);
  const fs::path original_cwd = fs::current_path();
  fs::current_path(empty_cwd);
  const CliResult no_log = RunCli({"--log-dir", (empty_cwd / "logs").string(), "--output-dir",
                                   (empty_cwd / "reports").string()});
  fs::current_path(original_cwd);
  ExpectExit(no_log, 0, "no log file");
  common::AssertContains(no_log.out, "grade: N/A");
  common::AssertContains(no_log.out, "warning: No log file found");
  const std::string no_log_json =
      common::ReadFileToString(empty_cwd / "reports" / "resilience_report.json");
  common::AssertContains(no_log_json, "\"grade\": \"N/A\"");

  common::RemovePathBestEffort(root);
  std::cout << "cli_contract_smoke: ok\n";
  return 0;
}
