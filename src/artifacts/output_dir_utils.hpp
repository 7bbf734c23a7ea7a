#ifndef CHAOSSCORE_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
#define CHAOSSCORE_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_

#include <filesystem>
#include <string>
#include <system_error>

namespace chaosscore::artifacts {

// Creates the report directory (and parents) when missing. Both report
// writers share this so their error text matches.
inline bool EnsureOutputDir(const std::filesystem::path& output_dir, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + output_dir.string() + "': " + ec.message();
    return false;
  }
  if (!std::filesystem::is_directory(output_dir, ec)) {
    error = "output path is not a directory: '" + output_dir.string() + "'";
    return false;
  }
  return true;
}

} // namespace chaosscore::artifacts

#endif // CHAOSSCORE_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
