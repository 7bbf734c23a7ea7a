#ifndef CHAOSSCORE_TESTS_COMMON_CLI_DISPATCH_HPP_
#define CHAOSSCORE_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "chaosscore/cli/router.hpp"

#include <string>
#include <vector>

namespace chaosscore::tests::common {

// `argv_storage` includes the program name as element 0.
inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return chaosscore::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

} // namespace chaosscore::tests::common

#endif // CHAOSSCORE_TESTS_COMMON_CLI_DISPATCH_HPP_
