#include "chaosscore/cli/router.hpp"

int main(int argc, char** argv) {
  // Parsing, output and exit codes all live in the CLI router.
  return chaosscore::cli::Dispatch(argc, argv);
}
