#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/utf8_utils.hpp"

#include "common/temp_dir.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace core = chaosscore::core;
namespace common = chaosscore::tests::common;

TEST_CASE("Well-formed UTF-8 is copied unchanged", "[core][utf8]") {
  const std::string text = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80 plain";
  REQUIRE(core::ReplaceInvalidUtf8(text) == text);
}

TEST_CASE("Each invalid byte becomes one replacement character", "[core][utf8]") {
  REQUIRE(core::ReplaceInvalidUtf8("caf\xE9") == "caf\xEF\xBF\xBD");
  REQUIRE(core::ReplaceInvalidUtf8("book\xFF") == "book\xEF\xBF\xBD");
  REQUIRE(core::ReplaceInvalidUtf8("\x80x") == "\xEF\xBF\xBDx");
  // Overlong slash and a lone surrogate.
  REQUIRE(core::ReplaceInvalidUtf8("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");
  REQUIRE(core::ReplaceInvalidUtf8("\xED\xA0\x80") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
  // Truncated three-byte sequence at the end of the input.
  REQUIRE(core::ReplaceInvalidUtf8("ok\xE2\x82") == "ok\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_CASE("JSON escaping never emits invalid UTF-8", "[core][utf8]") {
  REQUIRE(core::EscapeJson("POST http://mock/book\xFF") == "POST http://mock/book\xEF\xBF\xBD");
  REQUIRE(core::QuoteJson("\"caf\xE9\"") == "\"\\\"caf\xEF\xBF\xBD\\\"\"");
}

TEST_CASE("Log lines are read as UTF-8 with replacement", "[core][utf8]") {
  const std::filesystem::path root = common::CreateUniqueTempDir("chaosscore-utf8-read");
  const std::filesystem::path log_path = root / "latin1.log";
  {
    std::ofstream out(log_path, std::ios::binary);
    out << "Error caf\xE9 timeout\r\n"
        << "Response: 200\n";
  }

  std::vector<std::string> lines;
  std::string error;
  REQUIRE(core::ReadTextFileLines(log_path, lines, error));
  REQUIRE(lines == std::vector<std::string>{"Error caf\xEF\xBF\xBD timeout", "Response: 200"});

  common::RemovePathBestEffort(root);
}
