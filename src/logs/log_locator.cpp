#include "logs/log_locator.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace chaosscore::logs {

const std::vector<std::string_view>& ConventionalLogNames() {
  static const std::vector<std::string_view> kNames = {
      "proxy.log",
      "chaos_proxy.log",
      "proxy_logs.txt",
      "logs/proxy.log",
      "logs/chaos_proxy.log",
  };
  return kNames;
}

std::optional<fs::path> LocateLogFile(const LocateRequest& request) {
  std::error_code ec;

  if (request.explicit_path.has_value() && !request.explicit_path->empty()) {
    if (fs::exists(request.explicit_path.value(), ec) && !ec) {
      return request.explicit_path;
    }
  }

  for (const std::string_view name : ConventionalLogNames()) {
    const fs::path candidate =
        request.search_root.empty() ? fs::path(name) : request.search_root / fs::path(name);
    ec.clear();
    if (fs::exists(candidate, ec) && !ec) {
      return candidate;
    }
  }

  ec.clear();
  if (request.log_dir.empty() || !fs::is_directory(request.log_dir, ec) || ec) {
    return std::nullopt;
  }

  fs::directory_iterator it(request.log_dir, ec);
  if (ec) {
    return std::nullopt;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      return std::nullopt;
    }
    const fs::directory_entry& entry = *it;
    std::error_code entry_ec;
    if (entry.path().extension() == ".log" && entry.is_regular_file(entry_ec) && !entry_ec) {
      return entry.path();
    }
  }

  return std::nullopt;
}

} // namespace chaosscore::logs
