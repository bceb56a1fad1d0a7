#pragma once

#include <string>

namespace klm::config {

struct LogConfig {
  std::string backend = "log";
};

struct Config {
  /// Library repository root; empty means "not configured yet".
  std::string repo_path;
  /// UI executable handed the resolved repository and project directory.
  std::string ui_command = "kicad-library-manager-ui";
  int ipc_timeout_ms = 4000;
  /// Ancestor levels inspected per hint during repository auto-discovery.
  int search_depth = 8;
  LogConfig log;
};

} // namespace klm::config
