#pragma once

#include <filesystem>
#include <optional>

namespace klm::diagnostics {

/// Opens `<dir>/ipc_plugin_faults.log` up front and installs fatal-signal
/// handlers that dump a banner and backtrace into it before re-raising.
/// Returns the log path, or nullopt when nothing could be installed.
[[nodiscard]] std::optional<std::filesystem::path>
install_crash_trace(const std::filesystem::path &dir);

} // namespace klm::diagnostics
