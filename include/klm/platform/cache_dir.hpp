#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace klm::platform {

enum class Platform {
  Windows,
  MacOS,
  Posix,
};

inline constexpr const char *PLUGIN_DIR_NAME = "kicad_library_manager";
inline constexpr const char *BOOT_LOG_FILENAME = "ipc_plugin_boot.log";
inline constexpr const char *DESCRIPTOR_FILENAME = "ipc_plugin_pid.json";
inline constexpr const char *FAULT_LOG_FILENAME = "ipc_plugin_faults.log";

/// Returns a trimmed, non-empty value or nullopt.
using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

[[nodiscard]] Platform host_platform();
[[nodiscard]] EnvLookup process_env();

/// Per-user cache root, before the plugin subdirectory is appended.
/// Precedence: XDG_CACHE_HOME, then the platform convention under `home`.
[[nodiscard]] std::filesystem::path cache_root_for(Platform platform, const EnvLookup &env,
                                                   const std::filesystem::path &home);

[[nodiscard]] std::filesystem::path cache_root();

/// `<cache_root>/kicad_library_manager`, created if missing. Creation
/// failures are swallowed; the path is returned either way.
[[nodiscard]] std::filesystem::path plugin_cache_dir();

[[nodiscard]] std::filesystem::path boot_log_path();
[[nodiscard]] std::filesystem::path descriptor_path();
[[nodiscard]] std::filesystem::path fault_log_path();

} // namespace klm::platform
