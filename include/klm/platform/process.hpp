#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace klm::platform {

[[nodiscard]] long long current_pid();

/// Absolute path of the running executable; empty when the OS will not say.
[[nodiscard]] std::filesystem::path executable_path();

/// Directory holding the executable, or the current directory as a fallback.
[[nodiscard]] std::filesystem::path install_dir();

[[nodiscard]] std::filesystem::path current_dir();

/// Home directory, falling back to the temp directory when none is known.
[[nodiscard]] std::filesystem::path user_home();

/// Stable per-account key: numeric uid on POSIX, else USERNAME/USER, else "user".
[[nodiscard]] std::string user_key();

[[nodiscard]] std::vector<std::string> collect_args(int argc, char **argv);

} // namespace klm::platform
