#pragma once

#include "klm/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace klm::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);

/// Environment variable value, trimmed. Unset and blank are both nullopt.
[[nodiscard]] std::optional<std::string> env_value(const std::string &name);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
/// Leading `~` only. Used for values this program writes back itself.
[[nodiscard]] std::string expand_home(std::string value);
/// Leading `~` plus `$VAR` / `${VAR}` references.
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);

/// Writes through `<path>.tmp` and renames over the target.
[[nodiscard]] Status write_text_file_atomic(const std::filesystem::path &path,
                                            const std::string &content);

} // namespace klm::common
