#pragma once

#include "klm/common/result.hpp"
#include "klm/config/schema.hpp"

#include <filesystem>
#include <optional>

namespace klm::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// File values only; what `save_config` may write back.
[[nodiscard]] common::Result<Config> load_config_file();
/// File values with the `KLM_*` environment overrides applied.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] std::string render_config(const Config &config);
[[nodiscard]] common::Status save_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace klm::config
