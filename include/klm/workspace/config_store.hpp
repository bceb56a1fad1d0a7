#pragma once

#include "klm/common/result.hpp"
#include "klm/config/schema.hpp"

namespace klm::workspace {

/// Where the persisted `repo_path` lives. The resolver only reads it and
/// fills it in when empty.
class ConfigStore {
public:
  virtual ~ConfigStore() = default;

  [[nodiscard]] virtual common::Result<config::Config> load() = 0;
  [[nodiscard]] virtual common::Status save(const config::Config &config) = 0;
};

/// Backed by the TOML file from `config::config_path()`. Loads without the
/// environment overrides so a save never persists them.
class FileConfigStore final : public ConfigStore {
public:
  [[nodiscard]] common::Result<config::Config> load() override;
  [[nodiscard]] common::Status save(const config::Config &config) override;
};

} // namespace klm::workspace
