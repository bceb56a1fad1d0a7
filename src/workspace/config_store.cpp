#include "klm/workspace/config_store.hpp"

#include "klm/config/config.hpp"

namespace klm::workspace {

common::Result<config::Config> FileConfigStore::load() { return config::load_config_file(); }

common::Status FileConfigStore::save(const config::Config &config) {
  return config::save_config(config);
}

} // namespace klm::workspace
