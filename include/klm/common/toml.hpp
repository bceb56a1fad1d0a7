#pragma once

#include "klm/common/result.hpp"

#include <string>
#include <unordered_map>

namespace klm::common {

struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace klm::common
