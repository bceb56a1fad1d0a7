#include "klm/config/config.hpp"

#include "klm/common/fs.hpp"
#include "klm/common/toml.hpp"
#include "klm/platform/cache_dir.hpp"
#include "klm/platform/process.hpp"

#include <charconv>
#include <sstream>

namespace klm::config {

namespace {

constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr int MIN_IPC_TIMEOUT_MS = 250;
constexpr int MAX_IPC_TIMEOUT_MS = 30000;
constexpr int MAX_SEARCH_DEPTH = 64;
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (auto env = common::env_value("KLM_CONFIG_PATH"); env.has_value()) {
    return std::filesystem::path(common::expand_path(*env));
  }
  return std::nullopt;
}

std::filesystem::path default_config_root() {
  const auto home = platform::user_home();
  if (auto xdg = common::env_value("XDG_CONFIG_HOME"); xdg.has_value()) {
    return std::filesystem::path(*xdg);
  }
  switch (platform::host_platform()) {
  case platform::Platform::Windows:
    if (auto appdata = common::env_value("APPDATA"); appdata.has_value()) {
      return std::filesystem::path(*appdata);
    }
    return home / "AppData" / "Roaming";
  case platform::Platform::MacOS:
    return home / "Library" / "Application Support";
  case platform::Platform::Posix:
    break;
  }
  return home / ".config";
}

int clamp_timeout(const int value) {
  if (value < MIN_IPC_TIMEOUT_MS) {
    return MIN_IPC_TIMEOUT_MS;
  }
  return value > MAX_IPC_TIMEOUT_MS ? MAX_IPC_TIMEOUT_MS : value;
}

int clamp_depth(const int value) {
  if (value < 0) {
    return 0;
  }
  return value > MAX_SEARCH_DEPTH ? MAX_SEARCH_DEPTH : value;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  return common::ensure_dir(default_config_root() / platform::PLUGIN_DIR_NAME);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  if (!path.ok()) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_regular_file(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void apply_env_overrides(Config &config) {
  if (auto ui = common::env_value("KLM_UI_COMMAND"); ui.has_value()) {
    config.ui_command = *ui;
  }

  if (auto timeout = common::env_value("KLM_IPC_TIMEOUT_MS"); timeout.has_value()) {
    int parsed = 0;
    const auto *first = timeout->data();
    const auto *last = first + timeout->size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec == std::errc() && ptr == last) {
      config.ipc_timeout_ms = clamp_timeout(parsed);
    }
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.repo_path = common::trim(doc.get_string("repo_path", config.repo_path));
  if (!config.repo_path.empty()) {
    config.repo_path = common::expand_home(config.repo_path);
  }
  config.ui_command = doc.get_string("ui_command", config.ui_command);
  config.ipc_timeout_ms = clamp_timeout(doc.get_int("ipc_timeout_ms", config.ipc_timeout_ms));
  config.search_depth = clamp_depth(doc.get_int("search_depth", config.search_depth));
  config.log.backend = doc.get_string("log.backend", config.log.backend);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config_file() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<Config>::success(Config{});
  }

  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  return config;
}

common::Result<Config> load_config() {
  auto config = load_config_file();
  if (config.ok()) {
    apply_env_overrides(config.value());
  }
  return config;
}

std::string render_config(const Config &config) {
  std::ostringstream file;
  file << "repo_path = " << common::quote_toml_string(config.repo_path) << "\n";
  file << "ui_command = " << common::quote_toml_string(config.ui_command) << "\n";
  file << "ipc_timeout_ms = " << config.ipc_timeout_ms << "\n";
  file << "search_depth = " << config.search_depth << "\n";
  file << "\n[log]\n";
  file << "backend = " << common::quote_toml_string(config.log.backend) << "\n";
  return file.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }
  return common::write_text_file_atomic(cfg_path_result.value(), render_config(config));
}

} // namespace klm::config
