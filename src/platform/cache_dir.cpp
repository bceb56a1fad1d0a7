#include "klm/platform/cache_dir.hpp"

#include "klm/common/fs.hpp"
#include "klm/platform/process.hpp"

namespace klm::platform {

Platform host_platform() {
#if defined(_WIN32)
  return Platform::Windows;
#elif defined(__APPLE__)
  return Platform::MacOS;
#else
  return Platform::Posix;
#endif
}

EnvLookup process_env() {
  return [](const std::string &name) { return common::env_value(name); };
}

std::filesystem::path cache_root_for(const Platform platform, const EnvLookup &env,
                                     const std::filesystem::path &home) {
  if (auto xdg = env("XDG_CACHE_HOME"); xdg.has_value()) {
    return std::filesystem::path(*xdg);
  }

  switch (platform) {
  case Platform::Windows:
    if (auto local = env("LOCALAPPDATA"); local.has_value()) {
      return std::filesystem::path(*local);
    }
    if (auto roaming = env("APPDATA"); roaming.has_value()) {
      return std::filesystem::path(*roaming);
    }
    return home / "AppData" / "Local";
  case Platform::MacOS:
    return home / "Library" / "Caches";
  case Platform::Posix:
    break;
  }
  return home / ".cache";
}

std::filesystem::path cache_root() {
  return cache_root_for(host_platform(), process_env(), user_home());
}

std::filesystem::path plugin_cache_dir() {
  const auto dir = cache_root() / PLUGIN_DIR_NAME;
  (void)common::ensure_dir(dir);
  return dir;
}

std::filesystem::path boot_log_path() { return plugin_cache_dir() / BOOT_LOG_FILENAME; }

std::filesystem::path descriptor_path() { return plugin_cache_dir() / DESCRIPTOR_FILENAME; }

std::filesystem::path fault_log_path() { return plugin_cache_dir() / FAULT_LOG_FILENAME; }

} // namespace klm::platform
