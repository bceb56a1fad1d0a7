#include "test_framework.hpp"

#include "klm/platform/cache_dir.hpp"
#include "klm/platform/process.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <map>

namespace {

klm::platform::EnvLookup fake_env(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const std::string &name) -> std::optional<std::string> {
    const auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

} // namespace

void register_platform_tests(std::vector<klm::tests::TestCase> &tests) {
  using klm::tests::require;
  namespace pf = klm::platform;
  namespace kt = klm::testing;

  tests.push_back({"cache_root_prefers_xdg_on_every_platform", [] {
                     const auto env = fake_env({{"XDG_CACHE_HOME", "/xdg/cache"},
                                                {"LOCALAPPDATA", "C:/Local"}});
                     for (const auto platform :
                          {pf::Platform::Windows, pf::Platform::MacOS, pf::Platform::Posix}) {
                       require(pf::cache_root_for(platform, env, "/home/u") == "/xdg/cache",
                               "XDG_CACHE_HOME should win");
                     }
                   }});

  tests.push_back({"cache_root_windows_fallback_chain", [] {
                     const std::filesystem::path home = "C:/Users/u";
                     require(pf::cache_root_for(pf::Platform::Windows,
                                                fake_env({{"LOCALAPPDATA", "C:/Local"},
                                                          {"APPDATA", "C:/Roaming"}}),
                                                home) == "C:/Local",
                             "LOCALAPPDATA first");
                     require(pf::cache_root_for(pf::Platform::Windows,
                                                fake_env({{"APPDATA", "C:/Roaming"}}), home) ==
                                 "C:/Roaming",
                             "APPDATA second");
                     require(pf::cache_root_for(pf::Platform::Windows, fake_env({}), home) ==
                                 home / "AppData" / "Local",
                             "home AppData/Local last");
                   }});

  tests.push_back({"cache_root_macos_and_posix_defaults", [] {
                     const std::filesystem::path home = "/home/u";
                     require(pf::cache_root_for(pf::Platform::MacOS, fake_env({}), home) ==
                                 home / "Library" / "Caches",
                             "macOS uses Library/Caches");
                     require(pf::cache_root_for(pf::Platform::Posix, fake_env({}), home) ==
                                 home / ".cache",
                             "posix uses ~/.cache");
                     require(pf::cache_root_for(pf::Platform::Posix,
                                                fake_env({{"LOCALAPPDATA", "/ignored"}}), home) ==
                                 home / ".cache",
                             "windows variables ignored on posix");
                   }});

  tests.push_back({"plugin_cache_dir_created_under_home_cache", [] {
                     const kt::TempDir home;
                     const kt::EnvGuard env_home("HOME", home.path().string());
                     const kt::EnvGuard env_xdg("XDG_CACHE_HOME", std::nullopt);
                     if (pf::host_platform() != pf::Platform::Posix) {
                       return;
                     }

                     const auto dir = pf::plugin_cache_dir();
                     require(dir == home.path() / ".cache" / "kicad_library_manager",
                             "unexpected cache dir: " + dir.string());
                     require(std::filesystem::is_directory(dir), "cache dir not created");
                     require(pf::boot_log_path() == dir / "ipc_plugin_boot.log",
                             "boot log path mismatch");
                     require(pf::descriptor_path() == dir / "ipc_plugin_pid.json",
                             "descriptor path mismatch");
                   }});

  tests.push_back({"plugin_cache_dir_honours_xdg_override", [] {
                     const kt::TempDir root;
                     const kt::EnvGuard env_xdg("XDG_CACHE_HOME", root.path().string());
                     const auto dir = pf::plugin_cache_dir();
                     require(dir == root.path() / "kicad_library_manager", "xdg not honoured");
                     require(std::filesystem::is_directory(dir), "cache dir not created");
                   }});

  tests.push_back({"plugin_cache_dir_survives_uncreatable_root", [] {
                     const kt::TempDir root;
                     const auto blocker = root.create_file("not_a_dir", "x");
                     const kt::EnvGuard env_xdg("XDG_CACHE_HOME", blocker.string());
                     const auto dir = pf::plugin_cache_dir();
                     require(dir == blocker / "kicad_library_manager",
                             "path should still be returned");
                     require(!std::filesystem::exists(dir), "directory cannot exist here");
                   }});

  tests.push_back({"process_facts_are_populated", [] {
                     require(pf::current_pid() > 0, "pid should be positive");
                     require(!pf::user_key().empty(), "user key empty");
                     require(!pf::current_dir().empty(), "cwd empty");
                     require(!pf::install_dir().empty(), "install dir empty");

                     char arg0[] = "launcher";
                     char arg1[] = "--flag";
                     char *argv[] = {arg0, arg1};
                     const auto args = pf::collect_args(2, argv);
                     require(args.size() == 2 && args[1] == "--flag", "args mismatch");
                   }});
}
