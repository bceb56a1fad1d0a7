#include "klm/cli/commands.hpp"

#include "klm/app/bootstrap.hpp"
#include "klm/common/fs.hpp"
#include "klm/config/config.hpp"
#include "klm/doctor/diagnostics.hpp"
#include "klm/platform/cache_dir.hpp"
#include "klm/platform/process.hpp"

#include <iostream>

namespace klm::cli {

namespace {

void print_help() {
  std::cout << "kicad-library-manager - KiCad Library Manager plugin launcher\n\n"
            << "Usage: kicad-library-manager [options]\n\n"
            << "With no options the launcher connects to the running KiCad instance,\n"
            << "locates the library repository and opens the Library Manager window.\n\n"
            << "Options:\n"
            << "  --config <path>   Use this config file (or directory)\n"
            << "  --config-path     Print the config file location\n"
            << "  --doctor          Check cache, lock, descriptor, config and IPC socket\n"
            << "  -V, --version     Print the version\n"
            << "  -h, --help        Show this help\n";
}

int run_doctor() {
  doctor::DoctorInputs inputs;
  inputs.cache_dir = platform::plugin_cache_dir();
  inputs.user_key = platform::user_key();
  inputs.host_env = host::HostEnvironment::from_process();
  auto loaded = config::load_config();
  if (loaded.ok()) {
    inputs.config = loaded.take();
  } else {
    inputs.config_error = loaded.error();
  }

  const auto report = doctor::run_diagnostics(inputs);
  doctor::print_diagnostics_report(report, std::cout);
  return report.failed == 0 ? 0 : 1;
}

} // namespace

std::string version_string() {
#ifdef KLM_VERSION
  std::string version = KLM_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef KLM_GIT_COMMIT
  const std::string commit = KLM_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "kicad-library-manager " + version;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = platform::collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (take_flag(args, "--help") || take_flag(args, "-h")) {
    print_help();
    return 0;
  }
  if (take_flag(args, "--version") || take_flag(args, "-V")) {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (take_flag(args, "--config-path")) {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (take_flag(args, "--doctor")) {
    return run_doctor();
  }

  app::Bootstrap bootstrap(app::default_dependencies(argc, argv));
  return static_cast<int>(bootstrap.run());
}

} // namespace klm::cli
