#pragma once

#include "klm/common/result.hpp"
#include "klm/config/schema.hpp"
#include "klm/diagnostics/boot_log.hpp"
#include "klm/host/host_client.hpp"
#include "klm/instance/exclusivity.hpp"
#include "klm/instance/liveness.hpp"
#include "klm/instance/process_descriptor.hpp"
#include "klm/instance/single_instance.hpp"
#include "klm/ui/toolkit.hpp"
#include "klm/workspace/config_store.hpp"
#include "klm/workspace/repo_root.hpp"
#include "klm/workspace/resolver.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace klm::app {

enum class ExitCode {
  Ok = 0,
  Precondition = 1,
  MissingDependency = 2,
};

using ToolkitFactory =
    std::function<common::Result<std::unique_ptr<ui::Toolkit>>(const config::Config &)>;
using HostClientFactory = std::function<common::Result<std::unique_ptr<host::HostClient>>(
    const host::HostEnvironment &)>;

/// Facts about this launch, captured once at startup.
struct ProcessFacts {
  long long pid = 0;
  std::vector<std::string> argv;
  std::filesystem::path cwd;
  std::filesystem::path executable;
  std::filesystem::path install_dir;
  host::HostEnvironment host_env;
};

struct Dependencies {
  ProcessFacts process;
  /// Holds the boot log, the descriptor and the lock artifact.
  std::filesystem::path cache_dir;
  std::string user_key;
  ToolkitFactory make_toolkit;
  HostClientFactory make_host_client;
  std::shared_ptr<instance::ExclusivityPrimitive> primitive;
  std::shared_ptr<workspace::ConfigStore> config_store;
  workspace::RepoRootPredicate is_repo_root = workspace::is_repo_root;
  instance::LivenessCheck is_alive = [](long long pid) { return instance::is_process_alive(pid); };
  bool install_crash_trace = true;
};

/// Real collaborators: dialog toolkit, socket host client, lock file,
/// TOML-backed config store, per-user cache directory.
[[nodiscard]] Dependencies default_dependencies(int argc, char **argv);

/// Startup sequence of the plugin process. Owns the single-instance lock
/// for as long as it lives.
class Bootstrap {
public:
  explicit Bootstrap(Dependencies deps);

  [[nodiscard]] ExitCode run();

  [[nodiscard]] const instance::LockHandle *lock() const { return lock_.get(); }
  [[nodiscard]] instance::InstanceState instance_state() const { return instance_state_; }
  [[nodiscard]] const std::optional<workspace::Resolution> &resolution() const {
    return resolution_;
  }
  [[nodiscard]] const std::string &project_dir() const { return project_dir_; }
  [[nodiscard]] const diagnostics::BootLog &boot_log() const { return boot_log_; }

private:
  void log_launch_facts();
  [[nodiscard]] config::Config load_config();
  [[nodiscard]] bool check_single_instance();
  void write_descriptor();
  [[nodiscard]] ExitCode fetch_project(std::string &start_path);
  [[nodiscard]] ExitCode open_main_window(const std::string &start_path);

  Dependencies deps_;
  diagnostics::BootLog boot_log_;
  instance::DescriptorStore descriptors_;
  config::Config config_;
  std::unique_ptr<ui::Toolkit> toolkit_;
  std::unique_ptr<host::HostClient> host_;
  std::unique_ptr<instance::LockHandle> lock_;
  instance::InstanceState instance_state_ = instance::InstanceState::Unchecked;
  std::optional<workspace::Resolution> resolution_;
  std::string project_dir_;
};

} // namespace klm::app
