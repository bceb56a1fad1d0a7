#include "klm/app/bootstrap.hpp"

#include "klm/common/json_util.hpp"
#include "klm/config/config.hpp"
#include "klm/diagnostics/crash_trace.hpp"
#include "klm/observability/factory.hpp"
#include "klm/observability/global.hpp"
#include "klm/platform/cache_dir.hpp"
#include "klm/platform/process.hpp"
#include "klm/ui/dialog_toolkit.hpp"

#include <chrono>

namespace klm::app {

namespace {

constexpr const char *IPC_FAILURE_MESSAGE =
    "Could not connect to KiCad via IPC.\n\n"
    "Make sure the IPC API server is enabled in KiCad settings.";
constexpr const char *NO_BOARD_MESSAGE =
    "No board is open in PCB Editor.\n\nOpen a PCB in pcbnew and run the plugin again.";

std::string quoted(const std::optional<std::string> &value) {
  return value.has_value() ? common::json_quote(*value) : "None";
}

std::string render_argv(const std::vector<std::string> &argv) {
  std::string out = "[";
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += common::json_quote(argv[i]);
  }
  out += "]";
  return out;
}

} // namespace

Dependencies default_dependencies(const int argc, char **argv) {
  Dependencies deps;
  deps.process.pid = platform::current_pid();
  deps.process.argv = platform::collect_args(argc, argv);
  deps.process.cwd = platform::current_dir();
  deps.process.executable = platform::executable_path();
  deps.process.install_dir = platform::install_dir();
  deps.process.host_env = host::HostEnvironment::from_process();
  deps.cache_dir = platform::plugin_cache_dir();
  deps.user_key = platform::user_key();
  deps.make_toolkit = [](const config::Config &config) {
    return ui::make_dialog_toolkit(config.ui_command);
  };
  deps.make_host_client = [](const host::HostEnvironment &env) {
    return host::make_kicad_api_client(env);
  };
  deps.primitive = std::make_shared<instance::LockFilePrimitive>();
  deps.config_store = std::make_shared<workspace::FileConfigStore>();
  return deps;
}

Bootstrap::Bootstrap(Dependencies deps)
    : deps_(std::move(deps)),
      boot_log_(deps_.cache_dir / platform::BOOT_LOG_FILENAME),
      descriptors_(deps_.cache_dir / platform::DESCRIPTOR_FILENAME) {}

void Bootstrap::log_launch_facts() {
  const auto &facts = deps_.process;
  boot_log_.append("=== plugin start ===");
  boot_log_.append("pid=" + std::to_string(facts.pid));
  boot_log_.append("argv=" + render_argv(facts.argv));
  boot_log_.append("cwd=" + common::json_quote(facts.cwd.string()));
  boot_log_.append("exe=" + common::json_quote(facts.executable.string()));
  boot_log_.append("KICAD_API_SOCKET=" + quoted(facts.host_env.socket));
  boot_log_.append(std::string("KICAD_API_TOKEN=") +
                   (facts.host_env.token.has_value() ? "set" : "missing"));
}

config::Config Bootstrap::load_config() {
  config::Config config;
  common::Status problem = common::Status::success();
  if (deps_.config_store != nullptr) {
    auto loaded = deps_.config_store->load();
    if (loaded.ok()) {
      config = loaded.take();
    } else {
      problem = loaded.status();
    }
  }
  config::apply_env_overrides(config);

  observability::set_global_observer(observability::create_observer(config, boot_log_));
  if (!problem.ok()) {
    observability::record_error("config", problem.error() + "; using defaults");
  }
  return config;
}

bool Bootstrap::check_single_instance() {
  if (deps_.primitive == nullptr) {
    observability::record_error("single_instance", "no exclusivity primitive; skipping check");
    instance_state_ = instance::InstanceState::CheckerUnavailable;
    return true;
  }

  instance::InstanceContext context{
      .primitive = *deps_.primitive,
      .descriptors = descriptors_,
      .lock_dir = deps_.cache_dir,
      .user_key = deps_.user_key,
      .notifier = toolkit_ != nullptr ? &toolkit_->notifier() : nullptr,
      .is_alive = deps_.is_alive,
  };
  instance::SingleInstanceCoordinator coordinator(std::move(context));
  auto outcome = coordinator.ensure_single();
  instance_state_ = outcome.state;
  lock_ = std::move(outcome.lock);
  return outcome.proceed;
}

void Bootstrap::write_descriptor() {
  const auto &facts = deps_.process;
  instance::ProcessDescriptor descriptor;
  descriptor.pid = facts.pid;
  descriptor.executable_path = facts.executable.string();
  descriptor.working_directory = facts.cwd.string();
  descriptor.launch_arguments = facts.argv;
  descriptor.ipc_socket_hint = facts.host_env.socket;

  if (auto written = descriptors_.write(descriptor); !written.ok()) {
    observability::record_error("descriptor", written.error());
    return;
  }
  observability::record_boot("descriptor=" + descriptors_.path().string());
}

ExitCode Bootstrap::fetch_project(std::string &start_path) {
  const auto timeout = std::chrono::milliseconds(config_.ipc_timeout_ms);
  auto board = host_->fetch_board(timeout);
  if (!board.ok()) {
    observability::record_error("ipc", "IPC connect failed: " + board.error());
    ui::show_error(toolkit_.get(), ui::APP_TITLE,
                   std::string(IPC_FAILURE_MESSAGE) + "\n\n" + board.error());
    return ExitCode::Precondition;
  }
  if (!board.value().has_value()) {
    observability::record_boot("no board open in the host editor");
    auto &notifier = toolkit_->notifier();
    notifier.show_message(ui::APP_TITLE, NO_BOARD_MESSAGE, ui::Severity::Warning);
    if (!notifier.has_top_level_windows()) {
      notifier.exit_main_loop();
    }
    return ExitCode::Precondition;
  }

  const auto &context = *board.value();
  start_path = !context.project_path.empty() ? context.project_path : context.board_name;
  project_dir_ = workspace::containing_dir(start_path).string();
  observability::record_boot("project_path=" + common::json_quote(context.project_path) +
                             " board_name=" + common::json_quote(context.board_name));
  return ExitCode::Ok;
}

ExitCode Bootstrap::open_main_window(const std::string &start_path) {
  std::string repo_path;
  if (deps_.config_store != nullptr) {
    workspace::WorkingDirectoryResolver resolver(*deps_.config_store, config_.search_depth,
                                                 deps_.is_repo_root);
    resolution_ = resolver.resolve(workspace::ResolverHints{
        .project_path = start_path,
        .working_dir = deps_.process.cwd.string(),
        .install_dir = deps_.process.install_dir.string(),
    });
    if (resolution_->found()) {
      repo_path = resolution_->path->string();
      observability::record_resolution(workspace::resolution_source_to_string(resolution_->source),
                                       repo_path);
    }
  }
  if (repo_path.empty()) {
    observability::record_boot("repo_path not found; opening UI in setup mode");
  }

  auto status = toolkit_->run_main_window(repo_path, project_dir_);
  if (!status.ok()) {
    observability::record_error("ui", status.error());
  } else {
    observability::record_boot("main loop exited with status " + std::to_string(status.value()));
  }
  return ExitCode::Ok;
}

ExitCode Bootstrap::run() {
  log_launch_facts();

  if (deps_.install_crash_trace) {
    if (auto fault_log = diagnostics::install_crash_trace(deps_.cache_dir); fault_log.has_value()) {
      boot_log_.append("fault_handler_log=" + common::json_quote(fault_log->string()));
    }
  }
  boot_log_.append("install_dir=" + common::json_quote(deps_.process.install_dir.string()));

  config_ = load_config();

  if (!deps_.make_toolkit) {
    observability::record_error("ui", "no GUI toolkit factory");
    ui::show_error(nullptr, ui::APP_TITLE, "No GUI toolkit is available in this environment.");
    return ExitCode::MissingDependency;
  }
  auto toolkit = deps_.make_toolkit(config_);
  if (!toolkit.ok()) {
    observability::record_error("ui", toolkit.error());
    ui::show_error(nullptr, ui::APP_TITLE,
                   "No GUI toolkit is available in this environment.\n\n" + toolkit.error());
    return ExitCode::MissingDependency;
  }
  toolkit_ = toolkit.take();

  auto host = deps_.make_host_client ? deps_.make_host_client(deps_.process.host_env)
                                     : common::Result<std::unique_ptr<host::HostClient>>::failure(
                                           "no IPC client factory");
  if (!host.ok()) {
    observability::record_error("ipc", host.error());
    ui::show_error(toolkit_.get(), ui::APP_TITLE,
                   "Missing dependency: KiCad IPC client.\n\n"
                   "This plugin uses KiCad's IPC API; " +
                       host.error());
    return ExitCode::MissingDependency;
  }
  host_ = host.take();

  if (auto created = toolkit_->create_application(); !created.ok()) {
    observability::record_error("ui", created.error());
    ui::show_error(toolkit_.get(), ui::APP_TITLE,
                   "Failed to start the application.\n\n" + created.error());
    return ExitCode::MissingDependency;
  }

  if (!check_single_instance()) {
    observability::record_boot("another instance detected; exiting");
    return ExitCode::Ok;
  }

  write_descriptor();

  std::string start_path;
  if (const auto code = fetch_project(start_path); code != ExitCode::Ok) {
    return code;
  }
  return open_main_window(start_path);
}

} // namespace klm::app
