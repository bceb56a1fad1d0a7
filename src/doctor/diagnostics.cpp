#include "klm/doctor/diagnostics.hpp"

#include "klm/common/fs.hpp"
#include "klm/instance/process_descriptor.hpp"
#include "klm/instance/single_instance.hpp"
#include "klm/platform/cache_dir.hpp"

#include <fstream>
#include <ostream>

namespace klm::doctor {

namespace {

void add_check(DiagnosticsReport &report, DiagnosticCheck check) {
  switch (check.status) {
  case CheckStatus::Pass:
    ++report.passed;
    break;
  case CheckStatus::Fail:
    ++report.failed;
    break;
  case CheckStatus::Warn:
    ++report.warnings;
    break;
  }
  report.checks.push_back(std::move(check));
}

DiagnosticCheck check_cache_dir(const std::filesystem::path &dir) {
  DiagnosticCheck check;
  check.name = "Cache directory";
  if (auto created = common::ensure_dir(dir); !created.ok()) {
    check.status = CheckStatus::Fail;
    check.message = created.error();
    return check;
  }

  const auto scratch = dir / ".doctor_write_test";
  {
    std::ofstream out(scratch, std::ios::trunc);
    out << "ok";
    if (!out) {
      check.status = CheckStatus::Fail;
      check.message = "not writable: " + dir.string();
      return check;
    }
  }
  std::error_code ec;
  std::filesystem::remove(scratch, ec);
  check.message = dir.string();
  return check;
}

DiagnosticCheck check_config(const DoctorInputs &inputs) {
  DiagnosticCheck check;
  check.name = "Config";
  if (!inputs.config_error.empty()) {
    check.status = CheckStatus::Fail;
    check.message = inputs.config_error;
    return check;
  }
  check.message = "loaded (ui_command=" + inputs.config.ui_command +
                  ", ipc_timeout_ms=" + std::to_string(inputs.config.ipc_timeout_ms) + ")";
  return check;
}

DiagnosticCheck check_lock(const DoctorInputs &inputs) {
  DiagnosticCheck check;
  check.name = "Instance lock";
  const auto path =
      inputs.cache_dir / instance::SingleInstanceCoordinator::lock_name(inputs.user_key);

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    check.message = "free";
    return check;
  }

  auto content = common::read_text_file(path);
  const std::string pid_text = content.ok() ? common::trim(content.value()) : "";
  const auto pid = instance::parse_pid(pid_text);
  if (pid.has_value() && inputs.is_alive(*pid)) {
    check.message = "held by running PID " + pid_text;
    return check;
  }
  check.status = CheckStatus::Warn;
  check.message = "stale lock file " + path.string() + " (holder '" + pid_text +
                  "' is not running); the next launch recovers it";
  return check;
}

DiagnosticCheck check_descriptor(const DoctorInputs &inputs) {
  DiagnosticCheck check;
  check.name = "Process descriptor";
  const instance::DescriptorStore store(inputs.cache_dir / platform::DESCRIPTOR_FILENAME);

  std::error_code ec;
  if (!std::filesystem::exists(store.path(), ec)) {
    check.message = "none";
    return check;
  }
  const auto descriptor = store.read();
  if (!descriptor.has_value()) {
    check.status = CheckStatus::Warn;
    check.message = "unreadable: " + store.path().string();
    return check;
  }
  check.message = "pid " + std::to_string(descriptor->pid) +
                  (inputs.is_alive(descriptor->pid) ? " (running)" : " (not running)");
  return check;
}

DiagnosticCheck check_repo_path(const DoctorInputs &inputs) {
  DiagnosticCheck check;
  check.name = "Library repository";
  const std::string repo = common::trim(inputs.config.repo_path);
  if (repo.empty()) {
    check.status = CheckStatus::Warn;
    check.message = "repo_path not configured; discovered on next launch";
    return check;
  }
  if (!inputs.is_repo_root(repo)) {
    check.status = CheckStatus::Fail;
    check.message = "repo_path is not a library repository: " + repo;
    return check;
  }
  check.message = repo;
  return check;
}

DiagnosticCheck check_host_socket(const DoctorInputs &inputs) {
  DiagnosticCheck check;
  check.name = "KiCad IPC socket";
  const auto socket = host::socket_path_from_address(inputs.host_env.socket);
  if (!socket.has_value()) {
    check.status = CheckStatus::Fail;
    check.message = "unsupported KICAD_API_SOCKET address: " + inputs.host_env.socket.value_or("");
    return check;
  }
  std::error_code ec;
  if (!std::filesystem::exists(*socket, ec)) {
    check.status = CheckStatus::Warn;
    check.message = socket->string() + " not found (is the IPC API server enabled?)";
    return check;
  }
  check.message = socket->string();
  return check;
}

} // namespace

DiagnosticsReport run_diagnostics(const DoctorInputs &inputs) {
  DiagnosticsReport report;
  add_check(report, check_cache_dir(inputs.cache_dir));
  add_check(report, check_config(inputs));
  add_check(report, check_lock(inputs));
  add_check(report, check_descriptor(inputs));
  add_check(report, check_repo_path(inputs));
  add_check(report, check_host_socket(inputs));
  return report;
}

void print_diagnostics_report(const DiagnosticsReport &report, std::ostream &out) {
  auto status_prefix = [](CheckStatus status) -> const char * {
    switch (status) {
    case CheckStatus::Pass:
      return "[PASS]";
    case CheckStatus::Fail:
      return "[FAIL]";
    case CheckStatus::Warn:
      return "[WARN]";
    }
    return "[INFO]";
  };

  for (const auto &check : report.checks) {
    out << status_prefix(check.status) << " " << check.name << ": " << check.message << "\n";
  }
  out << "Summary: " << report.passed << " passed, " << report.failed << " failed, "
      << report.warnings << " warnings\n";
}

} // namespace klm::doctor
