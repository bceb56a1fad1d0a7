#pragma once

#include "klm/config/schema.hpp"
#include "klm/host/host_client.hpp"
#include "klm/instance/liveness.hpp"
#include "klm/workspace/repo_root.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace klm::doctor {

enum class CheckStatus {
  Pass,
  Fail,
  Warn,
};

struct DiagnosticCheck {
  std::string name;
  CheckStatus status = CheckStatus::Pass;
  std::string message;
};

struct DiagnosticsReport {
  std::vector<DiagnosticCheck> checks;
  int passed = 0;
  int failed = 0;
  int warnings = 0;
};

struct DoctorInputs {
  std::filesystem::path cache_dir;
  std::string user_key;
  config::Config config;
  /// Non-empty when the configuration file could not be loaded.
  std::string config_error;
  host::HostEnvironment host_env;
  instance::LivenessCheck is_alive = [](long long pid) { return instance::is_process_alive(pid); };
  workspace::RepoRootPredicate is_repo_root = workspace::is_repo_root;
};

[[nodiscard]] DiagnosticsReport run_diagnostics(const DoctorInputs &inputs);
void print_diagnostics_report(const DiagnosticsReport &report, std::ostream &out);

} // namespace klm::doctor
