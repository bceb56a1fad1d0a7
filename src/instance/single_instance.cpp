#include "klm/instance/single_instance.hpp"

#include "klm/observability/global.hpp"

#include <exception>
#include <vector>

namespace klm::instance {

namespace {

InstanceOutcome fail_open(const std::string &reason) {
  observability::record_error("single_instance", reason);
  InstanceOutcome outcome;
  outcome.proceed = true;
  outcome.state = InstanceState::CheckerUnavailable;
  return outcome;
}

} // namespace

std::string instance_state_to_string(const InstanceState state) {
  switch (state) {
  case InstanceState::Unchecked:
    return "unchecked";
  case InstanceState::LockHeld:
    return "lock_held";
  case InstanceState::Conflict:
    return "conflict";
  case InstanceState::RecoveredLockHeld:
    return "recovered_lock_held";
  case InstanceState::GenuineConflict:
    return "genuine_conflict";
  case InstanceState::CheckerUnavailable:
    return "checker_unavailable";
  }
  return "unknown";
}

SingleInstanceCoordinator::SingleInstanceCoordinator(InstanceContext context)
    : context_(std::move(context)) {}

std::string SingleInstanceCoordinator::lock_name(const std::string &user_key) {
  return "kicad_library_manager_single_instance_" + (user_key.empty() ? "user" : user_key);
}

std::string SingleInstanceCoordinator::conflict_message(const std::optional<long long> pid) {
  std::string message = "KiCad Library Manager is already running.\n\n"
                        "Close the existing window before launching it again.";
  if (pid.has_value() && *pid > 0) {
    message += "\n\nDetected running PID: " + std::to_string(*pid);
  }
  message += "\n\nIf you can't find the window, it may be hidden in the background.\n"
             "You can terminate it and try again.";
  return message;
}

InstanceOutcome SingleInstanceCoordinator::ensure_single() noexcept {
  try {
    auto outcome = run();
    observability::record_instance(instance_state_to_string(outcome.state), outcome.detected_pid);
    return outcome;
  } catch (const std::exception &ex) {
    return fail_open(std::string("single-instance check failed: ") + ex.what());
  }
}

InstanceOutcome SingleInstanceCoordinator::run() {
  const std::string name = lock_name(context_.user_key);

  auto first = context_.primitive.acquire(name, context_.lock_dir);
  if (!first.ok()) {
    return fail_open(first.error());
  }
  if (first.value().acquired()) {
    InstanceOutcome outcome;
    outcome.state = InstanceState::LockHeld;
    outcome.lock = std::move(first.value().handle);
    return outcome;
  }

  // Conflict: the pid in the lock file and the one in the descriptor are the
  // evidence. The lock is stale only when every known pid is dead.
  std::vector<long long> known;
  if (first.value().holder_pid.has_value()) {
    known.push_back(*first.value().holder_pid);
  }
  if (const auto existing = context_.descriptors.read(); existing.has_value()) {
    known.push_back(existing->pid);
  }
  if (known.empty()) {
    return genuine_conflict(std::nullopt);
  }
  for (const long long pid : known) {
    if (context_.is_alive(pid)) {
      return genuine_conflict(pid);
    }
  }
  const std::optional<long long> holder = known.front();

  observability::record_instance(instance_state_to_string(InstanceState::Conflict), holder);
  if (auto removed = context_.primitive.remove_artifact(name, context_.lock_dir); !removed.ok()) {
    observability::record_error("single_instance", removed.error());
  }
  if (auto removed = context_.descriptors.remove(); !removed.ok()) {
    observability::record_error("single_instance", removed.error());
  }

  auto retry = context_.primitive.acquire(name, context_.lock_dir);
  if (retry.ok() && retry.value().acquired()) {
    InstanceOutcome outcome;
    outcome.state = InstanceState::RecoveredLockHeld;
    outcome.detected_pid = holder;
    outcome.lock = std::move(retry.value().handle);
    return outcome;
  }
  if (!retry.ok()) {
    observability::record_error("single_instance", "stale lock retry failed: " + retry.error());
  }
  return genuine_conflict(holder);
}

InstanceOutcome SingleInstanceCoordinator::genuine_conflict(const std::optional<long long> pid) {
  if (context_.notifier != nullptr) {
    context_.notifier->show_message(ui::APP_TITLE, conflict_message(pid), ui::Severity::Info);
    if (!context_.notifier->has_top_level_windows()) {
      context_.notifier->exit_main_loop();
    }
  }

  InstanceOutcome outcome;
  outcome.proceed = false;
  outcome.state = InstanceState::GenuineConflict;
  outcome.detected_pid = pid;
  return outcome;
}

} // namespace klm::instance
