#pragma once

#include "klm/instance/exclusivity.hpp"
#include "klm/instance/liveness.hpp"
#include "klm/instance/process_descriptor.hpp"
#include "klm/ui/toolkit.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace klm::instance {

enum class InstanceState {
  Unchecked,
  LockHeld,
  Conflict,
  RecoveredLockHeld,
  GenuineConflict,
  CheckerUnavailable,
};

[[nodiscard]] std::string instance_state_to_string(InstanceState state);

struct InstanceContext {
  ExclusivityPrimitive &primitive;
  const DescriptorStore &descriptors;
  /// Directory holding the lock artifact, next to the descriptor.
  std::filesystem::path lock_dir;
  std::string user_key;
  /// May be null; a conflict is then only logged.
  ui::Notifier *notifier = nullptr;
  LivenessCheck is_alive = [](long long pid) { return is_process_alive(pid); };
};

struct InstanceOutcome {
  bool proceed = true;
  InstanceState state = InstanceState::Unchecked;
  /// Holder pid read from the lock or the descriptor during a conflict.
  std::optional<long long> detected_pid;
  /// Held for the life of the process when the lock was obtained.
  std::unique_ptr<LockHandle> lock;
};

/// One instance per OS user account. On conflict the pid recorded in the lock,
/// the descriptor and the liveness check decide between a stale lock (recover
/// once, proceed) and a live holder (notify, do not proceed). Any internal
/// failure proceeds.
///
/// Known race: another launch can take the lock between the stale-lock
/// cleanup and the retry; this launch then reports a conflict.
class SingleInstanceCoordinator {
public:
  explicit SingleInstanceCoordinator(InstanceContext context);

  [[nodiscard]] InstanceOutcome ensure_single() noexcept;

  [[nodiscard]] static std::string lock_name(const std::string &user_key);
  [[nodiscard]] static std::string conflict_message(std::optional<long long> pid);

private:
  [[nodiscard]] InstanceOutcome run();
  [[nodiscard]] InstanceOutcome genuine_conflict(std::optional<long long> pid);

  InstanceContext context_;
};

} // namespace klm::instance
