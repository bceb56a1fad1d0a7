#pragma once

#include "klm/common/result.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace klm::instance {

/// Proof of holding a named exclusivity marker. Releasing is idempotent and
/// also happens on destruction.
class LockHandle {
public:
  virtual ~LockHandle() = default;

  virtual void release() = 0;
  [[nodiscard]] virtual bool held() const = 0;
  [[nodiscard]] virtual std::filesystem::path artifact() const = 0;
};

struct AcquireOutcome {
  /// Set when this process now holds the marker; null means already held.
  std::unique_ptr<LockHandle> handle;
  /// Pid the current holder recorded in the marker, when already held and
  /// readable.
  std::optional<long long> holder_pid;

  [[nodiscard]] bool acquired() const { return handle != nullptr; }
};

/// "acquire(name, scope) -> held | already-held". A failed Result means the
/// mechanism itself is unusable, which callers treat as fail-open.
class ExclusivityPrimitive {
public:
  virtual ~ExclusivityPrimitive() = default;

  [[nodiscard]] virtual common::Result<AcquireOutcome>
  acquire(const std::string &name, const std::filesystem::path &scope_dir) = 0;

  /// Deletes a marker left behind by a holder that is gone.
  [[nodiscard]] virtual common::Status remove_artifact(const std::string &name,
                                                       const std::filesystem::path &scope_dir) = 0;
};

/// Lock file created with O_CREAT|O_EXCL, holder pid inside. A crash leaves
/// the file behind; the coordinator recovers from it using the recorded pid
/// or the process descriptor.
class LockFilePrimitive final : public ExclusivityPrimitive {
public:
  [[nodiscard]] common::Result<AcquireOutcome>
  acquire(const std::string &name, const std::filesystem::path &scope_dir) override;

  [[nodiscard]] common::Status remove_artifact(const std::string &name,
                                               const std::filesystem::path &scope_dir) override;
};

class LockFileHandle final : public LockHandle {
public:
  LockFileHandle(std::filesystem::path path, long long owner_pid);
  ~LockFileHandle() override;

  LockFileHandle(const LockFileHandle &) = delete;
  LockFileHandle &operator=(const LockFileHandle &) = delete;

  void release() override;
  [[nodiscard]] bool held() const override { return held_; }
  [[nodiscard]] std::filesystem::path artifact() const override { return path_; }

private:
  std::filesystem::path path_;
  long long owner_pid_;
  bool held_ = true;
};

} // namespace klm::instance
