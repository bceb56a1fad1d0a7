#pragma once

#include "klm/diagnostics/boot_log.hpp"
#include "klm/observability/observer.hpp"

namespace klm::observability {

/// Mirrors every event into the on-disk boot log.
class BootLogObserver final : public IObserver {
public:
  explicit BootLogObserver(diagnostics::BootLog log);

  void record_event(const ObserverEvent &event) override;
  [[nodiscard]] std::string_view name() const override { return "boot_log"; }

private:
  diagnostics::BootLog log_;
};

} // namespace klm::observability
