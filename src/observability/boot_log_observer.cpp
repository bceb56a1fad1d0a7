#include "klm/observability/boot_log_observer.hpp"

namespace klm::observability {

BootLogObserver::BootLogObserver(diagnostics::BootLog log) : log_(std::move(log)) {}

void BootLogObserver::record_event(const ObserverEvent &event) {
  log_.append(describe_event(event));
}

} // namespace klm::observability
