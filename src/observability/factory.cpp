#include "klm/observability/factory.hpp"

#include "klm/common/fs.hpp"
#include "klm/observability/boot_log_observer.hpp"
#include "klm/observability/log_observer.hpp"
#include "klm/observability/multi_observer.hpp"
#include "klm/observability/noop_observer.hpp"

#include <sstream>

namespace klm::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config,
                                           const std::optional<diagnostics::BootLog> &boot_log) {
  auto multi = std::make_unique<MultiObserver>();

  std::stringstream stream(common::to_lower(common::trim(config.log.backend)));
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string backend = common::trim(part);
    if (backend == "log" || backend == "stderr") {
      multi->add(std::make_unique<LogObserver>());
    }
  }

  if (boot_log.has_value()) {
    multi->add(std::make_unique<BootLogObserver>(*boot_log));
  }

  if (multi->size() == 0) {
    return std::make_unique<NoopObserver>();
  }
  return multi;
}

} // namespace klm::observability
