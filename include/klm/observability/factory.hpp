#pragma once

#include "klm/config/schema.hpp"
#include "klm/diagnostics/boot_log.hpp"
#include "klm/observability/observer.hpp"

#include <memory>
#include <optional>

namespace klm::observability {

/// Builds the sinks named by `log.backend` and, when given, always appends
/// the boot log sink.
[[nodiscard]] std::unique_ptr<IObserver>
create_observer(const config::Config &config,
                const std::optional<diagnostics::BootLog> &boot_log = std::nullopt);

} // namespace klm::observability
