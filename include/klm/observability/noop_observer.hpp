#pragma once

#include "klm/observability/observer.hpp"

namespace klm::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace klm::observability
