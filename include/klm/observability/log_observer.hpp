#pragma once

#include "klm/observability/observer.hpp"

namespace klm::observability {

class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

} // namespace klm::observability
