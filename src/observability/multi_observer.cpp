#include "klm/observability/multi_observer.hpp"

#include <exception>
#include <iostream>

namespace klm::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  // A failing sink must not starve the others; the boot log sits last.
  for (auto &observer : observers_) {
    try {
      observer->record_event(event);
    } catch (const std::exception &ex) {
      std::cerr << "[WARN] observer " << observer->name() << " dropped an event: " << ex.what()
                << "\n";
    }
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    try {
      observer->flush();
    } catch (const std::exception &ex) {
      std::cerr << "[WARN] observer " << observer->name() << " failed to flush: " << ex.what()
                << "\n";
    }
  }
}

} // namespace klm::observability
