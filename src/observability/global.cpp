#include "klm/observability/global.hpp"

#include <mutex>

namespace klm::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_boot(const std::string &message) { record_event(BootPhaseEvent{.message = message}); }

void record_instance(const std::string &state, const std::optional<long long> pid) {
  record_event(InstanceEvent{.state = state, .pid = pid});
}

void record_resolution(const std::string &source, const std::string &path) {
  record_event(ResolutionEvent{.source = source, .path = path});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace klm::observability
