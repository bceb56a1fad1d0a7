#include "klm/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace klm::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

std::string describe_event(const ObserverEvent &event) {
  return std::visit(
      [](auto &&evt) -> std::string {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, BootPhaseEvent>) {
          return evt.message;
        } else if constexpr (std::is_same_v<T, InstanceEvent>) {
          std::string line = "instance state=" + evt.state;
          if (evt.pid.has_value()) {
            line += " pid=" + std::to_string(*evt.pid);
          }
          return line;
        } else if constexpr (std::is_same_v<T, ResolutionEvent>) {
          return "repo_path=" + (evt.path.empty() ? std::string("<none>") : evt.path) +
                 " source=" + evt.source;
        } else {
          return "error " + evt.component + ": " + evt.message;
        }
      },
      event);
}

void LogObserver::record_event(const ObserverEvent &event) {
  const bool is_error = std::holds_alternative<ErrorEvent>(event);
  log_line(is_error ? "ERROR" : "INFO", describe_event(event));
}

} // namespace klm::observability
