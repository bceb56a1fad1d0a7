#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace klm::observability {

struct BootPhaseEvent {
  std::string message;
};

struct InstanceEvent {
  std::string state;
  std::optional<long long> pid;
};

struct ResolutionEvent {
  std::string source;
  std::string path;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<BootPhaseEvent, InstanceEvent, ResolutionEvent, ErrorEvent>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// One-line rendering shared by the stderr and boot-log sinks.
[[nodiscard]] std::string describe_event(const ObserverEvent &event);

} // namespace klm::observability
