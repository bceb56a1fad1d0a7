#pragma once

#include "klm/observability/observer.hpp"

#include <memory>

namespace klm::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);

void record_boot(const std::string &message);
void record_instance(const std::string &state, std::optional<long long> pid = std::nullopt);
void record_resolution(const std::string &source, const std::string &path);
void record_error(const std::string &component, const std::string &message);

} // namespace klm::observability
