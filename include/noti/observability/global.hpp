#pragma once

#include "noti/observability/observer.hpp"

#include <memory>

namespace noti::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);

void record_dispatch_start(std::size_t message_bytes, std::size_t destinations);
void record_destination_result(const std::string &destination, bool success,
                               const std::string &error, std::chrono::milliseconds duration);
void record_stream_line(bool matched);
void record_error(const std::string &component, const std::string &message);

} // namespace noti::observability
