#include "noti/observability/global.hpp"

#include <mutex>

namespace noti::observability {

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

void record_dispatch_start(const std::size_t message_bytes, const std::size_t destinations) {
  record_event(DispatchStartEvent{.message_bytes = message_bytes, .destinations = destinations});
}

void record_destination_result(const std::string &destination, const bool success,
                               const std::string &error, std::chrono::milliseconds duration) {
  record_event(DestinationResultEvent{
      .destination = destination, .success = success, .error = error, .duration = duration});
}

void record_stream_line(const bool matched) { record_event(StreamLineEvent{.matched = matched}); }

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace noti::observability
