#include "noti/observability/log_observer.hpp"

#include "noti/common/console.hpp"

#include <iostream>
#include <type_traits>

namespace noti::observability {

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  common::write_console_line(out_, "[" + level + "] " + message);
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, DispatchStartEvent>) {
          log_line("DEBUG", "dispatch.start bytes=" + std::to_string(evt.message_bytes) +
                                " destinations=" + std::to_string(evt.destinations));
        } else if constexpr (std::is_same_v<T, DestinationResultEvent>) {
          if (evt.success) {
            log_line("INFO", "dispatch.sent destination=" + evt.destination +
                                 " duration_ms=" + std::to_string(evt.duration.count()));
          } else {
            log_line("WARN", "dispatch.failed destination=" + evt.destination +
                                 " error=" + evt.error);
          }
        } else if constexpr (std::is_same_v<T, StreamLineEvent>) {
          log_line("DEBUG", std::string("stream.line matched=") + (evt.matched ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(common::console_mutex());
  out_.flush();
}

} // namespace noti::observability
