#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace noti::observability {

struct DispatchStartEvent {
  std::size_t message_bytes = 0;
  std::size_t destinations = 0;
};

struct DestinationResultEvent {
  std::string destination;
  bool success = false;
  std::string error;
  std::chrono::milliseconds duration{0};
};

struct StreamLineEvent {
  bool matched = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<DispatchStartEvent, DestinationResultEvent, StreamLineEvent, ErrorEvent>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace noti::observability
