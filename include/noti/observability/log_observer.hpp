#pragma once

#include "noti/observability/observer.hpp"

#include <iosfwd>

namespace noti::observability {

/// Writes one `[LEVEL] ...` line per event, under the shared console lock.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(const std::string &level, const std::string &message);

  std::ostream &out_;
};

} // namespace noti::observability
