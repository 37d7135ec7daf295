#pragma once

#include "noti/observability/observer.hpp"

namespace noti::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace noti::observability
