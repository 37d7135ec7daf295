#include "noti/observability/factory.hpp"

#include "noti/common/strings.hpp"
#include "noti/observability/log_observer.hpp"
#include "noti/observability/noop_observer.hpp"

namespace noti::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "log") {
    return std::make_unique<LogObserver>();
  }
  return std::make_unique<NoopObserver>();
}

} // namespace noti::observability
