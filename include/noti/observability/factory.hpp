#pragma once

#include "noti/config/schema.hpp"
#include "noti/observability/observer.hpp"

#include <memory>

namespace noti::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace noti::observability
