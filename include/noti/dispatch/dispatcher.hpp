#pragma once

#include "noti/config/schema.hpp"
#include "noti/dispatch/sender.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace noti::dispatch {

struct DispatchResult {
  std::size_t index = 0;
  std::string destination;
  bool ok = false;
  std::optional<SendError> error;
  std::chrono::milliseconds duration{0};
};

/// One entry per destination, in destination-list order.
struct DispatchReport {
  std::vector<DispatchResult> results;

  [[nodiscard]] std::size_t size() const { return results.size(); }
  [[nodiscard]] bool empty() const { return results.empty(); }
  [[nodiscard]] std::size_t failures() const;
  /// True when there was at least one destination and none succeeded.
  [[nodiscard]] bool all_failed() const;
};

/// Fans one message out to every destination concurrently and waits for all
/// of them. A failing destination never blocks or cancels the others.
class Dispatcher {
public:
  explicit Dispatcher(const DestinationSender &sender);

  [[nodiscard]] DispatchReport dispatch(const std::string &message,
                                        const std::vector<config::Destination> &destinations) const;

private:
  const DestinationSender &sender_;
};

} // namespace noti::dispatch
