#pragma once

#include "noti/config/schema.hpp"
#include "noti/dispatch/dispatcher.hpp"
#include "noti/stream/filter.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <iosfwd>
#include <string>
#include <vector>

namespace noti::stream {

struct StreamSummary {
  std::size_t lines = 0;
  std::size_t messages = 0;
  std::size_t failed_messages = 0;
};

using ReportCallback =
    std::function<void(const std::string &message, const dispatch::DispatchReport &report)>;

/// Reads input until it ends or `stop` is raised. Each message is dispatched
/// on its own task without waiting for earlier ones, up to `max_in_flight`
/// at once; past that, reading waits for the oldest. Every task is joined
/// before run() returns.
class StreamRunner {
public:
  StreamRunner(const dispatch::Dispatcher &dispatcher,
               const std::vector<config::Destination> &destinations, std::size_t max_in_flight);

  void on_report(ReportCallback callback);

  [[nodiscard]] StreamSummary run(const StreamFilter &filter, std::istream &input,
                                  const std::atomic<bool> &stop);

private:
  struct InFlight {
    std::string message;
    std::future<dispatch::DispatchReport> report;
  };

  void reap(bool wait_all, StreamSummary &summary);
  void wait_oldest(StreamSummary &summary);
  void finish(InFlight &flight, StreamSummary &summary);

  const dispatch::Dispatcher &dispatcher_;
  const std::vector<config::Destination> &destinations_;
  std::size_t max_in_flight_;
  ReportCallback callback_;
  std::vector<InFlight> in_flight_;
};

} // namespace noti::stream
