#include "noti/dispatch/dispatcher.hpp"

#include "noti/config/config.hpp"
#include "noti/observability/global.hpp"

#include <algorithm>
#include <future>
#include <system_error>

namespace noti::dispatch {

std::size_t DispatchReport::failures() const {
  return static_cast<std::size_t>(std::count_if(
      results.begin(), results.end(), [](const DispatchResult &result) { return !result.ok; }));
}

bool DispatchReport::all_failed() const { return !results.empty() && failures() == results.size(); }

Dispatcher::Dispatcher(const DestinationSender &sender) : sender_(sender) {}

DispatchReport Dispatcher::dispatch(const std::string &message,
                                    const std::vector<config::Destination> &destinations) const {
  DispatchReport report;
  if (destinations.empty()) {
    return report;
  }

  observability::record_dispatch_start(message.size(), destinations.size());

  std::vector<std::future<DispatchResult>> futures;
  futures.reserve(destinations.size());

  for (std::size_t i = 0; i < destinations.size(); ++i) {
    auto task = [this, &message, &destinations, i]() {
      DispatchResult out;
      out.index = i;
      out.destination = config::describe_destination(destinations[i]);

      const auto started = std::chrono::steady_clock::now();
      const auto sent = sender_.send(destinations[i], message);
      out.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      out.ok = sent.ok();
      if (!sent.ok()) {
        out.error = sent.error();
      }
      return out;
    };

    try {
      futures.push_back(std::async(std::launch::async, task));
    } catch (const std::system_error &) {
      // Out of threads: run this one on the joining thread instead.
      futures.push_back(std::async(std::launch::deferred, task));
    }
  }

  report.results.reserve(futures.size());
  for (std::size_t i = 0; i < futures.size(); ++i) {
    DispatchResult result;
    try {
      result = futures[i].get();
    } catch (const std::exception &ex) {
      result.index = i;
      result.destination = config::describe_destination(destinations[i]);
      result.ok = false;
      result.error = SendError{.code = SendErrorCode::Transport, .message = ex.what()};
    }

    observability::record_destination_result(result.destination, result.ok,
                                             result.error.has_value() ? result.error->to_string()
                                                                      : std::string(),
                                             result.duration);
    report.results.push_back(std::move(result));
  }

  return report;
}

} // namespace noti::dispatch
