#include "noti/stream/runner.hpp"

#include "noti/observability/global.hpp"

#include <chrono>
#include <system_error>

namespace noti::stream {

StreamRunner::StreamRunner(const dispatch::Dispatcher &dispatcher,
                           const std::vector<config::Destination> &destinations,
                           const std::size_t max_in_flight)
    : dispatcher_(dispatcher), destinations_(destinations),
      max_in_flight_(max_in_flight == 0 ? 1 : max_in_flight) {}

void StreamRunner::on_report(ReportCallback callback) { callback_ = std::move(callback); }

StreamSummary StreamRunner::run(const StreamFilter &filter, std::istream &input,
                                const std::atomic<bool> &stop) {
  StreamSummary summary;
  LineReader reader(input);

  while (!stop.load()) {
    auto message = filter.next(reader, stop);
    if (!message.has_value()) {
      break;
    }
    ++summary.messages;

    reap(false, summary);
    while (in_flight_.size() >= max_in_flight_) {
      wait_oldest(summary);
    }

    auto task = [this, text = *message]() { return dispatcher_.dispatch(text, destinations_); };
    InFlight flight{.message = *message, .report = {}};
    try {
      flight.report = std::async(std::launch::async, task);
    } catch (const std::system_error &ex) {
      observability::record_error("stream", std::string("dispatching inline: ") + ex.what());
      flight.report = std::async(std::launch::deferred, task);
    }
    in_flight_.push_back(std::move(flight));
  }

  reap(true, summary);
  summary.lines = reader.lines_read();
  return summary;
}

void StreamRunner::reap(const bool wait_all, StreamSummary &summary) {
  auto it = in_flight_.begin();
  while (it != in_flight_.end()) {
    // Deferred tasks report `deferred`, not `ready`; get() runs them here.
    const bool ready =
        wait_all || it->report.wait_for(std::chrono::seconds(0)) != std::future_status::timeout;
    if (!ready) {
      ++it;
      continue;
    }
    finish(*it, summary);
    it = in_flight_.erase(it);
  }
}

void StreamRunner::wait_oldest(StreamSummary &summary) {
  finish(in_flight_.front(), summary);
  in_flight_.erase(in_flight_.begin());
}

void StreamRunner::finish(InFlight &flight, StreamSummary &summary) {
  dispatch::DispatchReport report;
  try {
    report = flight.report.get();
  } catch (const std::exception &ex) {
    observability::record_error("stream", ex.what());
    ++summary.failed_messages;
    return;
  }
  if (report.all_failed()) {
    ++summary.failed_messages;
  }
  if (callback_) {
    callback_(flight.message, report);
  }
}

} // namespace noti::stream
