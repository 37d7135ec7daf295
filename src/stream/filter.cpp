#include "noti/stream/filter.hpp"

#include "noti/common/console.hpp"
#include "noti/common/pattern.hpp"
#include "noti/observability/global.hpp"

#include <istream>

namespace noti::stream {

LineReader::LineReader(std::istream &input) : input_(input) {}

std::optional<std::string> LineReader::next() {
  std::string line;
  if (!std::getline(input_, line)) {
    return std::nullopt;
  }
  ++lines_read_;
  return line;
}

StreamFilter::StreamFilter(std::shared_ptr<const re2::RE2> pattern, std::ostream *redirect)
    : pattern_(std::move(pattern)), redirect_(redirect) {}

common::Result<StreamFilter> StreamFilter::create(const config::StreamConfig &config,
                                                  std::ostream *redirect) {
  std::shared_ptr<const re2::RE2> pattern;
  if (config.matching.has_value()) {
    auto compiled = common::compile_pattern(*config.matching);
    if (!compiled.ok()) {
      return common::Result<StreamFilter>::failure("Invalid stream.matching: " + compiled.error());
    }
    pattern = compiled.value();
  }
  if (!config.redirect.has_value()) {
    redirect = nullptr;
  }
  return common::Result<StreamFilter>::success(StreamFilter(std::move(pattern), redirect));
}

std::optional<std::string> StreamFilter::apply(const std::string &line) const {
  if (redirect_ != nullptr) {
    common::write_console_line(*redirect_, line);
  }

  if (pattern_ == nullptr) {
    observability::record_stream_line(true);
    return line;
  }

  auto message = common::search_pattern(*pattern_, line);
  observability::record_stream_line(message.has_value());
  return message;
}

std::optional<std::string> StreamFilter::next(LineReader &reader,
                                              const std::atomic<bool> &stop) const {
  while (!stop.load()) {
    auto line = reader.next();
    if (!line.has_value()) {
      return std::nullopt;
    }
    if (auto message = apply(*line)) {
      return message;
    }
  }
  return std::nullopt;
}

} // namespace noti::stream
