#pragma once

#include "noti/common/result.hpp"
#include "noti/config/schema.hpp"

#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace re2 {
class RE2;
}

namespace noti::stream {

/// Lazy, single-pass view over newline-delimited input.
class LineReader {
public:
  explicit LineReader(std::istream &input);

  /// Next line without its terminator; nullopt once the input is exhausted
  /// or a read fails (e.g. interrupted by a signal).
  [[nodiscard]] std::optional<std::string> next();
  [[nodiscard]] std::size_t lines_read() const { return lines_read_; }

private:
  std::istream &input_;
  std::size_t lines_read_ = 0;
};

/// Turns input lines into messages. Every line is echoed to the redirect
/// stream, if any, before matching, so echo order always follows input order.
class StreamFilter {
public:
  [[nodiscard]] static common::Result<StreamFilter> create(const config::StreamConfig &config,
                                                           std::ostream *redirect);

  /// Message for `line`, or nullopt when the pattern rejects it. Uses the
  /// first capture group that took part in the match, else the whole match.
  [[nodiscard]] std::optional<std::string> apply(const std::string &line) const;

  /// Pulls lines from `reader` until one yields a message. `stop` is checked
  /// before every read; nullopt once it is raised or the input ends.
  [[nodiscard]] std::optional<std::string> next(LineReader &reader,
                                                const std::atomic<bool> &stop) const;

private:
  StreamFilter(std::shared_ptr<const re2::RE2> pattern, std::ostream *redirect);

  std::shared_ptr<const re2::RE2> pattern_;
  std::ostream *redirect_;
};

} // namespace noti::stream
