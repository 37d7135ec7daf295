#include "noti/common/pattern.hpp"

#include <re2/re2.h>

#include <vector>

namespace noti::common {

Result<std::shared_ptr<const re2::RE2>> compile_pattern(const std::string &expression) {
  re2::RE2::Options options;
  options.set_log_errors(false);
  auto pattern = std::make_shared<const re2::RE2>(expression, options);
  if (!pattern->ok()) {
    return Result<std::shared_ptr<const re2::RE2>>::failure(pattern->error());
  }
  return Result<std::shared_ptr<const re2::RE2>>::success(std::move(pattern));
}

std::optional<std::string> search_pattern(const re2::RE2 &pattern, const std::string &line) {
  const int groups = pattern.NumberOfCapturingGroups();
  std::vector<re2::StringPiece> match(static_cast<std::size_t>(groups) + 1);
  if (!pattern.Match(line, 0, line.size(), re2::RE2::UNANCHORED, match.data(), groups + 1)) {
    return std::nullopt;
  }

  // Groups outside the taken alternative come back with a null data pointer.
  for (int group = 1; group <= groups; ++group) {
    const auto &piece = match[static_cast<std::size_t>(group)];
    if (piece.data() != nullptr) {
      return std::string(piece.data(), piece.size());
    }
  }
  return std::string(match[0].data(), match[0].size());
}

} // namespace noti::common
