#pragma once

#include "noti/common/result.hpp"

#include <memory>
#include <optional>
#include <string>

namespace re2 {
class RE2;
}

namespace noti::common {

/// Compiles `expression` for unanchored search. Matching runs in time linear
/// in the input, so arbitrarily long lines are safe.
[[nodiscard]] Result<std::shared_ptr<const re2::RE2>> compile_pattern(const std::string &expression);

/// First capture group that took part in the match, else the whole match.
/// nullopt when `line` does not match.
[[nodiscard]] std::optional<std::string> search_pattern(const re2::RE2 &pattern,
                                                        const std::string &line);

} // namespace noti::common
