#pragma once

#include <string>

namespace noti::common {

/// Escape a string for embedding inside a JSON string literal. Control
/// characters without a short form are written as \u00XX.
[[nodiscard]] std::string json_escape(const std::string &value);

} // namespace noti::common
