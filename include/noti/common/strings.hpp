#pragma once

#include <string>

namespace noti::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool contains_ignore_case(const std::string &haystack, const std::string &needle);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string to_upper(std::string value);
/// Expand a leading `~` and `$VAR` / `${VAR}` references.
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] std::string replace_all(std::string value, const std::string &token,
                                      const std::string &replacement);

} // namespace noti::common
