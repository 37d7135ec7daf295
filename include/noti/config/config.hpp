#pragma once

#include "noti/common/result.hpp"
#include "noti/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace noti::config {

inline constexpr const char *kDefaultConfigFilename = "noti.toml";
inline constexpr const char *kMessageToken = "$(message)";

void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// --config override, then $NOTI_CONFIG, then ./noti.toml.
[[nodiscard]] std::filesystem::path config_path();

[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] common::Result<Config> load_config(const std::filesystem::path &path);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] std::string serialize_config(const Config &config);
[[nodiscard]] common::Status save_config(const Config &config, const std::filesystem::path &path);

/// Rejects anything the dispatcher must never see: no destinations, bad URLs,
/// empty custom payloads, patterns that do not compile.
[[nodiscard]] common::Status validate_config(const Config &config);

[[nodiscard]] Config default_desktop();
[[nodiscard]] Config default_webhook();
[[nodiscard]] Config default_custom_webhook();

[[nodiscard]] std::string_view method_name(HttpMethod method);
[[nodiscard]] std::optional<HttpMethod> parse_method(const std::string &value);
[[nodiscard]] std::string_view format_name(const FormatSpec &format);
[[nodiscard]] std::string describe_destination(const Destination &destination);

} // namespace noti::config
