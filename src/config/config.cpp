#include "noti/config/config.hpp"

#include "noti/common/pattern.hpp"
#include "noti/common/strings.hpp"
#include "noti/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace noti::config {

namespace {

std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::string> header_value(const std::vector<std::string> &headers,
                                        const std::string &name) {
  for (const auto &header : headers) {
    const auto colon = header.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    if (common::to_lower(common::trim(header.substr(0, colon))) == common::to_lower(name)) {
      return common::trim(header.substr(colon + 1));
    }
  }
  return std::nullopt;
}

common::Result<FormatSpec> parse_format(const common::TomlDocument &doc, const std::string &prefix) {
  const std::string name = common::to_lower(common::trim(doc.get_string(prefix + "format", "discord")));
  if (name == "discord") {
    return common::Result<FormatSpec>::success(DiscordFormat{});
  }
  if (name == "google_chat") {
    return common::Result<FormatSpec>::success(GoogleChatFormat{});
  }
  if (name == "plain_text") {
    return common::Result<FormatSpec>::success(PlainTextFormat{});
  }
  if (name != "custom") {
    return common::Result<FormatSpec>::failure("Unknown webhook format: " + name);
  }

  CustomFormat custom;
  custom.template_body = doc.get_string(prefix + "template");
  custom.escape = doc.get_bool(prefix + "escape", false);
  custom.headers = doc.get_string_array(prefix + "headers");

  const std::string method = doc.get_string(prefix + "method", "POST");
  const auto parsed_method = parse_method(method);
  if (!parsed_method.has_value()) {
    return common::Result<FormatSpec>::failure("Unsupported webhook method: " + method);
  }
  custom.method = *parsed_method;

  if (doc.has(prefix + "content_type")) {
    custom.content_type = common::trim(doc.get_string(prefix + "content_type"));
  } else if (auto from_header = header_value(custom.headers, "Content-Type");
             from_header.has_value()) {
    custom.content_type = *from_header;
  } else {
    custom.content_type = "text/plain";
  }

  return common::Result<FormatSpec>::success(std::move(custom));
}

common::Result<Destination> parse_destination(const common::TomlDocument &doc,
                                              const std::size_t index) {
  const std::string prefix = "destination." + std::to_string(index) + ".";
  const std::string type = common::to_lower(common::trim(doc.get_string(prefix + "type")));

  if (type == "desktop") {
    DesktopDestination desktop;
    desktop.summary = doc.get_string(prefix + "summary", desktop.summary);
    desktop.persistent = doc.get_bool(prefix + "persistent", desktop.persistent);
    return common::Result<Destination>::success(std::move(desktop));
  }

  if (type == "webhook") {
    WebhookDestination webhook;
    webhook.url = common::trim(doc.get_string(prefix + "url"));
    auto format = parse_format(doc, prefix);
    if (!format.ok()) {
      return common::Result<Destination>::failure(format.error());
    }
    webhook.format = std::move(format.value());
    return common::Result<Destination>::success(std::move(webhook));
  }

  if (type.empty()) {
    return common::Result<Destination>::failure("destination " + std::to_string(index) +
                                                " is missing `type`");
  }
  return common::Result<Destination>::failure("Unknown destination type: " + type);
}

bool is_absolute_http_url(const std::string &url) {
  for (const std::string scheme : {"http://", "https://"}) {
    if (common::starts_with(common::to_lower(url), scheme)) {
      const std::string rest = url.substr(scheme.size());
      return !rest.empty() && rest.front() != '/' && rest.find(' ') == std::string::npos;
    }
  }
  return false;
}

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << common::quote_toml_string(values[i]);
  }
  out << "]";
  return out.str();
}

} // namespace

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

std::filesystem::path config_path() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("NOTI_CONFIG"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::filesystem::path(kDefaultConfigFilename);
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.stream.enabled = doc.get_bool("stream.enabled", config.stream.enabled);
  if (doc.has("stream.matching")) {
    config.stream.matching = doc.get_string("stream.matching");
  }
  if (doc.has("stream.redirect")) {
    const std::string redirect = common::to_lower(common::trim(doc.get_string("stream.redirect")));
    if (redirect == "stdout") {
      config.stream.redirect = Redirect::Stdout;
    } else if (redirect == "stderr") {
      config.stream.redirect = Redirect::Stderr;
    } else if (redirect.empty() || redirect == "none") {
      config.stream.redirect.reset();
    } else {
      return common::Result<Config>::failure("Invalid stream.redirect: " + redirect);
    }
  } else if (doc.has("stream.enabled") || doc.has("stream.matching") ||
             doc.has("stream.max_in_flight")) {
    config.stream.redirect.reset();
  }

  config.stream.max_in_flight = static_cast<std::size_t>(
      doc.get_u64("stream.max_in_flight", config.stream.max_in_flight));
  config.http.timeout_ms = doc.get_u64("http.timeout_ms", config.http.timeout_ms);
  config.observability.backend = doc.get_string("observability.backend", config.observability.backend);

  const std::size_t count = doc.table_array_size("destination");
  config.destinations.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    auto destination = parse_destination(doc, i);
    if (!destination.ok()) {
      return common::Result<Config>::failure(destination.error());
    }
    config.destinations.push_back(std::move(destination.value()));
  }

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<Config>::failure(
        "No config file found, please create one or provide the path with --config");
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  return parsed;
}

common::Result<Config> load_config() { return load_config(config_path()); }

std::string serialize_config(const Config &config) {
  std::ostringstream out;
  out << "[stream]\n";
  out << "enabled = " << (config.stream.enabled ? "true" : "false") << "\n";
  if (config.stream.matching.has_value()) {
    out << "matching = " << common::quote_toml_string(*config.stream.matching) << "\n";
  }
  if (config.stream.redirect.has_value()) {
    out << "redirect = "
        << (*config.stream.redirect == Redirect::Stdout ? "\"stdout\"" : "\"stderr\"") << "\n";
  }
  out << "max_in_flight = " << config.stream.max_in_flight << "\n";

  out << "\n[http]\n";
  out << "timeout_ms = " << config.http.timeout_ms << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  for (const auto &destination : config.destinations) {
    out << "\n[[destination]]\n";
    std::visit(
        [&out](auto &&dest) {
          using T = std::decay_t<decltype(dest)>;
          if constexpr (std::is_same_v<T, DesktopDestination>) {
            out << "type = \"desktop\"\n";
            out << "summary = " << common::quote_toml_string(dest.summary) << "\n";
            out << "persistent = " << (dest.persistent ? "true" : "false") << "\n";
          } else if constexpr (std::is_same_v<T, WebhookDestination>) {
            out << "type = \"webhook\"\n";
            out << "url = " << common::quote_toml_string(dest.url) << "\n";
            out << "format = \"" << format_name(dest.format) << "\"\n";
            if (const auto *custom = std::get_if<CustomFormat>(&dest.format)) {
              out << "content_type = " << common::quote_toml_string(custom->content_type) << "\n";
              out << "method = \"" << method_name(custom->method) << "\"\n";
              out << "template = " << common::quote_toml_string(custom->template_body) << "\n";
              out << "escape = " << (custom->escape ? "true" : "false") << "\n";
              if (!custom->headers.empty()) {
                out << "headers = " << string_array_to_toml(custom->headers) << "\n";
              }
            }
          }
        },
        destination);
  }
  return out.str();
}

common::Status save_config(const Config &config, const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    return common::Status::error("`" + path.string() + "` already exists");
  }
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return common::Status::error("Failed to create directory: " + path.parent_path().string() +
                                   ": " + ec.message());
    }
  }

  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write config file: " + path.string());
  }
  file << serialize_config(config);
  if (!file) {
    return common::Status::error("Unable to write config file: " + path.string());
  }
  return common::Status::success();
}

common::Status validate_config(const Config &config) {
  if (config.destinations.empty()) {
    return common::Status::error("No destinations configured; add at least one [[destination]]");
  }

  for (std::size_t i = 0; i < config.destinations.size(); ++i) {
    const auto *webhook = std::get_if<WebhookDestination>(&config.destinations[i]);
    if (webhook == nullptr) {
      continue;
    }
    if (!is_absolute_http_url(webhook->url)) {
      return common::Status::error("destination " + std::to_string(i) +
                                   ": url must be an absolute http(s) URL: " + webhook->url);
    }
    if (const auto *custom = std::get_if<CustomFormat>(&webhook->format)) {
      if (common::trim(custom->template_body).empty() &&
          common::trim(custom->content_type).empty()) {
        return common::Status::error("destination " + std::to_string(i) +
                                     ": custom format needs a template or content_type");
      }
      for (const auto &header : custom->headers) {
        const auto colon = header.find(':');
        if (colon == std::string::npos || common::trim(header.substr(0, colon)).empty()) {
          return common::Status::error("destination " + std::to_string(i) +
                                       ": malformed header: " + header);
        }
      }
    }
  }

  if (config.stream.matching.has_value()) {
    const auto pattern = common::compile_pattern(*config.stream.matching);
    if (!pattern.ok()) {
      return common::Status::error("Invalid stream.matching: " + pattern.error());
    }
  }

  if (config.stream.max_in_flight == 0) {
    return common::Status::error("stream.max_in_flight must be greater than zero");
  }

  if (config.http.timeout_ms == 0) {
    return common::Status::error("http.timeout_ms must be greater than zero");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend != "log" && backend != "none" && backend != "noop") {
    return common::Status::error("Invalid observability.backend: " + config.observability.backend);
  }

  return common::Status::success();
}

Config default_desktop() {
  Config config;
  config.destinations.push_back(DesktopDestination{});
  return config;
}

Config default_webhook() {
  Config config;
  config.destinations.push_back(WebhookDestination{
      .url = "https://discord.com/api/webhooks/<CHANNEL_ID>/<WEBHOOK_ID>",
      .format = DiscordFormat{},
  });
  return config;
}

Config default_custom_webhook() {
  Config config;
  CustomFormat custom;
  custom.content_type = "application/json";
  custom.template_body = R"json({"content": "$(message)"})json";
  custom.escape = true;
  config.destinations.push_back(WebhookDestination{
      .url = "https://discord.com/api/webhooks/<CHANNEL_ID>/<WEBHOOK_ID>",
      .format = std::move(custom),
  });
  return config;
}

std::string_view method_name(const HttpMethod method) {
  switch (method) {
  case HttpMethod::Post:
    return "POST";
  case HttpMethod::Put:
    return "PUT";
  case HttpMethod::Patch:
    return "PATCH";
  }
  return "POST";
}

std::optional<HttpMethod> parse_method(const std::string &value) {
  const std::string normalized = common::to_upper(common::trim(value));
  if (normalized == "POST") {
    return HttpMethod::Post;
  }
  if (normalized == "PUT") {
    return HttpMethod::Put;
  }
  if (normalized == "PATCH") {
    return HttpMethod::Patch;
  }
  return std::nullopt;
}

std::string_view format_name(const FormatSpec &format) {
  return std::visit(
      [](auto &&spec) -> std::string_view {
        using T = std::decay_t<decltype(spec)>;
        if constexpr (std::is_same_v<T, DiscordFormat>) {
          return "discord";
        } else if constexpr (std::is_same_v<T, GoogleChatFormat>) {
          return "google_chat";
        } else if constexpr (std::is_same_v<T, PlainTextFormat>) {
          return "plain_text";
        } else {
          return "custom";
        }
      },
      format);
}

std::string describe_destination(const Destination &destination) {
  if (const auto *webhook = std::get_if<WebhookDestination>(&destination)) {
    return "webhook(" + std::string(format_name(webhook->format)) + ")";
  }
  return "desktop(" + std::get<DesktopDestination>(destination).summary + ")";
}

} // namespace noti::config
