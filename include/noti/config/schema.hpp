#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace noti::config {

enum class HttpMethod { Post, Put, Patch };

struct DiscordFormat {};

struct GoogleChatFormat {};

struct PlainTextFormat {};

/// User-defined payload. `$(message)` in `template_body` is replaced by the
/// message; a template without the token is sent as-is.
struct CustomFormat {
  std::string content_type;
  std::string template_body;
  bool escape = false;
  HttpMethod method = HttpMethod::Post;
  std::vector<std::string> headers; // "Name: value"
};

using FormatSpec = std::variant<DiscordFormat, GoogleChatFormat, PlainTextFormat, CustomFormat>;

struct WebhookDestination {
  std::string url;
  FormatSpec format = DiscordFormat{};
};

struct DesktopDestination {
  std::string summary = "Noti";
  bool persistent = false;
};

using Destination = std::variant<WebhookDestination, DesktopDestination>;

enum class Redirect { Stdout, Stderr };

struct StreamConfig {
  bool enabled = false;
  std::optional<std::string> matching;
  std::optional<Redirect> redirect = Redirect::Stdout;
  /// Messages dispatched concurrently before reading waits for the oldest.
  std::size_t max_in_flight = 16;
};

struct HttpConfig {
  std::uint64_t timeout_ms = 10'000;
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  std::vector<Destination> destinations;
  StreamConfig stream;
  HttpConfig http;
  ObservabilityConfig observability;
};

} // namespace noti::config
