#include "noti/format/formatter.hpp"

#include "noti/common/json_util.hpp"
#include "noti/common/strings.hpp"
#include "noti/config/config.hpp"

#include <type_traits>

namespace noti::format {

namespace {

constexpr const char *kJsonContentType = "application/json";
constexpr const char *kPlainContentType = "text/plain";

std::string json_object_with(const std::string &field, const std::string &message) {
  return "{\"" + field + "\":\"" + common::json_escape(message) + "\"}";
}

} // namespace

std::string escape_for_content_type(const std::string &content_type, const std::string &message) {
  if (common::contains_ignore_case(content_type, "json")) {
    return common::json_escape(message);
  }
  return message;
}

common::Result<Payload> format_payload(const config::FormatSpec &spec, const std::string &message) {
  return std::visit(
      [&message](auto &&format) -> common::Result<Payload> {
        using T = std::decay_t<decltype(format)>;
        if constexpr (std::is_same_v<T, config::DiscordFormat>) {
          return common::Result<Payload>::success(
              Payload{.content_type = kJsonContentType, .body = json_object_with("content", message)});
        } else if constexpr (std::is_same_v<T, config::GoogleChatFormat>) {
          return common::Result<Payload>::success(
              Payload{.content_type = kJsonContentType, .body = json_object_with("text", message)});
        } else if constexpr (std::is_same_v<T, config::PlainTextFormat>) {
          return common::Result<Payload>::success(
              Payload{.content_type = kPlainContentType, .body = message});
        } else {
          if (format.template_body.empty() && format.content_type.empty()) {
            return common::Result<Payload>::failure(
                "custom format has neither template nor content_type");
          }
          const std::string value =
              format.escape ? escape_for_content_type(format.content_type, message) : message;
          return common::Result<Payload>::success(Payload{
              .content_type = format.content_type,
              .body = common::replace_all(format.template_body, config::kMessageToken, value),
          });
        }
      },
      spec);
}

} // namespace noti::format
