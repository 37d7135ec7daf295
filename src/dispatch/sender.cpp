#include "noti/dispatch/sender.hpp"

#include "noti/common/strings.hpp"
#include "noti/format/formatter.hpp"

namespace noti::dispatch {

namespace {

SendResult fail(const SendErrorCode code, std::string message, const std::uint16_t status = 0) {
  return SendResult::failure(SendError{.code = code, .status = status, .message = std::move(message)});
}

void append_custom_headers(http::HttpRequest &request, const config::CustomFormat &custom) {
  for (const auto &header : custom.headers) {
    const auto colon = header.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string name = common::trim(header.substr(0, colon));
    if (common::to_lower(name) == "content-type") {
      continue;
    }
    request.headers.emplace_back(name, common::trim(header.substr(colon + 1)));
  }
}

} // namespace

std::string SendError::to_string() const {
  switch (code) {
  case SendErrorCode::Timeout:
    return "timeout: " + message;
  case SendErrorCode::DesktopUnavailable:
    return "desktop unavailable: " + message;
  case SendErrorCode::HttpStatus:
    return "http status " + std::to_string(status) + (message.empty() ? "" : ": " + message);
  case SendErrorCode::Transport:
    return "transport: " + message;
  case SendErrorCode::Format:
    return "format: " + message;
  }
  return message;
}

DestinationSender::DestinationSender(std::shared_ptr<http::HttpClient> http_client,
                                     std::shared_ptr<notify::DesktopNotifier> desktop,
                                     const std::uint64_t timeout_ms)
    : http_client_(std::move(http_client)), desktop_(std::move(desktop)),
      timeout_ms_(timeout_ms) {}

SendResult DestinationSender::send(const config::Destination &destination,
                                   const std::string &message) const {
  if (const auto *webhook = std::get_if<config::WebhookDestination>(&destination)) {
    return send_webhook(*webhook, message);
  }
  return send_desktop(std::get<config::DesktopDestination>(destination), message);
}

SendResult DestinationSender::send_webhook(const config::WebhookDestination &webhook,
                                           const std::string &message) const {
  if (http_client_ == nullptr) {
    return fail(SendErrorCode::Transport, "http client unavailable");
  }

  auto payload = format::format_payload(webhook.format, message);
  if (!payload.ok()) {
    return fail(SendErrorCode::Format, payload.error());
  }

  http::HttpRequest request;
  request.url = webhook.url;
  request.body = std::move(payload.value().body);
  if (!payload.value().content_type.empty()) {
    request.headers.emplace_back("Content-Type", payload.value().content_type);
  }
  if (const auto *custom = std::get_if<config::CustomFormat>(&webhook.format)) {
    request.method = custom->method;
    append_custom_headers(request, *custom);
  }

  const auto response = http_client_->send(request, timeout_ms_);
  if (response.timeout) {
    return fail(SendErrorCode::Timeout,
                "no response within " + std::to_string(timeout_ms_) + "ms");
  }
  if (response.network_error) {
    return fail(SendErrorCode::Transport, response.network_error_message);
  }
  if (!response.is_success()) {
    std::string detail = common::trim(response.body);
    if (detail.size() > 200) {
      detail = detail.substr(0, 200) + "...";
    }
    return fail(SendErrorCode::HttpStatus, std::move(detail), response.status);
  }
  return SendResult::success();
}

SendResult DestinationSender::send_desktop(const config::DesktopDestination &desktop,
                                           const std::string &message) const {
  if (desktop_ == nullptr) {
    return fail(SendErrorCode::DesktopUnavailable, "no desktop notifier");
  }
  const auto status = desktop_->notify(desktop.summary, message, desktop.persistent);
  if (!status.ok()) {
    return fail(SendErrorCode::DesktopUnavailable, status.error());
  }
  return SendResult::success();
}

} // namespace noti::dispatch
