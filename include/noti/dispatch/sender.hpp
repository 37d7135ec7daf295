#pragma once

#include "noti/common/result.hpp"
#include "noti/config/schema.hpp"
#include "noti/http/client.hpp"
#include "noti/notify/desktop.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace noti::dispatch {

enum class SendErrorCode {
  Timeout,
  DesktopUnavailable,
  HttpStatus,
  Transport,
  Format,
};

struct SendError {
  SendErrorCode code = SendErrorCode::Transport;
  std::uint16_t status = 0;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

using SendResult = common::Result<void, SendError>;

/// Delivers one message to one destination. Never retries.
class DestinationSender {
public:
  DestinationSender(std::shared_ptr<http::HttpClient> http_client,
                    std::shared_ptr<notify::DesktopNotifier> desktop, std::uint64_t timeout_ms);

  [[nodiscard]] SendResult send(const config::Destination &destination,
                                const std::string &message) const;

  [[nodiscard]] std::uint64_t timeout_ms() const { return timeout_ms_; }

private:
  [[nodiscard]] SendResult send_webhook(const config::WebhookDestination &webhook,
                                        const std::string &message) const;
  [[nodiscard]] SendResult send_desktop(const config::DesktopDestination &desktop,
                                        const std::string &message) const;

  std::shared_ptr<http::HttpClient> http_client_;
  std::shared_ptr<notify::DesktopNotifier> desktop_;
  std::uint64_t timeout_ms_;
};

} // namespace noti::dispatch
