#pragma once

#include "noti/common/result.hpp"

#include <string>

namespace noti::notify {

/// Host notification binding.
class DesktopNotifier {
public:
  virtual ~DesktopNotifier() = default;

  [[nodiscard]] virtual common::Status notify(const std::string &summary, const std::string &body,
                                              bool persistent) = 0;
};

/// Shells out to notify-send (Linux/BSD) or osascript (macOS).
class CommandDesktopNotifier final : public DesktopNotifier {
public:
  [[nodiscard]] common::Status notify(const std::string &summary, const std::string &body,
                                      bool persistent) override;
};

[[nodiscard]] std::string shell_single_quote(const std::string &value);

} // namespace noti::notify
