#include "noti/notify/desktop.hpp"

#include <cstdlib>
#include <sstream>

namespace noti::notify {

namespace {

bool command_exists(const std::string &binary) {
  const std::string command = "command -v " + shell_single_quote(binary) + " >/dev/null 2>&1";
  return std::system(command.c_str()) == 0;
}

#if defined(__APPLE__)
std::string escape_applescript_string(const std::string &value) {
  std::string out;
  out.reserve(value.size() + 8);
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}
#endif

} // namespace

std::string shell_single_quote(const std::string &value) {
  std::string out = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

common::Status CommandDesktopNotifier::notify(const std::string &summary, const std::string &body,
                                              const bool persistent) {
#if defined(__APPLE__)
  // Notification Center has no per-call persistence; the banner style is a user setting.
  (void)persistent;
  if (!command_exists("osascript")) {
    return common::Status::error("osascript not found");
  }
  std::ostringstream script;
  script << "display notification \"" << escape_applescript_string(body) << "\" with title \""
         << escape_applescript_string(summary) << "\"";
  const std::string command = "osascript -e " + shell_single_quote(script.str());
  if (std::system(command.c_str()) != 0) {
    return common::Status::error("osascript command failed");
  }
  return common::Status::success();
#elif !defined(_WIN32)
  if (!command_exists("notify-send")) {
    return common::Status::error("notify-send not found");
  }
  std::ostringstream command;
  command << "notify-send --app-name=noti";
  if (persistent) {
    command << " --urgency=critical --expire-time=0";
  }
  command << " -- " << shell_single_quote(summary) << " " << shell_single_quote(body);
  if (std::system(command.str().c_str()) != 0) {
    return common::Status::error("notify-send command failed");
  }
  return common::Status::success();
#else
  (void)summary;
  (void)body;
  (void)persistent;
  return common::Status::error("desktop notifications are not supported on this platform");
#endif
}

} // namespace noti::notify
