#pragma once

#include "noti/http/client.hpp"
#include "noti/notify/desktop.hpp"

#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace noti::cli {

/// Everything the orchestrator touches outside the process. Defaults are the
/// real curl client, notify-send/osascript and the standard streams.
struct CliEnvironment {
  std::shared_ptr<http::HttpClient> http_client;
  std::shared_ptr<notify::DesktopNotifier> desktop;
  std::istream *input = nullptr;
  std::ostream *out = nullptr;
  std::ostream *err = nullptr;
  const std::atomic<bool> *stop = nullptr;
};

[[nodiscard]] CliEnvironment default_environment();

/// Runs with `args` excluding the program name.
int run_cli(std::vector<std::string> args, const CliEnvironment &env);
int run_cli(int argc, char **argv);

/// SIGINT/SIGTERM raise the stop flag handed out by default_environment().
void install_interrupt_handlers();

} // namespace noti::cli
