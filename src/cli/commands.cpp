#include "noti/cli/commands.hpp"

#include "noti/common/console.hpp"
#include "noti/common/strings.hpp"
#include "noti/config/config.hpp"
#include "noti/dispatch/dispatcher.hpp"
#include "noti/dispatch/sender.hpp"
#include "noti/observability/factory.hpp"
#include "noti/observability/global.hpp"
#include "noti/stream/filter.hpp"
#include "noti/stream/runner.hpp"

#include <csignal>
#include <iostream>
#include <optional>
#include <sstream>

#include <signal.h>

namespace noti::cli {

namespace {

std::atomic<bool> g_interrupted{false};

void handle_interrupt(int) { g_interrupted.store(true); }

std::string version_string() {
#ifdef NOTI_VERSION
  return std::string("noti ") + NOTI_VERSION;
#else
  return "noti 0.1.0";
#endif
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--") {
      break;
    }
    if (args[i] == "--config" || args[i] == "-c") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

void print_help(std::ostream &out) {
  out << "noti - forward a message, or a filtered stream of lines, to notification destinations\n\n"
      << "USAGE\n"
      << "  noti [--config <path>] <MESSAGE>     send MESSAGE once (stream.enabled = false)\n"
      << "  <cmd> | noti [--config <path>]       notify for stdin lines (stream.enabled = true)\n"
      << "  noti init <desktop|webhook> [--custom]\n"
      << "                                       write a starter config\n"
      << "  noti destination list                list supported destinations\n"
      << "  noti --version                       show version\n\n"
      << "The config path defaults to $NOTI_CONFIG, then ./" << config::kDefaultConfigFilename
      << ".\n";
}

void report_failures(const dispatch::DispatchReport &report, std::ostream &err) {
  for (const auto &result : report.results) {
    if (!result.ok && result.error.has_value()) {
      common::write_console_line(err, "ERROR: " + result.destination + ": " +
                                          result.error->to_string());
    }
  }
}

int fail(std::ostream &err, const std::string &message) {
  observability::record_error("cli", message);
  common::write_console_line(err, "ERROR: " + message);
  return 1;
}

int run_init(std::vector<std::string> args, const CliEnvironment &env) {
  const bool custom = take_flag(args, "--custom");
  if (args.empty()) {
    *env.err << "usage: noti init <desktop|webhook> [--custom]\n";
    return 1;
  }

  const std::string kind = common::to_lower(args[0]);
  config::Config cfg;
  if (kind == "desktop") {
    cfg = config::default_desktop();
  } else if (kind == "webhook") {
    cfg = custom ? config::default_custom_webhook() : config::default_webhook();
  } else {
    *env.err << "unknown destination: " << args[0] << " (expected desktop or webhook)\n";
    return 1;
  }

  const auto path = config::config_path();
  const auto saved = config::save_config(cfg, path);
  if (!saved.ok()) {
    return fail(*env.err, saved.error());
  }
  *env.out << "Created " << path.string() << "\n";
  return 0;
}

int run_destination(const std::vector<std::string> &args, const CliEnvironment &env) {
  if (args.empty() || args[0] != "list") {
    *env.err << "usage: noti destination list\n";
    return 1;
  }
  *env.out << "desktop\nwebhook\n";
  return 0;
}

int run_stream(const config::Config &cfg, const dispatch::Dispatcher &dispatcher,
               const CliEnvironment &env) {
  std::ostream *redirect = nullptr;
  if (cfg.stream.redirect.has_value()) {
    redirect = *cfg.stream.redirect == config::Redirect::Stdout ? env.out : env.err;
  }

  auto filter = stream::StreamFilter::create(cfg.stream, redirect);
  if (!filter.ok()) {
    return fail(*env.err, filter.error());
  }

  stream::StreamRunner runner(dispatcher, cfg.destinations, cfg.stream.max_in_flight);
  runner.on_report([&env](const std::string &, const dispatch::DispatchReport &report) {
    report_failures(report, *env.err);
  });

  static const std::atomic<bool> never{false};
  const auto summary =
      runner.run(filter.value(), *env.input, env.stop != nullptr ? *env.stop : never);
  return summary.failed_messages == 0 ? 0 : 1;
}

int execute(const std::optional<std::string> &message, const CliEnvironment &env) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return fail(*env.err, loaded.error());
  }
  const auto &cfg = loaded.value();

  const auto valid = config::validate_config(cfg);
  if (!valid.ok()) {
    return fail(*env.err, valid.error());
  }
  observability::set_global_observer(observability::create_observer(cfg));

  if (cfg.stream.enabled && message.has_value()) {
    return fail(*env.err, "A message cannot be provided when using streaming");
  }
  if (!cfg.stream.enabled && !message.has_value()) {
    return fail(*env.err, "A message must be provided when not streaming notifications");
  }

  const dispatch::DestinationSender sender(env.http_client, env.desktop, cfg.http.timeout_ms);
  const dispatch::Dispatcher dispatcher(sender);

  int code = 0;
  if (cfg.stream.enabled) {
    code = run_stream(cfg, dispatcher, env);
  } else {
    const auto report = dispatcher.dispatch(*message, cfg.destinations);
    report_failures(report, *env.err);
    code = report.all_failed() ? 1 : 0;
  }

  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return code;
}

} // namespace

CliEnvironment default_environment() {
  CliEnvironment env;
  env.http_client = std::make_shared<http::CurlHttpClient>();
  env.desktop = std::make_shared<notify::CommandDesktopNotifier>();
  env.input = &std::cin;
  env.out = &std::cout;
  env.err = &std::cerr;
  env.stop = &g_interrupted;
  return env;
}

void install_interrupt_handlers() {
  // No SA_RESTART: a blocked read on stdin must return so the loop can stop.
  struct sigaction action {};
  action.sa_handler = handle_interrupt;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
  std::signal(SIGPIPE, SIG_IGN);
}

int run_cli(std::vector<std::string> args, const CliEnvironment &env) {
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    *env.err << global_error << "\n";
    return 1;
  }

  if (!args.empty()) {
    const std::string &subcommand = args[0];
    if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
      print_help(*env.out);
      return 0;
    }
    if (subcommand == "--version" || subcommand == "-V") {
      *env.out << version_string() << "\n";
      return 0;
    }
    if (subcommand == "init") {
      return run_init(std::vector<std::string>(args.begin() + 1, args.end()), env);
    }
    if (subcommand == "destination") {
      return run_destination(std::vector<std::string>(args.begin() + 1, args.end()), env);
    }
    if (subcommand == "--") {
      args.erase(args.begin());
    }
  }

  std::optional<std::string> message;
  if (!args.empty()) {
    message = join_tokens(args);
  }
  return execute(message, env);
}

int run_cli(int argc, char **argv) {
  install_interrupt_handlers();
  std::vector<std::string> args;
  args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return run_cli(std::move(args), default_environment());
}

} // namespace noti::cli
