#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "noti/common/toml.hpp"
#include "noti/config/config.hpp"

#include <cstdlib>
#include <optional>

namespace {

const char *kFullConfig = R"toml(# noti config
[stream]
enabled = true
matching = "^(WARN:.*)|^(ERROR:.*)"
redirect = "stderr"

[http]
timeout_ms = 2500

[observability]
backend = "log"

[[destination]]
type = "desktop"
summary = "Builds"
persistent = true

[[destination]]
type = "webhook"
url = "https://discord.com/api/webhooks/1/abc"
format = "discord"

[[destination]]
type = "webhook"
url = "https://example.com/hook"   # trailing comment
format = "custom"
method = "patch"
template = '{"content": "$(message)"}'
escape = true
headers = ["X-Token: abc", "Content-Type: application/json"]
)toml";

} // namespace

void register_config_tests(std::vector<noti::tests::TestCase> &tests) {
  using noti::tests::require;
  using noti::tests::require_eq;
  namespace cfg = noti::config;

  tests.push_back({"toml_table_arrays_are_indexed", [] {
                     auto doc = noti::common::parse_toml(
                         "[[item]]\nname = \"a\"\n[[item]]\nname = \"b\"\n[other]\nx = 1\n");
                     require(doc.ok(), "document should parse");
                     require(doc.value().table_array_size("item") == 2, "two item tables");
                     require_eq(doc.value().get_string("item.0.name"), "a", "first entry");
                     require_eq(doc.value().get_string("item.1.name"), "b", "second entry");
                     require(doc.value().get_u64("other.x", 0) == 1, "plain section after array");
                   }});

  tests.push_back({"toml_strings_literal_and_escaped", [] {
                     auto doc = noti::common::parse_toml(
                         "a = 'C:\\path # not a comment'\nb = \"say \\\"hi\\\" # kept\"\n");
                     require(doc.ok(), "document should parse");
                     require_eq(doc.value().get_string("a"), "C:\\path # not a comment",
                                "literal string is verbatim");
                     require_eq(doc.value().get_string("b"), "say \"hi\" # kept",
                                "basic string escapes decoded");
                   }});

  tests.push_back({"toml_rejects_malformed_lines", [] {
                     require(!noti::common::parse_toml("just words\n").ok(), "missing '='");
                     require(!noti::common::parse_toml("[[]]\n").ok(), "empty table array");
                   }});

  tests.push_back({"config_parses_all_destination_kinds_in_order", [] {
                     auto parsed = cfg::parse_config(kFullConfig);
                     require(parsed.ok(), "config should parse: " +
                                              (parsed.ok() ? std::string() : parsed.error()));
                     const auto &config = parsed.value();
                     require(config.stream.enabled, "stream enabled");
                     require(config.stream.matching.has_value(), "pattern present");
                     require_eq(*config.stream.matching, "^(WARN:.*)|^(ERROR:.*)", "pattern");
                     require(config.stream.redirect == cfg::Redirect::Stderr, "redirect stderr");
                     require(config.http.timeout_ms == 2500, "timeout");
                     require_eq(config.observability.backend, "log", "observability backend");
                     require(config.destinations.size() == 3, "three destinations");

                     const auto &desktop = std::get<cfg::DesktopDestination>(config.destinations[0]);
                     require_eq(desktop.summary, "Builds", "desktop summary");
                     require(desktop.persistent, "desktop persistent");

                     const auto &discord = std::get<cfg::WebhookDestination>(config.destinations[1]);
                     require(std::holds_alternative<cfg::DiscordFormat>(discord.format), "discord format");

                     const auto &hook = std::get<cfg::WebhookDestination>(config.destinations[2]);
                     require_eq(hook.url, "https://example.com/hook", "url without comment");
                     const auto &custom = std::get<cfg::CustomFormat>(hook.format);
                     require(custom.method == cfg::HttpMethod::Patch, "method parsed case-insensitively");
                     require_eq(custom.template_body, R"json({"content": "$(message)"})json", "template");
                     require(custom.escape, "escape flag");
                     require_eq(custom.content_type, "application/json",
                                "content type taken from headers");
                     require(custom.headers.size() == 2, "headers kept");
                     require(cfg::validate_config(config).ok(), "full config is valid");
                   }});

  tests.push_back({"config_stream_defaults", [] {
                     auto bare = cfg::parse_config("[[destination]]\ntype = \"desktop\"\n");
                     require(bare.ok(), "bare config should parse");
                     require(!bare.value().stream.enabled, "streaming off by default");
                     require(bare.value().stream.redirect == cfg::Redirect::Stdout,
                             "redirect defaults to stdout without a [stream] table");

                     auto explicit_stream = cfg::parse_config(
                         "[stream]\nenabled = true\n[[destination]]\ntype = \"desktop\"\n");
                     require(explicit_stream.ok(), "stream config should parse");
                     require(!explicit_stream.value().stream.redirect.has_value(),
                             "an explicit [stream] table without redirect echoes nothing");
                   }});

  tests.push_back({"config_custom_content_type_defaults_to_plain_text", [] {
                     auto parsed = cfg::parse_config(
                         "[[destination]]\ntype = \"webhook\"\nurl = \"https://x.test/\"\n"
                         "format = \"custom\"\ntemplate = \"$(message)\"\n");
                     require(parsed.ok(), "config should parse");
                     const auto &hook = std::get<cfg::WebhookDestination>(parsed.value().destinations[0]);
                     require_eq(std::get<cfg::CustomFormat>(hook.format).content_type, "text/plain",
                                "default content type");
                   }});

  tests.push_back({"config_rejects_unknown_values", [] {
                     require(!cfg::parse_config("[[destination]]\ntype = \"pager\"\n").ok(),
                             "unknown destination type");
                     require(!cfg::parse_config("[[destination]]\ntype = \"webhook\"\n"
                                                "url = \"https://x.test\"\nformat = \"slack\"\n")
                                  .ok(),
                             "unknown format");
                     require(!cfg::parse_config("[[destination]]\ntype = \"webhook\"\n"
                                                "url = \"https://x.test\"\nformat = \"custom\"\n"
                                                "template = \"x\"\nmethod = \"DELETE\"\n")
                                  .ok(),
                             "unsupported method");
                     require(!cfg::parse_config("[stream]\nenabled = true\nredirect = \"file\"\n").ok(),
                             "unknown redirect");
                     require(!cfg::parse_config("[[destination]]\nsummary = \"x\"\n").ok(),
                             "destination without type");
                   }});

  tests.push_back({"config_validation_failures", [] {
                     cfg::Config empty;
                     require(!cfg::validate_config(empty).ok(), "empty destination list");

                     cfg::Config relative = cfg::default_desktop();
                     relative.destinations.push_back(noti::testing::webhook("/hooks/1"));
                     require(!cfg::validate_config(relative).ok(), "relative url rejected");

                     cfg::Config ftp = cfg::default_desktop();
                     ftp.destinations.push_back(noti::testing::webhook("ftp://host/x"));
                     require(!cfg::validate_config(ftp).ok(), "non-http scheme rejected");

                     cfg::Config blank = cfg::default_desktop();
                     blank.destinations.push_back(
                         noti::testing::webhook("https://x.test/", cfg::CustomFormat{}));
                     require(!cfg::validate_config(blank).ok(), "custom format with nothing to send");

                     cfg::Config bad_pattern = cfg::default_desktop();
                     bad_pattern.stream.matching = "(unclosed";
                     require(!cfg::validate_config(bad_pattern).ok(), "pattern must compile");

                     cfg::Config bad_backend = cfg::default_desktop();
                     bad_backend.observability.backend = "statsd";
                     require(!cfg::validate_config(bad_backend).ok(), "unknown observer backend");

                     require(cfg::validate_config(cfg::default_webhook()).ok(), "template is valid");
                   }});

  tests.push_back({"config_save_and_load_custom_template", [] {
                     noti::testing::TempDir dir;
                     const auto path = dir.path() / "noti.toml";
                     require(cfg::save_config(cfg::default_custom_webhook(), path).ok(), "save");
                     auto loaded = cfg::load_config(path);
                     require(loaded.ok(), "saved config should load");
                     const auto &hook =
                         std::get<cfg::WebhookDestination>(loaded.value().destinations.at(0));
                     const auto &custom = std::get<cfg::CustomFormat>(hook.format);
                     require_eq(custom.template_body, R"json({"content": "$(message)"})json",
                                "quotes survive the round trip");
                     require(custom.escape, "escape survives");
                     require(loaded.value().stream.redirect == cfg::Redirect::Stdout,
                             "template redirects to stdout");
                   }});

  tests.push_back({"config_save_refuses_overwrite", [] {
                     noti::testing::TempDir dir;
                     const auto path = dir.write_file("noti.toml", "# mine\n");
                     const auto status = cfg::save_config(cfg::default_desktop(), path);
                     require(!status.ok(), "existing file must not be replaced");
                     require(status.error().find("already exists") != std::string::npos,
                             "conflict message");
                   }});

  tests.push_back({"config_missing_file_message", [] {
                     noti::testing::TempDir dir;
                     auto loaded = cfg::load_config(dir.path() / "absent.toml");
                     require(!loaded.ok(), "missing file should fail");
                     require(loaded.error().find("No config file found") != std::string::npos,
                             "helpful message");
                   }});

  tests.push_back({"config_path_prefers_override_then_env", [] {
                     const auto previous = cfg::config_path_override();
                     const char *previous_env = std::getenv("NOTI_CONFIG");
                     const std::optional<std::string> saved_env =
                         previous_env != nullptr ? std::optional<std::string>(previous_env)
                                                 : std::nullopt;

                     setenv("NOTI_CONFIG", "/tmp/from-env.toml", 1);
                     cfg::set_config_path_override(std::filesystem::path("/tmp/override.toml"));
                     const std::string with_override = cfg::config_path().string();
                     cfg::clear_config_path_override();
                     const std::string with_env = cfg::config_path().string();
                     unsetenv("NOTI_CONFIG");
                     const std::string fallback = cfg::config_path().string();

                     if (saved_env.has_value()) {
                       setenv("NOTI_CONFIG", saved_env->c_str(), 1);
                     }
                     cfg::set_config_path_override(previous);

                     require_eq(with_override, "/tmp/override.toml", "override wins");
                     require_eq(with_env, "/tmp/from-env.toml", "environment next");
                     require_eq(fallback, "noti.toml", "working directory default");
                   }});

  tests.push_back({"config_webhook_url_is_verbatim", [] {
                     setenv("NOTI_TEST_SIG", "expanded", 1);
                     auto parsed = cfg::parse_config(
                         "[[destination]]\ntype = \"webhook\"\n"
                         "url = \"  https://hooks.example.com/x?sig=$abc&v=${NOTI_TEST_SIG}  \"\n");
                     unsetenv("NOTI_TEST_SIG");
                     require(parsed.ok(), "config should parse");
                     const auto &hook = std::get<cfg::WebhookDestination>(parsed.value().destinations[0]);
                     require_eq(hook.url, "https://hooks.example.com/x?sig=$abc&v=${NOTI_TEST_SIG}",
                                "only surrounding whitespace is trimmed");
                   }});

  tests.push_back({"config_stream_max_in_flight", [] {
                     auto bare = cfg::parse_config("[[destination]]\ntype = \"desktop\"\n");
                     require(bare.ok(), "bare config should parse");
                     require(bare.value().stream.max_in_flight == 16, "default cap");

                     auto capped = cfg::parse_config(
                         "[stream]\nenabled = true\nmax_in_flight = 4\n[[destination]]\ntype = \"desktop\"\n");
                     require(capped.ok(), "capped config should parse");
                     require(capped.value().stream.max_in_flight == 4, "cap read from [stream]");
                     require(cfg::validate_config(capped.value()).ok(), "positive cap is valid");

                     auto zero = capped.value();
                     zero.stream.max_in_flight = 0;
                     require(!cfg::validate_config(zero).ok(), "zero cap rejected");
                   }});
}
