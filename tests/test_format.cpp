#include "test_framework.hpp"

#include "noti/common/json_util.hpp"
#include "noti/format/formatter.hpp"

namespace {

noti::config::CustomFormat custom(const std::string &content_type, const std::string &body,
                                  const bool escape) {
  noti::config::CustomFormat out;
  out.content_type = content_type;
  out.template_body = body;
  out.escape = escape;
  return out;
}

} // namespace

void register_format_tests(std::vector<noti::tests::TestCase> &tests) {
  using noti::tests::require;
  using noti::tests::require_eq;
  namespace cfg = noti::config;
  namespace fmt = noti::format;

  tests.push_back({"format_discord_wraps_content", [] {
                     auto payload = fmt::format_payload(cfg::DiscordFormat{}, "build done");
                     require(payload.ok(), "discord format should succeed");
                     require_eq(payload.value().content_type, "application/json", "content type");
                     require_eq(payload.value().body, R"json({"content":"build done"})json", "body");
                   }});

  tests.push_back({"format_google_chat_wraps_text", [] {
                     auto payload = fmt::format_payload(cfg::GoogleChatFormat{}, "hi");
                     require(payload.ok(), "google chat format should succeed");
                     require_eq(payload.value().content_type, "application/json", "content type");
                     require_eq(payload.value().body, R"json({"text":"hi"})json", "body");
                   }});

  tests.push_back({"format_plain_text_is_raw", [] {
                     const std::string message = "a \"quoted\" \\ line\n";
                     auto payload = fmt::format_payload(cfg::PlainTextFormat{}, message);
                     require(payload.ok(), "plain text format should succeed");
                     require_eq(payload.value().content_type, "text/plain", "content type");
                     require_eq(payload.value().body, message, "plain text must not be escaped");
                   }});

  tests.push_back({"format_json_escaping_is_exact", [] {
                     const std::string message =
                         std::string("say \"hi\" \\ path\nnext\ttab\rcr") + '\x01' + '\x1f' + "end";
                     const std::string escaped =
                         R"esc(say \"hi\" \\ path\nnext\ttab\rcr\u0001\u001fend)esc";

                     auto discord = fmt::format_payload(cfg::DiscordFormat{}, message);
                     require(discord.ok(), "discord format should succeed");
                     require_eq(discord.value().body, "{\"content\":\"" + escaped + "\"}",
                                "discord body escapes quotes, backslashes and control bytes");

                     auto chat = fmt::format_payload(cfg::GoogleChatFormat{}, message);
                     require(chat.ok(), "google chat format should succeed");
                     require_eq(chat.value().body, "{\"text\":\"" + escaped + "\"}",
                                "google chat body uses the same escaping");
                   }});

  tests.push_back({"format_json_escape_leaves_utf8_alone", [] {
                     require_eq(noti::common::json_escape("caf\xc3\xa9 \xf0\x9f\x98\x80 \x7f"),
                                "caf\xc3\xa9 \xf0\x9f\x98\x80 \x7f",
                                "bytes at or above 0x20 pass through");
                   }});

  tests.push_back({"format_custom_substitutes_without_escape", [] {
                     auto payload =
                         fmt::format_payload(custom("text/plain", "X $(message) Y", false), "hi");
                     require(payload.ok(), "custom format should succeed");
                     require_eq(payload.value().body, "X hi Y", "substituted body");
                     require_eq(payload.value().content_type, "text/plain", "verbatim content type");
                   }});

  tests.push_back({"format_custom_json_escape", [] {
                     auto payload = fmt::format_payload(
                         custom("application/json", "X $(message) Y", true), "a\"b");
                     require(payload.ok(), "custom format should succeed");
                     require_eq(payload.value().body, "X a\\\"b Y", "json-escaped substitution");
                   }});

  tests.push_back({"format_custom_escape_ignored_for_non_json", [] {
                     auto payload =
                         fmt::format_payload(custom("text/html", "<p>$(message)</p>", true), "a\"b");
                     require(payload.ok(), "custom format should succeed");
                     require_eq(payload.value().body, "<p>a\"b</p>", "no escaping for non-json");
                   }});

  tests.push_back({"format_custom_json_content_type_case_insensitive", [] {
                     auto payload = fmt::format_payload(
                         custom("Application/JSON; charset=utf-8", R"json({"m":"$(message)"})json", true),
                         "x\\y");
                     require(payload.ok(), "custom format should succeed");
                     require_eq(payload.value().body, R"json({"m":"x\\y"})json",
                                "backslash escaped for a mixed-case json content type");
                   }});

  tests.push_back({"format_custom_without_token_omits_message", [] {
                     auto payload = fmt::format_payload(custom("text/plain", "deploy finished", false),
                                                        "secret text");
                     require(payload.ok(), "template without token is still valid");
                     require_eq(payload.value().body, "deploy finished", "fixed template body");
                   }});

  tests.push_back({"format_custom_replaces_every_token_once", [] {
                     auto payload = fmt::format_payload(
                         custom("text/plain", "$(message)|$(message)", false), "$(message)");
                     require(payload.ok(), "custom format should succeed");
                     require_eq(payload.value().body, "$(message)|$(message)",
                                "inserted text is not substituted again");
                   }});

  tests.push_back({"format_custom_empty_template_and_type_fails", [] {
                     auto payload = fmt::format_payload(custom("", "", false), "hi");
                     require(!payload.ok(), "nothing to send should fail");
                   }});

  tests.push_back({"format_is_deterministic", [] {
                     const cfg::FormatSpec spec = custom("application/json", R"json({"a":"$(message)"})json", true);
                     auto first = fmt::format_payload(spec, "same \"input\"");
                     auto second = fmt::format_payload(spec, "same \"input\"");
                     require(first.ok() && second.ok(), "format should succeed");
                     require_eq(first.value().body, second.value().body, "identical bodies");
                     require_eq(first.value().content_type, second.value().content_type,
                                "identical content types");
                   }});
}
