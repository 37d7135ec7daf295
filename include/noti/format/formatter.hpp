#pragma once

#include "noti/common/result.hpp"
#include "noti/config/schema.hpp"

#include <string>

namespace noti::format {

struct Payload {
  std::string content_type;
  std::string body;
};

/// Pure mapping from a format spec and a message to what goes on the wire.
/// Fails only for a custom format with neither template nor content type.
[[nodiscard]] common::Result<Payload> format_payload(const config::FormatSpec &spec,
                                                     const std::string &message);

/// Escapes `message` for substitution into a custom template. JSON content
/// types get JSON string escaping; anything else is returned unchanged.
[[nodiscard]] std::string escape_for_content_type(const std::string &content_type,
                                                  const std::string &message);

} // namespace noti::format
