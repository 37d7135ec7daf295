#include "noti/common/json_util.hpp"


namespace noti::common {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default: {
      const auto uch = static_cast<unsigned char>(ch);
      if (uch < 0x20) {
        escaped += "\\u00";
        escaped.push_back(kHexDigits[uch >> 4]);
        escaped.push_back(kHexDigits[uch & 0x0F]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
    }
  }
  return escaped;
}

} // namespace noti::common
