#include "noti/common/console.hpp"

#include <ostream>

namespace noti::common {

std::mutex &console_mutex() {
  static std::mutex mutex;
  return mutex;
}

void write_console_line(std::ostream &out, const std::string &line) {
  std::lock_guard<std::mutex> lock(console_mutex());
  out << line << '\n';
  out.flush();
}

} // namespace noti::common
