#pragma once

#include <iosfwd>
#include <mutex>
#include <string>

namespace noti::common {

/// Process-wide lock for the standard streams. Stream echo and log lines may
/// share stderr and must not interleave mid-line.
std::mutex &console_mutex();

/// Writes `line` and a newline to `out` under console_mutex(), then flushes.
void write_console_line(std::ostream &out, const std::string &line);

} // namespace noti::common
