#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace toolhost {

/// One captured output line, immutable once created
struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  std::string text;

  /// "[HH:MM:SS] <text>" in local time
  std::string format() const;
};

/// Local wall-clock time as HH:MM:SS
std::string format_clock(std::chrono::system_clock::time_point tp);

/// Replace every invalid UTF-8 sequence with U+FFFD
std::string sanitize_utf8(std::string_view input);

} // namespace toolhost
