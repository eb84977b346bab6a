#include "toolhost/supervisor/LogEntry.hpp"
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace toolhost {

std::string format_clock(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  return fmt::format("{:%H:%M:%S}", fmt::localtime(t));
}

std::string LogEntry::format() const {
  return fmt::format("[{}] {}", format_clock(timestamp), text);
}

std::string sanitize_utf8(std::string_view input) {
  static constexpr const char *kReplacement = "\xEF\xBF\xBD";

  std::string out;
  out.reserve(input.size());

  size_t i = 0;
  const size_t n = input.size();
  while (i < n) {
    const auto c = static_cast<unsigned char>(input[i]);
    if (c < 0x80) {
      out.push_back(static_cast<char>(c));
      ++i;
      continue;
    }

    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF; // bounds of the second byte
    if (c >= 0xC2 && c <= 0xDF) {
      len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
      len = 3;
      if (c == 0xE0)
        lo = 0xA0; // overlong
      if (c == 0xED)
        hi = 0x9F; // surrogates
    } else if (c >= 0xF0 && c <= 0xF4) {
      len = 4;
      if (c == 0xF0)
        lo = 0x90;
      if (c == 0xF4)
        hi = 0x8F;
    }

    if (len == 0) {
      out += kReplacement;
      ++i;
      continue;
    }

    // Consume the longest valid prefix; a broken sequence becomes one U+FFFD
    size_t j = 1;
    bool valid = true;
    for (; j < len; ++j) {
      if (i + j >= n) {
        valid = false;
        break;
      }
      const auto cc = static_cast<unsigned char>(input[i + j]);
      const unsigned char min = (j == 1) ? lo : 0x80;
      const unsigned char max = (j == 1) ? hi : 0xBF;
      if (cc < min || cc > max) {
        valid = false;
        break;
      }
    }

    if (valid) {
      out.append(input.data() + i, len);
      i += len;
    } else {
      out += kReplacement;
      i += j;
    }
  }
  return out;
}

} // namespace toolhost
