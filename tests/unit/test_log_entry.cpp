#include "toolhost/supervisor/LogEntry.hpp"

#include <gtest/gtest.h>
#include <ctime>
#include <regex>

using namespace toolhost;

TEST(LogEntry, FormatHasClockPrefix) {
  LogEntry entry{std::chrono::system_clock::now(), "Model loaded"};
  std::string formatted = entry.format();

  EXPECT_TRUE(std::regex_match(formatted,
                               std::regex(R"(\[\d{2}:\d{2}:\d{2}\] Model loaded)")))
      << formatted;
}

TEST(LogEntry, FormatClockMatchesLocalTime) {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm local{};
  localtime_r(&t, &local);

  char expected[16];
  std::strftime(expected, sizeof(expected), "%H:%M:%S", &local);
  EXPECT_EQ(format_clock(now), expected);
}

TEST(Utf8, ValidTextUnchanged) {
  EXPECT_EQ(sanitize_utf8("plain ascii"), "plain ascii");
  EXPECT_EQ(sanitize_utf8("progress \xE2\x96\x88\xE2\x96\x88 50%"),
            "progress \xE2\x96\x88\xE2\x96\x88 50%");
  EXPECT_EQ(sanitize_utf8("\xF0\x9F\x9A\x80 launch"), "\xF0\x9F\x9A\x80 launch");
}

TEST(Utf8, InvalidBytesReplaced) {
  EXPECT_EQ(sanitize_utf8("bad \xFF byte"), "bad \xEF\xBF\xBD byte");
  EXPECT_EQ(sanitize_utf8("\xC3"), "\xEF\xBF\xBD");
  // Truncated 3-byte sequence followed by ASCII
  EXPECT_EQ(sanitize_utf8("\xE2\x96x"), "\xEF\xBF\xBDx");
  // Overlong encoding of '/'
  EXPECT_EQ(sanitize_utf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(Utf8, LineNeverDropped) {
  std::string garbage = "\x80\x81\x82";
  auto out = sanitize_utf8(garbage);
  EXPECT_EQ(out, "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}
