#pragma once

#include "toolhost/supervisor/LogEntry.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace toolhost {

/// Fixed-capacity FIFO of recent output lines for one launch.
/// The producer never blocks; when full the incoming entry is dropped and
/// the oldest contents are kept.
class LogBuffer {
public:
  static constexpr std::size_t kDefaultCapacity = 1000;

  explicit LogBuffer(std::size_t capacity = kDefaultCapacity);

  /// Returns false if the entry was dropped because the buffer is full
  bool try_push(LogEntry entry);

  /// Remove and return up to max_entries entries in arrival order
  std::vector<LogEntry> drain(std::size_t max_entries);

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }
  uint64_t dropped() const;

private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<LogEntry> entries_;
  uint64_t dropped_{0};
};

} // namespace toolhost
