#include "toolhost/supervisor/LogBuffer.hpp"
#include <algorithm>

namespace toolhost {

LogBuffer::LogBuffer(std::size_t capacity) : capacity_(capacity) {}

bool LogBuffer::try_push(LogEntry entry) {
  std::lock_guard lock(mutex_);
  if (entries_.size() >= capacity_) {
    ++dropped_;
    return false;
  }
  entries_.push_back(std::move(entry));
  return true;
}

std::vector<LogEntry> LogBuffer::drain(std::size_t max_entries) {
  std::lock_guard lock(mutex_);
  const std::size_t count = std::min(max_entries, entries_.size());

  std::vector<LogEntry> out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(std::move(entries_.front()));
    entries_.pop_front();
  }
  return out;
}

std::size_t LogBuffer::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

uint64_t LogBuffer::dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

} // namespace toolhost
