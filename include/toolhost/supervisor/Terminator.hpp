#pragma once
#include "toolhost/supervisor/ProcessRegistry.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace toolhost {

/// Graceful-then-forced termination of tracked processes
class Terminator {
public:
  static constexpr std::chrono::milliseconds kDefaultTimeout{10000};

  explicit Terminator(ProcessRegistry &registry,
                      std::chrono::milliseconds timeout = kDefaultTimeout);

  /// SIGTERM, wait up to the timeout, then SIGKILL and wait for exit.
  /// Signals go to the whole process group, also after the launched
  /// process itself has exited while forked children keep running.
  /// Unknown tools and fully exited groups count as success. Returns false only
  /// when a signal could not be delivered; the caller may retry.
  bool stop(const std::string &tool_id);

  bool stop(const std::shared_ptr<ProcessRecord> &record);

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  ProcessRegistry &registry_;
  std::chrono::milliseconds timeout_;
};

} // namespace toolhost
