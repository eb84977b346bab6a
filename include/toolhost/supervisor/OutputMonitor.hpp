#pragma once
#include "toolhost/supervisor/ProcessRegistry.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

namespace toolhost {

/// Worker owning one launched process's output stream. Each line is
/// appended to the launch log file, offered to the record's LogBuffer and
/// fed to the StatusClassifier. Ends when the stream closes or a read
/// fails; there is no other way to cancel it.
class OutputMonitor {
public:
  explicit OutputMonitor(std::shared_ptr<ProcessRecord> record);
  ~OutputMonitor();

  OutputMonitor(const OutputMonitor &) = delete;
  OutputMonitor &operator=(const OutputMonitor &) = delete;

  /// Start the worker thread; throws std::system_error if it can't
  void start();

  /// Wait for the worker to finish
  void join();

  /// False once the stream has ended; join() then returns promptly
  bool is_running() const { return running_; }
  uint64_t lines_processed() const { return lines_processed_; }
  const std::shared_ptr<ProcessRecord> &record() const { return record_; }

private:
  void run();

  std::shared_ptr<ProcessRecord> record_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> lines_processed_{0};
};

} // namespace toolhost
