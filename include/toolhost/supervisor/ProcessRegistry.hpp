#pragma once
#include "toolhost/config/ToolConfig.hpp"
#include "toolhost/process/ChildProcess.hpp"
#include "toolhost/supervisor/LogBuffer.hpp"
#include "toolhost/types.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace toolhost {

/// Lifecycle state of one launch. Everything except the status is fixed at
/// construction; the status is guarded by the record's own lock.
class ProcessRecord {
public:
  ProcessRecord(std::string tool_id,
                std::shared_ptr<process::ChildProcess> process,
                std::vector<std::string> command,
                std::filesystem::path log_file,
                std::shared_ptr<const ToolConfig> config,
                std::chrono::steady_clock::time_point start_time,
                std::size_t buffer_capacity = LogBuffer::kDefaultCapacity);

  const std::string &tool_id() const { return tool_id_; }
  process::ChildProcess &process() const { return *process_; }
  std::shared_ptr<process::ChildProcess> process_handle() const {
    return process_;
  }
  const std::vector<std::string> &command() const { return command_; }
  const std::filesystem::path &log_file_path() const { return log_file_; }
  const ToolConfig &config() const { return *config_; }
  std::chrono::steady_clock::time_point start_time() const {
    return start_time_;
  }
  LogBuffer &log_buffer() { return buffer_; }

  ToolStatus status() const;

  /// Apply a transition; ignored once the record is Stopped.
  /// Returns true if the status changed.
  bool apply_transition(ToolStatus next);

  /// Promote Starting to Running; false if the status was anything else
  bool promote_if_starting();

  /// Terminal transition. Returns false if already Stopped.
  bool mark_stopped();

  /// Serializes concurrent stop requests for this launch
  std::mutex &stop_mutex() { return stop_mutex_; }

private:
  const std::string tool_id_;
  const std::shared_ptr<process::ChildProcess> process_;
  const std::vector<std::string> command_;
  const std::filesystem::path log_file_;
  const std::shared_ptr<const ToolConfig> config_;
  const std::chrono::steady_clock::time_point start_time_;

  LogBuffer buffer_;

  mutable std::mutex mutex_;
  ToolStatus status_{ToolStatus::Starting};

  std::mutex stop_mutex_;
};

/// Authoritative map from tool id to its current ProcessRecord
class ProcessRegistry {
public:
  ProcessRegistry() = default;

  ProcessRegistry(const ProcessRegistry &) = delete;
  ProcessRegistry &operator=(const ProcessRegistry &) = delete;

  /// Insert or replace the current record for tool_id.
  /// Returns the record it replaced, if any.
  std::shared_ptr<ProcessRecord>
  register_record(const std::string &tool_id,
                  std::shared_ptr<ProcessRecord> record);

  /// nullptr if tool_id has no record
  std::shared_ptr<ProcessRecord> get(const std::string &tool_id) const;

  bool has(const std::string &tool_id) const;

  /// Returns false if tool_id has no record
  bool update_status(const std::string &tool_id, ToolStatus status);

  std::vector<std::pair<std::string, std::shared_ptr<ProcessRecord>>>
  list() const;

  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<ProcessRecord>> records_;
};

} // namespace toolhost
