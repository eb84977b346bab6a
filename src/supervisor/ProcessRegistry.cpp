#include "toolhost/supervisor/ProcessRegistry.hpp"
#include "toolhost/Logger.hpp"

namespace toolhost {

ProcessRecord::ProcessRecord(std::string tool_id,
                             std::shared_ptr<process::ChildProcess> process,
                             std::vector<std::string> command,
                             std::filesystem::path log_file,
                             std::shared_ptr<const ToolConfig> config,
                             std::chrono::steady_clock::time_point start_time,
                             std::size_t buffer_capacity)
    : tool_id_(std::move(tool_id)), process_(std::move(process)),
      command_(std::move(command)), log_file_(std::move(log_file)),
      config_(std::move(config)), start_time_(start_time),
      buffer_(buffer_capacity) {}

ToolStatus ProcessRecord::status() const {
  std::lock_guard lock(mutex_);
  return status_;
}

bool ProcessRecord::apply_transition(ToolStatus next) {
  std::lock_guard lock(mutex_);
  if (status_ == ToolStatus::Stopped || status_ == next)
    return false;
  if (next == ToolStatus::NotStarted)
    return false;
  status_ = next;
  return true;
}

bool ProcessRecord::promote_if_starting() {
  std::lock_guard lock(mutex_);
  if (status_ != ToolStatus::Starting)
    return false;
  status_ = ToolStatus::Running;
  return true;
}

bool ProcessRecord::mark_stopped() {
  std::lock_guard lock(mutex_);
  if (status_ == ToolStatus::Stopped)
    return false;
  status_ = ToolStatus::Stopped;
  return true;
}

std::shared_ptr<ProcessRecord>
ProcessRegistry::register_record(const std::string &tool_id,
                                 std::shared_ptr<ProcessRecord> record) {
  std::lock_guard lock(mutex_);
  std::shared_ptr<ProcessRecord> previous;
  auto it = records_.find(tool_id);
  if (it != records_.end()) {
    previous = std::move(it->second);
    it->second = std::move(record);
    LOG_DEBUG("REGISTRY", tool_id, "Replaced previous record");
  } else {
    records_.emplace(tool_id, std::move(record));
  }
  return previous;
}

std::shared_ptr<ProcessRecord>
ProcessRegistry::get(const std::string &tool_id) const {
  std::lock_guard lock(mutex_);
  auto it = records_.find(tool_id);
  if (it == records_.end()) {
    return nullptr;
  }
  return it->second;
}

bool ProcessRegistry::has(const std::string &tool_id) const {
  std::lock_guard lock(mutex_);
  return records_.count(tool_id) > 0;
}

bool ProcessRegistry::update_status(const std::string &tool_id,
                                    ToolStatus status) {
  auto record = get(tool_id);
  if (!record)
    return false;
  if (status == ToolStatus::Stopped) {
    record->mark_stopped();
  } else {
    record->apply_transition(status);
  }
  return true;
}

std::vector<std::pair<std::string, std::shared_ptr<ProcessRecord>>>
ProcessRegistry::list() const {
  std::lock_guard lock(mutex_);
  std::vector<std::pair<std::string, std::shared_ptr<ProcessRecord>>> out;
  out.reserve(records_.size());
  for (const auto &[tool_id, record] : records_) {
    out.emplace_back(tool_id, record);
  }
  return out;
}

std::size_t ProcessRegistry::size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

} // namespace toolhost
