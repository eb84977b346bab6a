#include "toolhost/supervisor/Terminator.hpp"
#include "toolhost/Logger.hpp"
#include "toolhost/errors.hpp"

namespace toolhost {

Terminator::Terminator(ProcessRegistry &registry,
                       std::chrono::milliseconds timeout)
    : registry_(registry), timeout_(timeout) {}

bool Terminator::stop(const std::string &tool_id) {
  auto record = registry_.get(tool_id);
  if (!record) {
    LOG_DEBUG("TERMINATOR", tool_id, "Nothing to stop");
    return true;
  }
  return stop(record);
}

bool Terminator::stop(const std::shared_ptr<ProcessRecord> &record) {
  const std::string &tool_id = record->tool_id();
  std::lock_guard stop_lock(record->stop_mutex());

  auto &process = record->process();
  if (!process.group_alive()) {
    record->mark_stopped();
    LOG_DEBUG("TERMINATOR", tool_id, "Process already exited");
    return true;
  }

  if (process.is_alive()) {
    LOG_INFO("TERMINATOR", tool_id, "Stopping PID={} (timeout {}ms)",
             process.pid(), timeout_.count());
  } else {
    LOG_INFO("TERMINATOR", tool_id,
             "PID={} exited but its process group is still running, "
             "stopping group (timeout {}ms)",
             process.pid(), timeout_.count());
  }

  if (!process.terminate()) {
    TerminationError err("Failed to signal PID=" +
                         std::to_string(process.pid()));
    LOG_ERROR("TERMINATOR", tool_id, "{}", err.what());
    return false;
  }

  if (!process.wait_for_exit(timeout_)) {
    LOG_WARN("TERMINATOR", tool_id,
             "PID={} still running after {}ms, force killing", process.pid(),
             timeout_.count());
    if (!process.kill()) {
      TerminationError err("Failed to kill PID=" +
                           std::to_string(process.pid()));
      LOG_ERROR("TERMINATOR", tool_id, "{}", err.what());
      return false;
    }
    process.wait();
  }

  record->mark_stopped();
  LOG_INFO("TERMINATOR", tool_id, "Stopped (exit code {})",
           process.exit_code().value_or(0));
  return true;
}

} // namespace toolhost
