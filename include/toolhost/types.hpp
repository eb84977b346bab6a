#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace toolhost {

/// Lifecycle state of a supervised tool process
enum class ToolStatus : uint8_t {
  NotStarted = 0,
  Starting = 1,
  Running = 2,
  Error = 3,
  Stopped = 4
};

/// Convert ToolStatus to string
inline const char *status_to_string(ToolStatus status) {
  switch (status) {
  case ToolStatus::NotStarted:
    return "not_started";
  case ToolStatus::Starting:
    return "starting";
  case ToolStatus::Running:
    return "running";
  case ToolStatus::Error:
    return "error";
  case ToolStatus::Stopped:
    return "stopped";
  default:
    return "unknown";
  }
}

/// One row of Supervisor::list()
struct ToolSummary {
  std::string tool_id;
  std::string display_name;
  ToolStatus status{ToolStatus::NotStarted};
  int pid{0};
  std::chrono::seconds uptime{0};
  std::string log_file;
};

/// One row of Supervisor::tools()
struct ToolInfo {
  std::string tool_id;
  std::string display_name;
  std::string directory;
  bool installed{false};
};

} // namespace toolhost
