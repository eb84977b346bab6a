#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace toolhost {

/// Only this centralization method contributes command-line arguments
inline constexpr const char *kCentralizationCliArguments = "CLI arguments";

/// Replaced by WorkspaceSettings::models_dir in centralization arguments
inline constexpr const char *kModelsDirPlaceholder = "{models_dir}";

struct ModelCentralization {
  std::string method; // "CLI arguments", "symlinks", ...
  std::vector<std::string> args;
};

/// Resolved configuration of one managed back-end. Read-only after load.
struct ToolConfig {
  std::string id;
  std::string display_name;
  std::filesystem::path directory;   // working directory of the child
  std::filesystem::path interpreter; // e.g. <directory>/venv/bin/python
  std::string entry_script;          // relative to directory
  std::vector<std::string> default_args;
  std::map<std::string, std::vector<std::string>> hardware_profiles;
  ModelCentralization centralization;

  bool is_installed() const;
};

struct WorkspaceSettings {
  std::filesystem::path workspace_dir;
  std::filesystem::path models_dir;
  std::filesystem::path logs_dir;
};

struct SupervisorSettings {
  std::chrono::milliseconds stop_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds startup_grace{std::chrono::seconds(30)};
  std::size_t log_buffer_capacity{1000};
  std::string log_level{"info"};
};

struct SupervisorConfig {
  WorkspaceSettings workspace;
  SupervisorSettings supervisor;
  std::map<std::string, std::shared_ptr<const ToolConfig>> tools;

  /// Throws ConfigurationError for an unknown id
  std::shared_ptr<const ToolConfig> tool(const std::string &tool_id) const;

  bool has_tool(const std::string &tool_id) const {
    return tools.count(tool_id) > 0;
  }
};

} // namespace toolhost
