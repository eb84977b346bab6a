#pragma once
#include "toolhost/config/ToolConfig.hpp"
#include "toolhost/process/ProcessSpawner.hpp"
#include "toolhost/supervisor/Launcher.hpp"
#include "toolhost/supervisor/ProcessRegistry.hpp"
#include "toolhost/supervisor/Terminator.hpp"
#include "toolhost/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolhost {

/// Entry point used by the CLI: launch, stop, status and log draining for
/// every configured tool.
class Supervisor {
public:
  /// spawner defaults to PosixProcessSpawner, clock to steady_clock::now
  explicit Supervisor(SupervisorConfig config,
                      std::shared_ptr<process::ProcessSpawner> spawner = {},
                      SteadyClock clock = {});

  /// Stops every live tool and joins all monitors
  ~Supervisor();

  Supervisor(const Supervisor &) = delete;
  Supervisor &operator=(const Supervisor &) = delete;

  /// Throws ConfigurationError for an unknown tool_id
  bool launch(const std::string &tool_id,
              const std::vector<std::string> &custom_args = {},
              const std::optional<std::string> &hardware_profile = {});

  bool stop(const std::string &tool_id);

  /// Reconciles with the process: exited means Stopped, and a tool still
  /// Starting after the startup grace period is promoted to Running.
  ToolStatus status(const std::string &tool_id);

  /// Drain up to max_lines "[HH:MM:SS] text" entries; never repeats one
  std::vector<std::string> logs(const std::string &tool_id,
                                std::size_t max_lines);

  std::vector<ToolSummary> list();

  std::vector<ToolInfo> tools() const;

  /// Dry run of the command builder; throws ConfigurationError
  std::vector<std::string>
  command_for(const std::string &tool_id,
              const std::vector<std::string> &custom_args = {},
              const std::optional<std::string> &hardware_profile = {}) const;

  void stop_all();

  const SupervisorConfig &config() const { return config_; }
  ProcessRegistry &registry() { return registry_; }

private:
  SupervisorConfig config_;
  std::shared_ptr<process::ProcessSpawner> spawner_;
  SteadyClock clock_;
  ProcessRegistry registry_;
  Launcher launcher_;
  Terminator terminator_;
};

} // namespace toolhost
