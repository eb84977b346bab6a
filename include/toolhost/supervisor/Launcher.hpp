#pragma once
#include "toolhost/config/ToolConfig.hpp"
#include "toolhost/process/ProcessSpawner.hpp"
#include "toolhost/supervisor/OutputMonitor.hpp"
#include "toolhost/supervisor/ProcessRegistry.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolhost {

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

/// Command line in fixed order: interpreter, entry script, default args,
/// hardware-profile args, centralized-model args, custom args.
std::vector<std::string>
build_command(const ToolConfig &tool, const WorkspaceSettings &workspace,
              const std::vector<std::string> &custom_args = {},
              const std::optional<std::string> &hardware_profile = {});

/// Starts tool processes and their Output Monitors
class Launcher {
public:
  Launcher(const SupervisorConfig &config, ProcessRegistry &registry,
           process::ProcessSpawner &spawner, SteadyClock clock);
  ~Launcher();

  Launcher(const Launcher &) = delete;
  Launcher &operator=(const Launcher &) = delete;

  /// Throws ConfigurationError for an unknown tool_id. Every other failure
  /// is logged and reported as false with the registry left untouched.
  bool launch(const std::string &tool_id,
              const std::vector<std::string> &custom_args = {},
              const std::optional<std::string> &hardware_profile = {});

  /// Wait for every monitor started so far (after their processes ended)
  void join_all();

  /// Monitors not yet joined; finished ones are pruned on every launch
  std::size_t monitor_count() const;

private:
  std::filesystem::path make_log_path(const std::string &tool_id) const;
  void prune_finished_monitors();

  const SupervisorConfig &config_;
  ProcessRegistry &registry_;
  process::ProcessSpawner &spawner_;
  SteadyClock clock_;

  std::mutex launch_mutex_;

  mutable std::mutex monitors_mutex_;
  std::vector<std::unique_ptr<OutputMonitor>> monitors_;
};

} // namespace toolhost
