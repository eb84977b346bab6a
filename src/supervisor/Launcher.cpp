#include "toolhost/supervisor/Launcher.hpp"
#include "toolhost/Logger.hpp"
#include "toolhost/errors.hpp"
#include <algorithm>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/ranges.h>
#include <iterator>
#include <system_error>

namespace toolhost {

namespace fs = std::filesystem;

static std::string replace_all(std::string text, const std::string &from,
                               const std::string &to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

std::vector<std::string>
build_command(const ToolConfig &tool, const WorkspaceSettings &workspace,
              const std::vector<std::string> &custom_args,
              const std::optional<std::string> &hardware_profile) {
  std::vector<std::string> command;
  command.push_back(tool.interpreter.string());
  command.push_back(tool.entry_script);
  command.insert(command.end(), tool.default_args.begin(),
                 tool.default_args.end());

  if (hardware_profile && !hardware_profile->empty()) {
    auto it = tool.hardware_profiles.find(*hardware_profile);
    if (it != tool.hardware_profiles.end()) {
      command.insert(command.end(), it->second.begin(), it->second.end());
    } else {
      LOG_WARN("LAUNCHER", tool.id,
               "No hardware profile '{}', launching without profile args",
               *hardware_profile);
    }
  }

  if (tool.centralization.method == kCentralizationCliArguments) {
    const std::string models_dir = workspace.models_dir.string();
    for (const auto &arg : tool.centralization.args) {
      command.push_back(replace_all(arg, kModelsDirPlaceholder, models_dir));
    }
  }

  command.insert(command.end(), custom_args.begin(), custom_args.end());
  return command;
}

Launcher::Launcher(const SupervisorConfig &config, ProcessRegistry &registry,
                   process::ProcessSpawner &spawner, SteadyClock clock)
    : config_(config), registry_(registry), spawner_(spawner),
      clock_(std::move(clock)) {}

Launcher::~Launcher() { join_all(); }

fs::path Launcher::make_log_path(const std::string &tool_id) const {
  std::time_t now = std::time(nullptr);
  return config_.workspace.logs_dir /
         fmt::format("{}_{:%Y%m%d_%H%M%S}.log", tool_id, fmt::localtime(now));
}

bool Launcher::launch(const std::string &tool_id,
                      const std::vector<std::string> &custom_args,
                      const std::optional<std::string> &hardware_profile) {
  auto tool = config_.tool(tool_id); // throws ConfigurationError

  std::lock_guard launch_lock(launch_mutex_);

  if (auto current = registry_.get(tool_id)) {
    if (current->process().is_alive()) {
      LOG_WARN("LAUNCHER", tool_id,
               "Already running (PID={}); stop it before launching again",
               current->process().pid());
      return false;
    }
  }

  if (!tool->is_installed()) {
    NotInstalledError err("Tool directory does not exist: " +
                          tool->directory.string());
    LOG_ERROR("LAUNCHER", tool_id, "{}", err.what());
    return false;
  }

  auto command = build_command(*tool, config_.workspace, custom_args,
                               hardware_profile);
  LOG_INFO("LAUNCHER", tool_id, "Launching {}: {}", tool->display_name,
           fmt::join(command, " "));

  std::error_code ec;
  fs::create_directories(config_.workspace.logs_dir, ec);
  if (ec) {
    LOG_WARN("LAUNCHER", tool_id, "Cannot create logs directory {}: {}",
             config_.workspace.logs_dir.string(), ec.message());
  }

  std::shared_ptr<process::ChildProcess> child =
      spawner_.spawn({command, tool->directory});
  if (!child) {
    LaunchError err("Failed to start " + tool->display_name);
    LOG_ERROR("LAUNCHER", tool_id, "{}", err.what());
    return false;
  }

  auto record = std::make_shared<ProcessRecord>(
      tool_id, child, std::move(command), make_log_path(tool_id), tool,
      clock_(), config_.supervisor.log_buffer_capacity);

  auto monitor = std::make_unique<OutputMonitor>(record);
  try {
    monitor->start();
  } catch (const std::system_error &ex) {
    LaunchError err(std::string("Cannot start output monitor: ") + ex.what());
    LOG_ERROR("LAUNCHER", tool_id, "{}", err.what());
    child->kill();
    child->wait();
    return false;
  }

  registry_.register_record(tool_id, record);

  prune_finished_monitors();
  {
    std::lock_guard lock(monitors_mutex_);
    monitors_.push_back(std::move(monitor));
  }

  LOG_INFO("LAUNCHER", tool_id, "Started PID={}, log file {} ({} monitors)",
           child->pid(), record->log_file_path().string(), monitor_count());
  return true;
}

void Launcher::prune_finished_monitors() {
  std::vector<std::unique_ptr<OutputMonitor>> finished;
  {
    std::lock_guard lock(monitors_mutex_);
    auto it = std::stable_partition(
        monitors_.begin(), monitors_.end(),
        [](const std::unique_ptr<OutputMonitor> &m) { return m->is_running(); });
    std::move(it, monitors_.end(), std::back_inserter(finished));
    monitors_.erase(it, monitors_.end());
  }
  for (auto &monitor : finished) {
    LOG_DEBUG("LAUNCHER", monitor->record()->tool_id(),
              "Joining finished monitor ({} lines)",
              monitor->lines_processed());
    monitor->join();
  }
}

void Launcher::join_all() {
  std::vector<std::unique_ptr<OutputMonitor>> monitors;
  {
    std::lock_guard lock(monitors_mutex_);
    monitors.swap(monitors_);
  }
  for (auto &monitor : monitors) {
    monitor->join();
  }
}

std::size_t Launcher::monitor_count() const {
  std::lock_guard lock(monitors_mutex_);
  return monitors_.size();
}

} // namespace toolhost
