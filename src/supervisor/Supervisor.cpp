#include "toolhost/supervisor/Supervisor.hpp"
#include "toolhost/Logger.hpp"

namespace toolhost {

static std::shared_ptr<process::ProcessSpawner>
default_spawner(std::shared_ptr<process::ProcessSpawner> spawner) {
  if (spawner)
    return spawner;
  return std::make_shared<process::PosixProcessSpawner>();
}

static SteadyClock default_clock(SteadyClock clock) {
  if (clock)
    return clock;
  return []() { return std::chrono::steady_clock::now(); };
}

Supervisor::Supervisor(SupervisorConfig config,
                       std::shared_ptr<process::ProcessSpawner> spawner,
                       SteadyClock clock)
    : config_(std::move(config)),
      spawner_(default_spawner(std::move(spawner))),
      clock_(default_clock(std::move(clock))),
      launcher_(config_, registry_, *spawner_, clock_),
      terminator_(registry_, config_.supervisor.stop_timeout) {
  LOG_DEBUG("SUPERVISOR", "INIT", "{} tools configured, logs in {}",
            config_.tools.size(), config_.workspace.logs_dir.string());
}

Supervisor::~Supervisor() {
  stop_all();
  launcher_.join_all();
}

bool Supervisor::launch(const std::string &tool_id,
                        const std::vector<std::string> &custom_args,
                        const std::optional<std::string> &hardware_profile) {
  return launcher_.launch(tool_id, custom_args, hardware_profile);
}

bool Supervisor::stop(const std::string &tool_id) {
  return terminator_.stop(tool_id);
}

ToolStatus Supervisor::status(const std::string &tool_id) {
  auto record = registry_.get(tool_id);
  if (!record)
    return ToolStatus::NotStarted;

  if (!record->process().is_alive()) {
    if (record->mark_stopped()) {
      LOG_INFO("SUPERVISOR", tool_id, "Process exited, status -> stopped");
    }
    return ToolStatus::Stopped;
  }

  if (record->status() == ToolStatus::Starting &&
      clock_() - record->start_time() > config_.supervisor.startup_grace) {
    if (record->promote_if_starting()) {
      LOG_INFO("SUPERVISOR", tool_id,
               "No startup message after {}s, assuming running",
               std::chrono::duration_cast<std::chrono::seconds>(
                   config_.supervisor.startup_grace)
                   .count());
    }
  }
  return record->status();
}

std::vector<std::string> Supervisor::logs(const std::string &tool_id,
                                          std::size_t max_lines) {
  std::vector<std::string> lines;
  auto record = registry_.get(tool_id);
  if (!record)
    return lines;

  auto entries = record->log_buffer().drain(max_lines);
  lines.reserve(entries.size());
  for (const auto &entry : entries) {
    lines.push_back(entry.format());
  }
  return lines;
}

std::vector<ToolSummary> Supervisor::list() {
  std::vector<ToolSummary> out;
  for (const auto &[tool_id, record] : registry_.list()) {
    ToolSummary summary;
    summary.tool_id = tool_id;
    summary.display_name = record->config().display_name;
    summary.status = status(tool_id);
    summary.pid = record->process().pid();
    if (summary.status != ToolStatus::Stopped) {
      summary.uptime = std::chrono::duration_cast<std::chrono::seconds>(
          clock_() - record->start_time());
    }
    summary.log_file = record->log_file_path().string();
    out.push_back(std::move(summary));
  }
  return out;
}

std::vector<ToolInfo> Supervisor::tools() const {
  std::vector<ToolInfo> out;
  out.reserve(config_.tools.size());
  for (const auto &[tool_id, tool] : config_.tools) {
    out.push_back(ToolInfo{tool_id, tool->display_name,
                           tool->directory.string(), tool->is_installed()});
  }
  return out;
}

std::vector<std::string>
Supervisor::command_for(const std::string &tool_id,
                        const std::vector<std::string> &custom_args,
                        const std::optional<std::string> &hardware_profile) const {
  auto tool = config_.tool(tool_id);
  return build_command(*tool, config_.workspace, custom_args,
                       hardware_profile);
}

void Supervisor::stop_all() {
  auto records = registry_.list();
  LOG_INFO("SUPERVISOR", "STOP_ALL", "Stopping {} tools", records.size());

  for (const auto &[tool_id, record] : records) {
    if (!terminator_.stop(record)) {
      LOG_ERROR("SUPERVISOR", "STOP_ALL", "Could not stop {}", tool_id);
    }
  }
}

} // namespace toolhost
