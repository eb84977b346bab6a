#include "toolhost/Logger.hpp"
#include "toolhost/config/ConfigLoader.hpp"
#include "toolhost/errors.hpp"
#include "toolhost/supervisor/Supervisor.hpp"
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace toolhost;

static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
  (void)sig;
  g_running = 0;
}

void print_usage() {
  std::cout << "Usage: toolhost [--config <file>] [--log-level <level>] "
               "<command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  tools                              List configured tools\n";
  std::cout << "  command <tool> [--profile P] [-- args...]\n";
  std::cout << "                                     Print resolved command "
               "line\n";
  std::cout << "  run <tool> [--profile P] [-- args...]\n";
  std::cout << "                                     Launch tool and follow "
               "its output\n";
  std::cout << "  shell                              Interactive supervisor "
               "prompt\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --config <file>      Configuration (.json/.yaml), default "
               "$TOOLHOST_CONFIG or ./config.json\n";
  std::cout << "  --log-level <level>  trace|debug|info|warn|error\n";
  std::cout << "\nShell commands:\n";
  std::cout << "  launch <tool> [--profile P] [args...]\n";
  std::cout << "  stop <tool> | status [tool] | logs <tool> [n] | list | "
               "tools | help | quit\n";
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "trace")
    return spdlog::level::trace;
  return spdlog::level::info;
}

struct LaunchArgs {
  std::string tool_id;
  std::optional<std::string> profile;
  std::vector<std::string> custom_args;
};

// <tool> [--profile P] [--] [args...]
static bool parse_launch_args(const std::vector<std::string> &tokens,
                              LaunchArgs &out) {
  if (tokens.empty())
    return false;
  out.tool_id = tokens[0];
  bool passthrough = false;
  for (size_t i = 1; i < tokens.size(); ++i) {
    const std::string &arg = tokens[i];
    if (!passthrough && arg == "--") {
      passthrough = true;
    } else if (!passthrough && arg == "--profile" && i + 1 < tokens.size()) {
      out.profile = tokens[++i];
    } else {
      out.custom_args.push_back(arg);
    }
  }
  return true;
}

static void print_tools(const Supervisor &supervisor) {
  for (const auto &info : supervisor.tools()) {
    std::cout << fmt::format("{:<16} {:<32} {}\n", info.tool_id,
                             info.display_name,
                             info.installed ? "installed" : "not installed");
  }
}

static void print_list(Supervisor &supervisor) {
  auto summaries = supervisor.list();
  if (summaries.empty()) {
    std::cout << "No tools launched\n";
    return;
  }
  for (const auto &s : summaries) {
    std::cout << fmt::format("{:<16} {:<12} pid={:<8} up={}s  {}\n", s.tool_id,
                             status_to_string(s.status), s.pid,
                             s.uptime.count(), s.log_file);
  }
}

int cmd_tools(Supervisor &supervisor, const std::vector<std::string> &args);
int cmd_command(Supervisor &supervisor, const std::vector<std::string> &args);
int cmd_run(Supervisor &supervisor, const std::vector<std::string> &args);
int cmd_shell(Supervisor &supervisor, const std::vector<std::string> &args);

int main(int argc, char **argv) {
  std::string config_path = default_config_path();
  std::string log_level;
  std::string command;
  std::vector<std::string> args;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (command.empty() && arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (command.empty() && arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (command.empty()) {
      command = arg;
    } else {
      args.push_back(arg);
    }
  }

  if (command.empty()) {
    print_usage();
    return 1;
  }
  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }
  if (command != "tools" && command != "command" && command != "run" &&
      command != "shell") {
    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage();
    return 1;
  }

  SupervisorConfig config;
  try {
    config = load_config(config_path);
  } catch (const ConfigurationError &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }

  std::error_code ec;
  std::filesystem::create_directories(config.workspace.logs_dir, ec);
  const auto diag_log = ec ? std::filesystem::path("toolhost.log")
                           : config.workspace.logs_dir / "toolhost.log";
  SupervisorLogger::instance().init(
      diag_log.string(),
      parse_log_level(log_level.empty() ? config.supervisor.log_level
                                        : log_level));

  LOG_DEBUG("MAIN", command, "Using configuration {}", config_path);

  try {
    Supervisor supervisor(std::move(config));
    if (command == "tools")
      return cmd_tools(supervisor, args);
    if (command == "command")
      return cmd_command(supervisor, args);
    if (command == "run")
      return cmd_run(supervisor, args);
    return cmd_shell(supervisor, args);
  } catch (const ConfigurationError &ex) {
    LOG_ERROR("MAIN", command, "{}", ex.what());
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}

int cmd_tools(Supervisor &supervisor, const std::vector<std::string> &args) {
  (void)args;
  print_tools(supervisor);
  return 0;
}

int cmd_command(Supervisor &supervisor, const std::vector<std::string> &args) {
  LaunchArgs launch;
  if (!parse_launch_args(args, launch)) {
    std::cerr << "Usage: toolhost command <tool> [--profile P] [-- args...]\n";
    return 1;
  }
  auto cmd =
      supervisor.command_for(launch.tool_id, launch.custom_args, launch.profile);
  std::cout << fmt::format("{}\n", fmt::join(cmd, " "));
  return 0;
}

int cmd_run(Supervisor &supervisor, const std::vector<std::string> &args) {
  LaunchArgs launch;
  if (!parse_launch_args(args, launch)) {
    std::cerr << "Usage: toolhost run <tool> [--profile P] [-- args...]\n";
    return 1;
  }

  if (!supervisor.launch(launch.tool_id, launch.custom_args, launch.profile)) {
    std::cerr << "Failed to launch " << launch.tool_id << "\n";
    return 1;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  ToolStatus last = ToolStatus::NotStarted;
  ToolStatus before_stop = ToolStatus::Starting;
  while (g_running) {
    for (const auto &line : supervisor.logs(launch.tool_id, 200)) {
      std::cout << line << "\n";
    }
    ToolStatus current = supervisor.status(launch.tool_id);
    if (current != last) {
      std::cerr << launch.tool_id << ": " << status_to_string(current) << "\n";
      if (current != ToolStatus::Stopped)
        before_stop = current;
      last = current;
    }
    if (current == ToolStatus::Stopped)
      break;
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  if (!g_running) {
    std::cerr << "Stopping " << launch.tool_id << "...\n";
    if (!supervisor.stop(launch.tool_id)) {
      std::cerr << "Failed to stop " << launch.tool_id << "\n";
      return 1;
    }
  }

  for (const auto &line : supervisor.logs(launch.tool_id, SIZE_MAX)) {
    std::cout << line << "\n";
  }
  return before_stop == ToolStatus::Error ? 1 : 0;
}

static std::vector<std::string> tokenize(const std::string &line) {
  std::istringstream iss(line);
  std::vector<std::string> tokens;
  std::string token;
  while (iss >> token)
    tokens.push_back(token);
  return tokens;
}

int cmd_shell(Supervisor &supervisor, const std::vector<std::string> &args) {
  (void)args;
  std::string line;
  std::cout << "toolhost> " << std::flush;
  while (std::getline(std::cin, line)) {
    auto tokens = tokenize(line);
    if (tokens.empty()) {
      std::cout << "toolhost> " << std::flush;
      continue;
    }

    const std::string verb = tokens[0];
    std::vector<std::string> rest(tokens.begin() + 1, tokens.end());

    try {
      if (verb == "quit" || verb == "exit") {
        break;
      } else if (verb == "help") {
        print_usage();
      } else if (verb == "tools") {
        print_tools(supervisor);
      } else if (verb == "list") {
        print_list(supervisor);
      } else if (verb == "launch") {
        LaunchArgs launch;
        if (!parse_launch_args(rest, launch)) {
          std::cout << "Usage: launch <tool> [--profile P] [args...]\n";
        } else if (supervisor.launch(launch.tool_id, launch.custom_args,
                                     launch.profile)) {
          std::cout << "Launched " << launch.tool_id << "\n";
        } else {
          std::cout << "Failed to launch " << launch.tool_id << "\n";
        }
      } else if (verb == "stop" && !rest.empty()) {
        std::cout << (supervisor.stop(rest[0]) ? "Stopped " : "Failed to stop ")
                  << rest[0] << "\n";
      } else if (verb == "status") {
        if (rest.empty()) {
          print_list(supervisor);
        } else {
          std::cout << rest[0] << ": "
                    << status_to_string(supervisor.status(rest[0])) << "\n";
        }
      } else if (verb == "logs" && !rest.empty()) {
        size_t n = rest.size() > 1 ? std::stoul(rest[1]) : 50;
        for (const auto &entry : supervisor.logs(rest[0], n)) {
          std::cout << entry << "\n";
        }
      } else {
        std::cout << "Unknown command: " << line << " (try 'help')\n";
      }
    } catch (const ConfigurationError &ex) {
      std::cout << "Error: " << ex.what() << "\n";
    } catch (const std::logic_error &ex) {
      // std::stoul on a malformed line count
      std::cout << "Invalid argument: " << ex.what() << "\n";
    }
    std::cout << "toolhost> " << std::flush;
  }

  std::cout << "\n";
  supervisor.stop_all();
  return 0;
}
