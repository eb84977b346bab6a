#include "toolhost/config/ConfigLoader.hpp"
#include "toolhost/Logger.hpp"
#include "toolhost/errors.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace toolhost {

namespace fs = std::filesystem;
using json = nlohmann::json;

static json yaml_to_json(const YAML::Node &node) {
  if (node.IsNull()) {
    return nullptr;
  } else if (node.IsScalar()) {
    try {
      return node.as<int64_t>();
    } catch (const YAML::Exception &) {
      try {
        return node.as<double>();
      } catch (const YAML::Exception &) {
        try {
          return node.as<bool>();
        } catch (const YAML::Exception &) {
          return node.as<std::string>();
        }
      }
    }
  } else if (node.IsSequence()) {
    json arr = json::array();
    for (const auto &item : node) {
      arr.push_back(yaml_to_json(item));
    }
    return arr;
  } else if (node.IsMap()) {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  return nullptr;
}

// YAML turns "7860" into a number; command-line arguments are always text
static std::string scalar_to_string(const json &value, const std::string &key) {
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_number() || value.is_boolean())
    return value.dump();
  throw ConfigurationError("Expected a string for '" + key + "', got " +
                           value.type_name());
}

static std::vector<std::string> string_list(const json &value,
                                            const std::string &key) {
  std::vector<std::string> out;
  if (value.is_null())
    return out;
  if (value.is_string()) {
    // Whitespace separated form: "--ckpt-dir {models_dir}/Stable-diffusion"
    std::istringstream iss(value.get<std::string>());
    std::string token;
    while (iss >> token)
      out.push_back(token);
    return out;
  }
  if (!value.is_array()) {
    throw ConfigurationError("Expected a list for '" + key + "', got " +
                             value.type_name());
  }
  for (const auto &item : value) {
    out.push_back(scalar_to_string(item, key));
  }
  return out;
}

static fs::path resolve_against(const fs::path &base, const fs::path &p) {
  if (p.is_absolute())
    return p.lexically_normal();
  return (base / p).lexically_normal();
}

static std::shared_ptr<const ToolConfig>
parse_tool(const std::string &tool_id, const json &node,
           const WorkspaceSettings &workspace) {
  const std::string key = "tools." + tool_id;
  if (!node.is_object()) {
    throw ConfigurationError("Tool entry '" + key + "' must be a mapping");
  }
  if (!node.contains("entry_script")) {
    throw ConfigurationError("Tool entry '" + key +
                             "' is missing 'entry_script'");
  }

  auto tool = std::make_shared<ToolConfig>();
  tool->id = tool_id;
  tool->display_name = node.contains("name")
                           ? scalar_to_string(node["name"], key + ".name")
                           : tool_id;
  tool->directory = resolve_against(
      workspace.workspace_dir,
      node.contains("dir") ? scalar_to_string(node["dir"], key + ".dir")
                           : tool_id);
  tool->interpreter = resolve_against(
      tool->directory, node.contains("python")
                           ? scalar_to_string(node["python"], key + ".python")
                           : "venv/bin/python");
  tool->entry_script =
      scalar_to_string(node["entry_script"], key + ".entry_script");

  if (node.contains("default_args")) {
    tool->default_args =
        string_list(node["default_args"], key + ".default_args");
  }

  if (node.contains("hardware_profiles")) {
    const auto &profiles = node["hardware_profiles"];
    if (!profiles.is_object()) {
      throw ConfigurationError("'" + key +
                               ".hardware_profiles' must be a mapping");
    }
    for (auto it = profiles.begin(); it != profiles.end(); ++it) {
      tool->hardware_profiles[it.key()] =
          string_list(it.value(), key + ".hardware_profiles." + it.key());
    }
  }

  if (node.contains("model_centralization")) {
    const auto &central = node["model_centralization"];
    if (!central.is_object()) {
      throw ConfigurationError("'" + key +
                               ".model_centralization' must be a mapping");
    }
    if (central.contains("method")) {
      tool->centralization.method = scalar_to_string(
          central["method"], key + ".model_centralization.method");
    }
    if (central.contains("args")) {
      tool->centralization.args =
          string_list(central["args"], key + ".model_centralization.args");
    }
  }

  return tool;
}

SupervisorConfig parse_config(const json &document, const std::string &source) {
  if (!document.is_object()) {
    throw ConfigurationError("Configuration root must be a mapping: " + source);
  }

  SupervisorConfig config;
  try {
    const json settings = document.value("workspace_settings", json::object());
    config.workspace.workspace_dir =
        settings.contains("workspace_dir")
            ? fs::path(scalar_to_string(settings["workspace_dir"],
                                        "workspace_settings.workspace_dir"))
            : fs::current_path();
    config.workspace.workspace_dir =
        fs::absolute(config.workspace.workspace_dir).lexically_normal();
    config.workspace.models_dir = resolve_against(
        config.workspace.workspace_dir,
        settings.contains("models_dir")
            ? scalar_to_string(settings["models_dir"],
                               "workspace_settings.models_dir")
            : "models");
    config.workspace.logs_dir = resolve_against(
        config.workspace.workspace_dir,
        settings.contains("logs_dir")
            ? scalar_to_string(settings["logs_dir"],
                               "workspace_settings.logs_dir")
            : "logs");

    const json supervisor =
        document.value("supervisor_settings", json::object());
    if (supervisor.contains("stop_timeout_seconds")) {
      config.supervisor.stop_timeout = std::chrono::milliseconds(
          static_cast<int64_t>(
              supervisor["stop_timeout_seconds"].get<double>() * 1000));
    }
    if (supervisor.contains("startup_grace_seconds")) {
      config.supervisor.startup_grace = std::chrono::milliseconds(
          static_cast<int64_t>(
              supervisor["startup_grace_seconds"].get<double>() * 1000));
    }
    if (supervisor.contains("log_buffer_capacity")) {
      config.supervisor.log_buffer_capacity =
          supervisor["log_buffer_capacity"].get<std::size_t>();
    }
    if (supervisor.contains("log_level")) {
      config.supervisor.log_level = scalar_to_string(
          supervisor["log_level"], "supervisor_settings.log_level");
    }

    if (!document.contains("tools") || !document["tools"].is_object()) {
      throw ConfigurationError("Configuration has no 'tools' mapping: " +
                               source);
    }
    const json &tools = document["tools"];
    for (auto it = tools.begin(); it != tools.end(); ++it) {
      config.tools[it.key()] = parse_tool(it.key(), it.value(),
                                          config.workspace);
    }
  } catch (const json::exception &ex) {
    throw ConfigurationError("Invalid configuration in " + source + ": " +
                             ex.what());
  }

  LOG_DEBUG("CONFIG", "PARSE", "Loaded {} tools from {}", config.tools.size(),
            source);
  return config;
}

SupervisorConfig load_config(const std::string &config_path) {
  LOG_INFO("CONFIG", "LOAD", "Loading configuration from: {}", config_path);

  if (!fs::exists(config_path)) {
    throw ConfigurationError("Configuration file not found: " + config_path);
  }

  const auto ext = fs::path(config_path).extension().string();
  json document;
  try {
    if (ext == ".yaml" || ext == ".yml") {
      document = yaml_to_json(YAML::LoadFile(config_path));
    } else {
      std::ifstream ifs(config_path);
      if (!ifs) {
        throw ConfigurationError("Cannot open configuration file: " +
                                 config_path);
      }
      document = json::parse(ifs);
    }
  } catch (const YAML::Exception &ex) {
    throw ConfigurationError("Failed to parse " + config_path + ": " +
                             ex.what());
  } catch (const json::exception &ex) {
    throw ConfigurationError("Failed to parse " + config_path + ": " +
                             ex.what());
  }

  return parse_config(document, config_path);
}

std::string default_config_path() {
  const char *env = std::getenv("TOOLHOST_CONFIG");
  if (env && *env) {
    return env;
  }
  return "config.json";
}

} // namespace toolhost
