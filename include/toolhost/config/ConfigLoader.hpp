#pragma once

#include "toolhost/config/ToolConfig.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace toolhost {

/// Load a supervisor configuration from a .json, .yaml or .yml file.
/// Throws ConfigurationError on unreadable or malformed documents.
SupervisorConfig load_config(const std::string &config_path);

/// Build a configuration from an already parsed document
SupervisorConfig parse_config(const nlohmann::json &document,
                              const std::string &source = "<memory>");

/// Default config path: $TOOLHOST_CONFIG, else ./config.json
std::string default_config_path();

} // namespace toolhost
