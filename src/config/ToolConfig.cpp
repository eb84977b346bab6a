#include "toolhost/config/ToolConfig.hpp"
#include "toolhost/errors.hpp"
#include <system_error>

namespace toolhost {

bool ToolConfig::is_installed() const {
  std::error_code ec;
  return std::filesystem::is_directory(directory, ec);
}

std::shared_ptr<const ToolConfig>
SupervisorConfig::tool(const std::string &tool_id) const {
  auto it = tools.find(tool_id);
  if (it == tools.end()) {
    throw ConfigurationError("Unknown tool: " + tool_id);
  }
  return it->second;
}

} // namespace toolhost
