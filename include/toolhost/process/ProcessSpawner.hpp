#pragma once
#include "toolhost/process/ChildProcess.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace toolhost {
namespace process {

struct SpawnRequest {
  std::vector<std::string> argv;
  std::filesystem::path working_dir;
};

/// Starts child processes for the Launcher
class ProcessSpawner {
public:
  virtual ~ProcessSpawner() = default;

  /// Returns nullptr on failure (the reason is logged)
  virtual std::unique_ptr<ChildProcess> spawn(const SpawnRequest &request) = 0;
};

/// posix_spawn with stdout+stderr merged into one pipe, cwd set and the
/// child leading its own process group
class PosixProcessSpawner : public ProcessSpawner {
public:
  std::unique_ptr<ChildProcess> spawn(const SpawnRequest &request) override;
};

} // namespace process
} // namespace toolhost
