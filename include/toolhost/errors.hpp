#pragma once

#include <stdexcept>
#include <string>

namespace toolhost {

/// Base class for all supervisor failures
class SupervisorError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Unknown tool id or malformed configuration document
class ConfigurationError : public SupervisorError {
public:
  using SupervisorError::SupervisorError;
};

/// Tool directory does not exist
class NotInstalledError : public SupervisorError {
public:
  using SupervisorError::SupervisorError;
};

/// Spawning the child process failed
class LaunchError : public SupervisorError {
public:
  using SupervisorError::SupervisorError;
};

/// Reading the child's output stream failed
class MonitorError : public SupervisorError {
public:
  using SupervisorError::SupervisorError;
};

/// Delivering a signal to the child failed
class TerminationError : public SupervisorError {
public:
  using SupervisorError::SupervisorError;
};

} // namespace toolhost
