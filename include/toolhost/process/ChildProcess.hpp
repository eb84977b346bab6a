#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>

namespace toolhost {
namespace process {

using ProcessId = pid_t;

enum class ReadResult { Line, EndOfStream, Error };

/// Handle to one launched child: pid plus wait/signal/kill and its merged
/// stdout/stderr stream. Signals and waits may be issued from any thread;
/// read_line() belongs to the single Output Monitor of the process.
class ChildProcess {
public:
  virtual ~ChildProcess() = default;

  virtual ProcessId pid() const = 0;

  /// Non-blocking liveness check (reaps the child once it has exited)
  virtual bool is_alive() = 0;

  /// True while the child or anything it forked is still running. Forked
  /// workers may outlive the child and keep the output stream open.
  virtual bool group_alive() = 0;

  /// Graceful termination request (SIGTERM to the process group). Still
  /// delivered after the child itself has exited.
  virtual bool terminate() = 0;

  /// Forced kill (SIGKILL to the process group)
  virtual bool kill() = 0;

  /// Returns true if the child and its process group exited within timeout
  virtual bool wait_for_exit(std::chrono::milliseconds timeout) = 0;

  /// Block until the child itself exits
  virtual void wait() = 0;

  /// Block for the next output line without its terminator
  virtual ReadResult read_line(std::string &line) = 0;

  /// Exit code once reaped; negative values are terminating signals
  virtual std::optional<int> exit_code() const = 0;
};

/// ChildProcess backed by a real pid and the read end of its output pipe
class PosixChildProcess : public ChildProcess {
public:
  PosixChildProcess(ProcessId pid, int output_fd);
  ~PosixChildProcess() override;

  PosixChildProcess(const PosixChildProcess &) = delete;
  PosixChildProcess &operator=(const PosixChildProcess &) = delete;

  ProcessId pid() const override { return pid_; }
  bool is_alive() override;
  bool group_alive() override;
  bool terminate() override;
  bool kill() override;
  bool wait_for_exit(std::chrono::milliseconds timeout) override;
  void wait() override;
  ReadResult read_line(std::string &line) override;
  std::optional<int> exit_code() const override;

private:
  bool send_signal(int sig);
  bool poll_exit();

  ProcessId pid_;
  int output_fd_;

  mutable std::mutex state_mutex_;
  bool reaped_{false};
  std::optional<int> exit_code_;

  // Only touched by the reading thread
  std::string pending_;
  bool eof_{false};
};

} // namespace process
} // namespace toolhost
