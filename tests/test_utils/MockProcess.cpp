#include "MockProcess.hpp"

namespace toolhost {
namespace test {

MockProcess::MockProcess(process::ProcessId pid) : pid_(pid) {}

void MockProcess::emit(const std::string &line) {
  {
    std::lock_guard lock(mutex_);
    lines_.push_back(line);
  }
  cv_.notify_all();
}

void MockProcess::close_output() {
  {
    std::lock_guard lock(mutex_);
    output_closed_ = true;
  }
  cv_.notify_all();
}

void MockProcess::fail_output() {
  {
    std::lock_guard lock(mutex_);
    output_failed_ = true;
  }
  cv_.notify_all();
}

void MockProcess::exit(int code) {
  {
    std::lock_guard lock(mutex_);
    exit_locked(code);
  }
  cv_.notify_all();
}

void MockProcess::exit_leaving_children(int code) {
  {
    std::lock_guard lock(mutex_);
    if (!alive_)
      return;
    alive_ = false;
    exit_code_ = code;
    children_alive_ = true;
  }
  cv_.notify_all();
}

void MockProcess::exit_locked(int code) {
  // Signals reach the children as well, which closes the output
  children_alive_ = false;
  output_closed_ = true;
  if (!alive_)
    return;
  alive_ = false;
  exit_code_ = code;
}

void MockProcess::set_ignores_terminate(bool ignores) {
  std::lock_guard lock(mutex_);
  ignores_terminate_ = ignores;
}

void MockProcess::set_signal_fails(bool fails) {
  std::lock_guard lock(mutex_);
  signal_fails_ = fails;
}

std::vector<std::string> MockProcess::signal_history() const {
  std::lock_guard lock(mutex_);
  return signals_;
}

std::chrono::milliseconds MockProcess::simulated_wait() const {
  std::lock_guard lock(mutex_);
  return simulated_wait_;
}

bool MockProcess::is_alive() {
  std::lock_guard lock(mutex_);
  return alive_;
}

bool MockProcess::group_alive() {
  std::lock_guard lock(mutex_);
  return alive_ || children_alive_;
}

bool MockProcess::terminate() {
  {
    std::lock_guard lock(mutex_);
    signals_.push_back("TERM");
    if (signal_fails_)
      return false;
    if (!ignores_terminate_)
      exit_locked(-15);
  }
  cv_.notify_all();
  return true;
}

bool MockProcess::kill() {
  {
    std::lock_guard lock(mutex_);
    signals_.push_back("KILL");
    if (signal_fails_)
      return false;
    exit_locked(-9);
  }
  cv_.notify_all();
  return true;
}

bool MockProcess::wait_for_exit(std::chrono::milliseconds timeout) {
  std::lock_guard lock(mutex_);
  if (alive_ || children_alive_)
    simulated_wait_ += timeout;
  return !alive_ && !children_alive_;
}

void MockProcess::wait() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !alive_; });
}

process::ReadResult MockProcess::read_line(std::string &line) {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !lines_.empty() || output_closed_ || output_failed_;
  });
  if (!lines_.empty()) {
    line = std::move(lines_.front());
    lines_.pop_front();
    return process::ReadResult::Line;
  }
  if (output_failed_)
    return process::ReadResult::Error;
  return process::ReadResult::EndOfStream;
}

std::optional<int> MockProcess::exit_code() const {
  std::lock_guard lock(mutex_);
  return exit_code_;
}

std::unique_ptr<process::ChildProcess>
MockSpawner::spawn(const process::SpawnRequest &request) {
  requests_.push_back(request);
  if (fail_)
    return nullptr;
  auto proc = std::make_unique<MockProcess>(next_pid_++);
  spawned_.push_back(proc.get());
  return proc;
}

MockProcess *MockSpawner::last_process() const {
  return spawned_.empty() ? nullptr : spawned_.back();
}

} // namespace test
} // namespace toolhost
