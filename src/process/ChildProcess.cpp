#include "toolhost/process/ChildProcess.hpp"
#include "toolhost/Logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace toolhost {
namespace process {

PosixChildProcess::PosixChildProcess(ProcessId pid, int output_fd)
    : pid_(pid), output_fd_(output_fd) {}

PosixChildProcess::~PosixChildProcess() {
  if (output_fd_ >= 0) {
    ::close(output_fd_);
  }
  // Reap if already exited so no zombie is left behind
  poll_exit();
}

bool PosixChildProcess::poll_exit() {
  std::lock_guard lock(state_mutex_);
  if (reaped_)
    return true;

  int status = 0;
  pid_t result = ::waitpid(pid_, &status, WNOHANG);
  if (result == 0)
    return false; // still running

  if (result == pid_) {
    reaped_ = true;
    if (WIFEXITED(status)) {
      exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      exit_code_ = -WTERMSIG(status);
    }
    LOG_DEBUG("PROCESS", "REAP", "PID={} exited with code {}", pid_,
              exit_code_.value_or(0));
    return true;
  }

  if (errno == ECHILD) {
    // Reaped elsewhere; the exit status is lost but the process is gone
    reaped_ = true;
    return true;
  }
  return false;
}

bool PosixChildProcess::is_alive() { return !poll_exit(); }

bool PosixChildProcess::group_alive() {
  if (!poll_exit())
    return true;
  // The group id stays reserved while any member exists
  return ::kill(-pid_, 0) == 0 || errno == EPERM;
}

bool PosixChildProcess::send_signal(int sig) {
  // Hold the lock so the pid cannot be reaped and recycled underneath us
  std::lock_guard lock(state_mutex_);

  if (::kill(-pid_, sig) == 0)
    return true;
  int err = errno;

  if (err == ESRCH) {
    if (reaped_)
      return true; // group is empty
    // Not yet a group leader; signal the child alone
    if (::kill(pid_, sig) == 0)
      return true;
    err = errno;
    if (err == ESRCH)
      return true;
  }

  LOG_ERROR("PROCESS", "SIGNAL", "kill({}, {}) failed: {}", pid_, sig,
            std::strerror(err));
  return false;
}

bool PosixChildProcess::terminate() { return send_signal(SIGTERM); }

bool PosixChildProcess::kill() { return send_signal(SIGKILL); }

bool PosixChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {
    if (!group_alive()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  return !group_alive();
}

void PosixChildProcess::wait() {
  while (!poll_exit()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
}

ReadResult PosixChildProcess::read_line(std::string &line) {
  while (true) {
    auto pos = pending_.find('\n');
    if (pos != std::string::npos) {
      line.assign(pending_, 0, pos);
      pending_.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      return ReadResult::Line;
    }

    if (eof_) {
      if (pending_.empty())
        return ReadResult::EndOfStream;
      line = std::move(pending_);
      pending_.clear();
      return ReadResult::Line;
    }

    char buf[4096];
    ssize_t n = ::read(output_fd_, buf, sizeof(buf));
    if (n > 0) {
      pending_.append(buf, static_cast<size_t>(n));
    } else if (n == 0) {
      eof_ = true;
    } else if (errno != EINTR) {
      LOG_DEBUG("PROCESS", "READ", "read() on PID={} output failed: {}", pid_,
                std::strerror(errno));
      return ReadResult::Error;
    }
  }
}

std::optional<int> PosixChildProcess::exit_code() const {
  std::lock_guard lock(state_mutex_);
  return exit_code_;
}

} // namespace process
} // namespace toolhost
