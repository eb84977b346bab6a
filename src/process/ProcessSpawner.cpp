#include "toolhost/process/ProcessSpawner.hpp"
#include "toolhost/Logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <unistd.h>

extern char **environ;

namespace toolhost {
namespace process {

namespace {

// Releases posix_spawn attribute objects on every exit path
struct SpawnAttributes {
  posix_spawn_file_actions_t actions;
  posix_spawnattr_t attr;

  SpawnAttributes() {
    posix_spawn_file_actions_init(&actions);
    posix_spawnattr_init(&attr);
  }
  ~SpawnAttributes() {
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
  }
};

} // namespace

std::unique_ptr<ChildProcess>
PosixProcessSpawner::spawn(const SpawnRequest &request) {
  if (request.argv.empty()) {
    LOG_ERROR("PROCESS", "SPAWN", "Empty command line");
    return nullptr;
  }

  LOG_INFO("PROCESS", "SPAWN", "Spawning: {} (cwd={})", request.argv[0],
           request.working_dir.string());

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    LOG_ERROR("PROCESS", "SPAWN", "pipe2 failed: {}", std::strerror(errno));
    return nullptr;
  }

  std::vector<char *> argv;
  for (const auto &arg : request.argv) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  SpawnAttributes spawn_attrs;
  const std::string cwd = request.working_dir.string();

  // stdin from /dev/null, stdout and stderr share the write end
  int rc = posix_spawn_file_actions_addopen(&spawn_attrs.actions, STDIN_FILENO,
                                            "/dev/null", O_RDONLY, 0);
  if (rc == 0)
    rc = posix_spawn_file_actions_adddup2(&spawn_attrs.actions, fds[1],
                                          STDOUT_FILENO);
  if (rc == 0)
    rc = posix_spawn_file_actions_adddup2(&spawn_attrs.actions, fds[1],
                                          STDERR_FILENO);
  if (rc == 0 && !cwd.empty())
    rc = posix_spawn_file_actions_addchdir_np(&spawn_attrs.actions,
                                              cwd.c_str());

  // Own process group so signals reach the interpreter's children too
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGINT);
  sigaddset(&default_signals, SIGTERM);
  sigaddset(&default_signals, SIGPIPE);
  sigaddset(&default_signals, SIGHUP);
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  if (rc == 0)
    rc = posix_spawnattr_setflags(&spawn_attrs.attr,
                                  POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF |
                                      POSIX_SPAWN_SETSIGMASK);
  if (rc == 0)
    rc = posix_spawnattr_setpgroup(&spawn_attrs.attr, 0);
  if (rc == 0)
    rc = posix_spawnattr_setsigdefault(&spawn_attrs.attr, &default_signals);
  if (rc == 0)
    rc = posix_spawnattr_setsigmask(&spawn_attrs.attr, &empty_mask);

  pid_t pid = 0;
  if (rc == 0)
    rc = posix_spawn(&pid, argv[0], &spawn_attrs.actions, &spawn_attrs.attr,
                     argv.data(), environ);

  ::close(fds[1]);

  if (rc != 0) {
    LOG_ERROR("PROCESS", "SPAWN", "posix_spawn failed for {}: {}",
              request.argv[0], std::strerror(rc));
    ::close(fds[0]);
    return nullptr;
  }

  LOG_INFO("PROCESS", "SPAWN", "Process spawned successfully: PID={}", pid);
  return std::make_unique<PosixChildProcess>(pid, fds[0]);
}

} // namespace process
} // namespace toolhost
