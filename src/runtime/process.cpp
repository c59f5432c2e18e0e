#include "runtime/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <string>
#include <thread>
#include <vector>

#include "common/logging/log.hpp"

extern char** environ;

namespace dwas::engine {
namespace {

constexpr int kPollIntervalMs = 100;
constexpr int kExecFailure = 127;

auto errno_error(std::string_view what) -> EngineError {
  return make_error(ErrorCode::Io, std::format("{}: {}", what, std::strerror(errno)));
}

auto decode_status(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Everything the child needs is materialized before fork.
struct ExecArgs {
  std::vector<std::string> env_storage;
  std::vector<char*> argv;
  std::vector<char*> envp;

  explicit ExecArgs(const Command& command) {
    env_storage.reserve(command.env.size());
    for (const auto& [name, value] : command.env) {
      env_storage.push_back(name + "=" + value);
    }
    for (const auto& arg : command.argv) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    for (auto& entry : env_storage) {
      envp.push_back(entry.data());
    }
    envp.push_back(nullptr);
  }
};

[[noreturn]] void exec_child(const Command& command, ExecArgs& args, int out_fd) {
  setpgid(0, 0);
  dup2(out_fd, STDOUT_FILENO);
  dup2(out_fd, STDERR_FILENO);
  int null_fd = open("/dev/null", O_RDONLY);
  if (null_fd >= 0) {
    dup2(null_fd, STDIN_FILENO);
    if (null_fd > STDIN_FILENO) {
      close(null_fd);
    }
  }

  if (!command.cwd.empty() && chdir(command.cwd.c_str()) != 0) {
    const char* message = "failed to change directory\n";
    (void)!write(STDERR_FILENO, message, std::strlen(message));
    _exit(kExecFailure);
  }

  environ = args.envp.data();
  execvp(args.argv[0], args.argv.data());

  const char* message = "failed to execute command: ";
  (void)!write(STDERR_FILENO, message, std::strlen(message));
  (void)!write(STDERR_FILENO, args.argv[0], std::strlen(args.argv[0]));
  (void)!write(STDERR_FILENO, "\n", 1);
  _exit(kExecFailure);
}

}  // namespace

ProcessManager::ProcessManager(std::chrono::milliseconds grace) : grace_(grace) {}

auto ProcessManager::run(const Command& command) -> Expected<ProcessResult> {
  if (command.argv.empty()) {
    return tl::unexpected(make_error(ErrorCode::Execution, "cannot run an empty command"));
  }

  ExecArgs args(command);
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    return tl::unexpected(errno_error("pipe"));
  }

  pid_t pid = fork();
  if (pid < 0) {
    auto error = errno_error("fork");
    close(fds[0]);
    close(fds[1]);
    return tl::unexpected(error);
  }
  if (pid == 0) {
    close(fds[0]);
    exec_child(command, args, fds[1]);
  }

  // Both sides set the group to avoid racing a kill against the child's setpgid.
  setpgid(pid, pid);
  close(fds[1]);
  track(pid);

  ProcessResult result;
  bool eof = false;
  bool exited = false;
  int status = 0;
  char buffer[4096];

  while (!eof || !exited) {
    escalate_if_due(pid);

    if (!exited) {
      pid_t waited = waitpid(pid, &status, WNOHANG);
      if (waited == pid) {
        exited = true;
      } else if (waited < 0 && errno != EINTR) {
        auto error = errno_error("waitpid");
        untrack(pid);
        close(fds[0]);
        return tl::unexpected(error);
      }
    }

    if (eof) {
      std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs / 2));
      continue;
    }

    // Once the child is gone only drain what is already buffered; a
    // grandchild holding the pipe open must not keep us waiting.
    pollfd descriptor{fds[0], POLLIN, 0};
    int ready = poll(&descriptor, 1, exited ? 0 : kPollIntervalMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      auto error = errno_error("poll");
      untrack(pid);
      close(fds[0]);
      return tl::unexpected(error);
    }
    if (ready == 0) {
      if (exited) {
        eof = true;
      }
      continue;
    }

    ssize_t count = read(fds[0], buffer, sizeof(buffer));
    if (count > 0) {
      result.output.append(buffer, static_cast<std::size_t>(count));
    } else if (count == 0 || errno != EINTR) {
      eof = true;
    }
  }

  close(fds[0]);
  untrack(pid);
  result.exit_code = decode_status(status);
  return result;
}

auto ProcessManager::track(pid_t pid) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  Child child;
  if (killing_) {
    killpg(pid, SIGKILL);
    child.killed = true;
  } else if (terminating_) {
    killpg(pid, SIGTERM);
    child.kill_at = std::chrono::steady_clock::now() + grace_;
  }
  children_.emplace(pid, child);
}

auto ProcessManager::untrack(pid_t pid) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  children_.erase(pid);
}

auto ProcessManager::escalate_if_due(pid_t pid) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = children_.find(pid);
  if (it == children_.end() || it->second.killed || !it->second.kill_at) {
    return;
  }
  if (std::chrono::steady_clock::now() >= *it->second.kill_at) {
    log::warn("Process {} did not terminate in time, killing it", pid);
    killpg(pid, SIGKILL);
    it->second.killed = true;
  }
}

auto ProcessManager::terminate_all() -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  terminating_ = true;
  const auto deadline = std::chrono::steady_clock::now() + grace_;
  for (auto& [pid, child] : children_) {
    if (child.killed || child.kill_at) {
      continue;
    }
    killpg(pid, SIGTERM);
    child.kill_at = deadline;
  }
  if (!children_.empty()) {
    log::info("Terminating {} running process(es)", children_.size());
  }
}

auto ProcessManager::kill_all() -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  terminating_ = true;
  killing_ = true;
  for (auto& [pid, child] : children_) {
    if (child.killed) {
      continue;
    }
    killpg(pid, SIGKILL);
    child.killed = true;
  }
}

auto ProcessManager::running() const -> std::size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return children_.size();
}

}  // namespace dwas::engine
