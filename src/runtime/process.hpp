#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "engine/environment.hpp"
#include "engine/error.hpp"

namespace dwas::engine {

/// Runs external commands in their own process group and captures the
/// combined stdout/stderr. Keeps track of running children so that an
/// interrupt can terminate all of them.
class ProcessManager {
 public:
  explicit ProcessManager(std::chrono::milliseconds grace = std::chrono::seconds(5));

  ProcessManager(const ProcessManager&) = delete;
  auto operator=(const ProcessManager&) -> ProcessManager& = delete;

  /// Blocks until the command exits. Signals are reported as 128 + signal.
  auto run(const Command& command) -> Expected<ProcessResult>;

  /// SIGTERM every process group; SIGKILL the ones still alive after the
  /// grace period. Commands started afterwards are terminated immediately.
  auto terminate_all() -> void;
  /// SIGKILL every process group right away.
  auto kill_all() -> void;

  auto running() const -> std::size_t;

 private:
  struct Child {
    std::optional<std::chrono::steady_clock::time_point> kill_at;
    bool killed = false;
  };

  auto track(pid_t pid) -> void;
  auto untrack(pid_t pid) -> void;
  auto escalate_if_due(pid_t pid) -> void;

  std::chrono::milliseconds grace_;
  mutable std::mutex mutex_;
  std::unordered_map<pid_t, Child> children_;
  bool terminating_ = false;
  bool killing_ = false;
};

}  // namespace dwas::engine
