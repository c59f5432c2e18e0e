#pragma once

#include <signal.h>

namespace dwas::engine {

/// Counts SIGINT/SIGTERM while alive instead of letting them kill the
/// process. The previous handlers are restored on destruction.
class InterruptGuard {
 public:
  InterruptGuard();
  ~InterruptGuard();

  InterruptGuard(const InterruptGuard&) = delete;
  auto operator=(const InterruptGuard&) -> InterruptGuard& = delete;

  static auto count() -> int;
  static auto reset() -> void;
  /// Behave as if a signal had been received.
  static auto raise() -> void;

 private:
  struct sigaction previous_int_{};
  struct sigaction previous_term_{};
};

}  // namespace dwas::engine
