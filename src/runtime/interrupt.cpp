#include "runtime/interrupt.hpp"

#include "common/logging/log.hpp"

namespace dwas::engine {
namespace {

volatile sig_atomic_t g_interrupts = 0;

void on_interrupt(int) {
  g_interrupts = g_interrupts + 1;
}

}  // namespace

InterruptGuard::InterruptGuard() {
  struct sigaction action {};
  action.sa_handler = on_interrupt;
  sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;
  if (sigaction(SIGINT, &action, &previous_int_) != 0 || sigaction(SIGTERM, &action, &previous_term_) != 0) {
    log::warn("Could not install interrupt handlers, Ctrl+C will terminate immediately");
  }
}

InterruptGuard::~InterruptGuard() {
  sigaction(SIGINT, &previous_int_, nullptr);
  sigaction(SIGTERM, &previous_term_, nullptr);
}

auto InterruptGuard::count() -> int {
  return static_cast<int>(g_interrupts);
}

auto InterruptGuard::reset() -> void {
  g_interrupts = 0;
}

auto InterruptGuard::raise() -> void {
  g_interrupts = g_interrupts + 1;
}

}  // namespace dwas::engine
