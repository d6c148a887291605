#include "srvfront/signals.hpp"

#include <csignal>
#include <cstring>

#include <atomic>

namespace srvfront {

namespace {

// Written from the signal handler and read from any thread
std::atomic<bool> g_interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free, "interrupt flag must be signal-safe");

extern "C" void on_interrupt_signal(int /* signo */) {
  g_interrupted.store(true, std::memory_order_relaxed);
}

}  // namespace

bool interrupt_pending() noexcept {
  return g_interrupted.load(std::memory_order_relaxed);
}

void clear_interrupt() noexcept {
  g_interrupted.store(false, std::memory_order_relaxed);
}

void raise_interrupt() noexcept {
  g_interrupted.store(true, std::memory_order_relaxed);
}

InterruptScope::InterruptScope() {
  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = on_interrupt_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  if (sigaction(SIGINT, &action, &old_int_) != 0) {
    return;
  }
  if (sigaction(SIGTERM, &action, &old_term_) != 0) {
    sigaction(SIGINT, &old_int_, nullptr);
    return;
  }
  installed_ = true;
}

InterruptScope::~InterruptScope() {
  if (installed_) {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGTERM, &old_term_, nullptr);
  }
}

}  // namespace srvfront
