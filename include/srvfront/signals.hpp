#ifndef SRVFRONT_SIGNALS_HPP_
#define SRVFRONT_SIGNALS_HPP_

#include <signal.h>

namespace srvfront {

// Process-wide interrupt flag, set from the SIGINT/SIGTERM handler.
bool interrupt_pending() noexcept;
void clear_interrupt() noexcept;
// Same effect as receiving SIGINT while an InterruptScope is active.
void raise_interrupt() noexcept;

// ============================================================================
// InterruptScope - converts SIGINT/SIGTERM into the interrupt flag
// ============================================================================
//
// Handlers are installed without SA_RESTART so a blocked poll() or waitpid()
// returns EINTR and the caller re-checks interrupt_pending(). The previous
// dispositions are restored on destruction. Forked children inherit both the
// handlers and this object, so each process restores its own copy.

class InterruptScope {
 public:
  InterruptScope();
  ~InterruptScope();

  InterruptScope(const InterruptScope&) = delete;
  InterruptScope& operator=(const InterruptScope&) = delete;

  bool installed() const { return installed_; }

 private:
  struct sigaction old_int_{};
  struct sigaction old_term_{};
  bool installed_ = false;
};

}  // namespace srvfront

#endif  // SRVFRONT_SIGNALS_HPP_
