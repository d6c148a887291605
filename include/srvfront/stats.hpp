#ifndef SRVFRONT_STATS_HPP_
#define SRVFRONT_STATS_HPP_

#include <atomic>
#include <cstdint>

namespace srvfront {

// ============================================================================
// ServerStats - Atomic counters (read from any thread, written by the loop)
// ============================================================================

struct ServerStats {
  // Connection counters
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> handled_connections{0};
  std::atomic<uint64_t> rejected_max_cons{0};
  std::atomic<uint64_t> rejected_max_cons_per_ip{0};

  // Fault counters
  std::atomic<uint64_t> handler_faults{0};
  std::atomic<uint64_t> dispatch_faults{0};
  std::atomic<uint64_t> accept_errors{0};

  uint64_t rejected_total() const {
    return rejected_max_cons.load(std::memory_order_relaxed) +
           rejected_max_cons_per_ip.load(std::memory_order_relaxed);
  }
};

}  // namespace srvfront

#endif  // SRVFRONT_STATS_HPP_
