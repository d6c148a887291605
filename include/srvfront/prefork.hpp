#ifndef SRVFRONT_PREFORK_HPP_
#define SRVFRONT_PREFORK_HPP_

#include "log.hpp"
#include "vocabulary.hpp"

namespace srvfront {

struct WorkerRole {
  enum class Kind { kSupervisor, kWorker };

  Kind kind = Kind::kSupervisor;
  int id = -1;  // 0..N-1 in a worker, -1 in the supervisor

  bool is_worker() const { return kind == Kind::kWorker; }
  bool is_supervisor() const { return kind == Kind::kSupervisor; }
};

// Number of online processors, at least 1.
int cpu_count();

/**
 * @brief Fork worker processes that share the caller's open descriptors.
 *
 * In a child returns WorkerRole{kWorker, id} right after fork(). In the
 * parent blocks supervising the children and returns
 * WorkerRole{kSupervisor, -1} once all of them have exited:
 *   - exit status 0: not restarted
 *   - non-zero status or killed by a signal: restarted with the same id
 *   - more than max_restarts restarts: error(kTooManyRestarts)
 *   - interrupt observed while waiting: SIGTERM forwarded to every child,
 *     no further restarts
 *
 * @param count Number of workers; <= 0 selects cpu_count().
 */
expected<WorkerRole, ErrorCode> fork_workers(int count, const Logger& logger, int max_restarts = 100);

}  // namespace srvfront

#endif  // SRVFRONT_PREFORK_HPP_
