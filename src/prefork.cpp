#include "srvfront/prefork.hpp"

#include "srvfront/signals.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <chrono>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <unordered_map>

namespace srvfront {

namespace {

using ChildMap = std::unordered_map<pid_t, int>;

constexpr std::chrono::milliseconds kReapInterval{50};

// 0 in the child, the child's pid in the parent, -1 if fork() failed
pid_t start_child(int id, ChildMap& children) {
  pid_t pid = ::fork();
  if (pid > 0) {
    children[pid] = id;
  }
  return pid;
}

void terminate_children(const ChildMap& children) {
  for (const auto& child : children) {
    ::kill(child.first, SIGTERM);
  }
}

void reap_children(ChildMap& children) {
  while (!children.empty()) {
    int status = 0;
    pid_t pid = ::waitpid(-1, &status, 0);
    if (pid < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    children.erase(pid);
  }
}

}  // namespace

int cpu_count() {
  long n = ::sysconf(_SC_NPROCESSORS_ONLN);
  return n > 0 ? static_cast<int>(n) : 1;
}

expected<WorkerRole, ErrorCode> fork_workers(int count, const Logger& logger, int max_restarts) {
  const int number = count > 0 ? count : cpu_count();
  SRVFRONT_LOG_INFO(logger, "starting " << number << " pre-fork processes");

  ChildMap children;
  for (int id = 0; id < number; ++id) {
    pid_t pid = start_child(id, children);
    if (pid == 0) {
      return expected<WorkerRole, ErrorCode>::success(WorkerRole{WorkerRole::Kind::kWorker, id});
    }
    if (pid < 0) {
      int err = errno;
      SRVFRONT_LOG_ERROR(logger, "fork() failed for worker " << id << ": " << strerror(err));
      terminate_children(children);
      reap_children(children);
      return expected<WorkerRole, ErrorCode>::error(ErrorCode::kForkFailed);
    }
  }

  int restarts = 0;
  bool terminating = false;

  while (!children.empty()) {
    if (!terminating && interrupt_pending()) {
      terminating = true;
      SRVFRONT_LOG_INFO(logger, "received interrupt signal, stopping " << children.size() << " worker(s)");
      terminate_children(children);
    }

    // WNOHANG plus a short sleep so an interrupt is never missed while blocked
    int status = 0;
    pid_t pid = ::waitpid(-1, &status, WNOHANG);
    if (pid == 0) {
      std::this_thread::sleep_for(kReapInterval);
      continue;
    }
    if (pid < 0) {
      int err = errno;
      if (err == EINTR) {
        continue;
      }
      if (err == ECHILD) {
        break;
      }
      SRVFRONT_LOG_ERROR(logger, "waitpid() failed: " << strerror(err));
      terminate_children(children);
      reap_children(children);
      return expected<WorkerRole, ErrorCode>::error(ErrorCode::kInternalError);
    }

    auto it = children.find(pid);
    if (it == children.end()) {
      continue;
    }
    const int id = it->second;
    children.erase(it);

    if (WIFSIGNALED(status)) {
      SRVFRONT_LOG_WARN(logger, "child " << id << " (pid " << pid << ") killed by signal " << WTERMSIG(status));
    } else if (WEXITSTATUS(status) != 0) {
      SRVFRONT_LOG_WARN(logger, "child " << id << " (pid " << pid << ") exited with status " << WEXITSTATUS(status));
    } else {
      SRVFRONT_LOG_INFO(logger, "child " << id << " (pid " << pid << ") exited normally");
      continue;
    }

    if (terminating) {
      continue;
    }

    if (++restarts > max_restarts) {
      SRVFRONT_LOG_ERROR(logger, "too many child restarts, giving up");
      terminate_children(children);
      reap_children(children);
      return expected<WorkerRole, ErrorCode>::error(ErrorCode::kTooManyRestarts);
    }

    SRVFRONT_LOG_INFO(logger, "restarting child " << id);
    pid_t new_pid = start_child(id, children);
    if (new_pid == 0) {
      return expected<WorkerRole, ErrorCode>::success(WorkerRole{WorkerRole::Kind::kWorker, id});
    }
    if (new_pid < 0) {
      int err = errno;
      SRVFRONT_LOG_ERROR(logger, "fork() failed restarting worker " << id << ": " << strerror(err));
      terminate_children(children);
      reap_children(children);
      return expected<WorkerRole, ErrorCode>::error(ErrorCode::kForkFailed);
    }
  }

  return expected<WorkerRole, ErrorCode>::success(WorkerRole{WorkerRole::Kind::kSupervisor, -1});
}

}  // namespace srvfront
