#include "srvfront/prefork.hpp"
#include "srvfront/server.hpp"
#include "srvfront/signals.hpp"

#include <csignal>

#include <arpa/inet.h>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <netinet/in.h>
#include <set>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace srvfront;

// Children never return into the test runner.

namespace {

class CaptureSink : public LogSink {
 public:
  void write(LogLevel /* level */, std::string_view msg) override { lines.emplace_back(msg); }

  bool contains(const std::string& needle) const {
    for (const auto& line : lines) {
      if (line.find(needle) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

  std::vector<std::string> lines;
};

}  // namespace

TEST_CASE("cpu_count - at least one", "[prefork]") {
  REQUIRE(cpu_count() >= 1);
}

TEST_CASE("fork_workers - clean exits are not restarted", "[prefork]") {
  clear_interrupt();
  CaptureSink sink;
  Logger logger(sink);

  auto role = fork_workers(2, logger);
  if (role.has_value() && role.value().is_worker()) {
    ::_exit(0);
  }

  REQUIRE(role.has_value());
  REQUIRE(role.value().is_supervisor());
  REQUIRE(role.value().id == -1);
  REQUIRE(sink.contains("starting 2 pre-fork processes"));
  REQUIRE(sink.contains("exited normally"));
  REQUIRE_FALSE(sink.contains("restarting child"));
}

TEST_CASE("fork_workers - crashing workers exhaust the restart budget", "[prefork]") {
  clear_interrupt();
  CaptureSink sink;
  Logger logger(sink);

  auto role = fork_workers(1, logger, 2);
  if (role.has_value() && role.value().is_worker()) {
    ::_exit(3);
  }

  REQUIRE(!role.has_value());
  REQUIRE(role.get_error() == ErrorCode::kTooManyRestarts);
  REQUIRE(sink.contains("exited with status 3"));
  REQUIRE(sink.contains("restarting child 0"));
  REQUIRE(sink.contains("too many child restarts, giving up"));
}

TEST_CASE("fork_workers - each worker gets a distinct id", "[prefork]") {
  clear_interrupt();
  CaptureSink sink;
  Logger logger(sink);

  int pipe_fds[2];
  REQUIRE(::pipe(pipe_fds) == 0);

  // Every worker reports its id through the pipe
  auto role = fork_workers(2, logger, 5);
  if (role.has_value() && role.value().is_worker()) {
    ::close(pipe_fds[0]);
    char id = static_cast<char>('0' + role.value().id);
    ssize_t n = ::write(pipe_fds[1], &id, 1);
    (void)n;
    ::_exit(0);
  }
  ::close(pipe_fds[1]);

  REQUIRE(role.has_value());
  REQUIRE(role.value().is_supervisor());

  std::string seen;
  char c;
  while (::read(pipe_fds[0], &c, 1) == 1) {
    seen.push_back(c);
  }
  ::close(pipe_fds[0]);

  REQUIRE(seen.size() == 2);
  REQUIRE(seen.find('0') != std::string::npos);
  REQUIRE(seen.find('1') != std::string::npos);
}

TEST_CASE("fork_workers - interrupt is forwarded to workers", "[prefork]") {
  clear_interrupt();
  CaptureSink sink;
  Logger logger(sink);
  InterruptScope scope;
  REQUIRE(scope.installed());

  std::thread interrupter([]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    ::kill(::getpid(), SIGINT);
  });

  auto role = fork_workers(2, logger, 5);
  if (role.has_value() && role.value().is_worker()) {
    ::signal(SIGTERM, SIG_DFL);
    for (;;) {
      ::pause();
    }
  }
  interrupter.join();

  REQUIRE(role.has_value());
  REQUIRE(role.value().is_supervisor());
  REQUIRE(sink.contains("received interrupt signal"));
  REQUIRE(sink.contains("killed by signal"));
  REQUIRE_FALSE(sink.contains("restarting child"));
  clear_interrupt();
}

// ============================================================================
// Server::serve with worker processes
// ============================================================================

namespace {

const char kMaxConsReply[] = "421 Too many connections. Service temporarily unavailable.";

// Greets with the id of the worker that accepted the connection
class WorkerIdHandler : public Handler {
 public:
  using Handler::Handler;

  void handle() override { push("220 worker " + std::to_string(server().worker_id()) + "\r\n"); }
};

int connect_loopback(uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return -1;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    ::close(fd);
    return -1;
  }
  timeval tv{};
  tv.tv_sec = 2;
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  return fd;
}

std::string read_line(int fd) {
  std::string line;
  char c;
  while (::recv(fd, &c, 1, 0) == 1) {
    if (c == '\n') {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return line;
    }
    line.push_back(c);
  }
  return {};
}

struct PoolClientResult {
  std::set<std::string> greetings;
  int admitted = 0;
  int rejected = 0;
  std::string overflow_reply;
};

// Holds connections open until every worker has admitted one, then checks
// that one more is turned away and interrupts the supervisor.
void drive_pool(uint16_t port, int workers, PoolClientResult& result) {
  std::vector<int> held;
  for (int attempt = 0; attempt < 100 && result.admitted < workers; ++attempt) {
    int fd = connect_loopback(port);
    if (fd < 0) {
      break;
    }
    std::string line = read_line(fd);
    if (line.rfind("220 worker ", 0) == 0) {
      ++result.admitted;
      result.greetings.insert(line);
      held.push_back(fd);
      continue;
    }
    if (line == kMaxConsReply) {
      ++result.rejected;
    }
    ::close(fd);
  }

  int fd = connect_loopback(port);
  if (fd >= 0) {
    result.overflow_reply = read_line(fd);
    ::close(fd);
  }

  for (int held_fd : held) {
    ::close(held_fd);
  }
  ::kill(::getpid(), SIGINT);
}

}  // namespace

TEST_CASE("Server - pre-fork serve applies limits per worker", "[prefork][server]") {
  clear_interrupt();
  CaptureSink sink;
  PollLoop loop;
  ServerOptions options;
  options.max_cons = 1;
  options.logger = Logger(sink);
  Server server("127.0.0.1", 0, handler_type<WorkerIdHandler>("WorkerIdHandler"), loop, options);

  PoolClientResult client;
  std::thread driver([&server, &client]() { drive_pool(server.address().port, 2, client); });

  ServeOptions serve_options;
  serve_options.worker_processes = 2;
  serve_options.timeout_ms = 50;
  auto result = server.serve(serve_options);
  if (server.worker_id() >= 0) {
    // Worker: its loop ended on the forwarded SIGTERM
    ::_exit(result.has_value() && server.state() == Server::State::kClosed ? 0 : 1);
  }
  driver.join();

  REQUIRE(result.has_value());
  REQUIRE(server.worker_id() == -1);
  REQUIRE(server.state() == Server::State::kClosed);
  REQUIRE_FALSE(interrupt_pending());

  // max_cons == 1 in each worker, so two connections are live at once
  REQUIRE(client.admitted == 2);
  REQUIRE(client.greetings.size() == 2);
  REQUIRE(client.greetings.count("220 worker 0") == 1);
  REQUIRE(client.greetings.count("220 worker 1") == 1);
  REQUIRE(client.overflow_reply == kMaxConsReply);

  REQUIRE(sink.contains("concurrency model: prefork + async"));
  REQUIRE(sink.contains("starting 2 pre-fork processes"));
  REQUIRE(sink.contains("received interrupt signal"));
  REQUIRE_FALSE(sink.contains("killed by signal"));
  REQUIRE_FALSE(sink.contains("restarting child"));
}
