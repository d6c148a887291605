#ifndef SRVFRONT_SERVER_HPP_
#define SRVFRONT_SERVER_HPP_

#include "admission.hpp"
#include "event_loop.hpp"
#include "handler.hpp"
#include "log.hpp"
#include "stats.hpp"
#include "tls.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <functional>
#include <memory>
#include <sockpp/socket.h>
#include <sockpp/tcp_socket.h>
#include <string>
#include <unordered_map>
#include <utility>

namespace srvfront {

// ============================================================================
// TCP Tuning Configuration (applied to every accepted socket)
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = false;     // Disable Nagle algorithm
  bool tcp_quickack = false;    // Reduce ACK delay (Linux-specific)
  bool so_keepalive = false;    // Enable TCP keepalive

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 60;
  int keepalive_interval_s = 10;
  int keepalive_count = 5;
};

// ============================================================================
// Handler type: factory plus a name for the start-up log
// ============================================================================

using HandlerFactory = std::function<std::shared_ptr<Handler>(sockpp::tcp_socket&&, Server&, EventLoop&)>;

struct HandlerType {
  std::string name;
  HandlerFactory create;
};

template <typename H>
HandlerType handler_type(std::string name) {
  return HandlerType{std::move(name), [](sockpp::tcp_socket&& sock, Server& server, EventLoop& loop) {
                       return std::shared_ptr<Handler>(std::make_shared<H>(std::move(sock), server, loop));
                     }};
}

// ============================================================================
// Options
// ============================================================================

struct ServerOptions {
  int backlog = 100;
  size_t max_cons = AdmissionController::kDefaultMaxCons;             // 0 == unlimited
  size_t max_cons_per_ip = AdmissionController::kDefaultMaxConsPerIp;  // 0 == unlimited
  TcpTuning tcp_tuning;
  TlsConfig tls;  // TLS transport when tls.enabled()
  Logger logger;  // discards everything by default
};

enum class ConcurrencyModel : uint8_t { kInline, kPreFork };

struct ServeOptions {
  int timeout_ms = 1000;         // one poll wait; -1 blocks until an event
  bool blocking = true;          // false: single pass, then return
  bool handle_interrupt = true;  // SIGINT/SIGTERM -> orderly shutdown
  int worker_processes = 1;      // != 1: pre-fork; <= 0: one per CPU

  ConcurrencyModel model() const {
    return worker_processes == 1 ? ConcurrencyModel::kInline : ConcurrencyModel::kPreFork;
  }
};

// ============================================================================
// Server - listening socket, admission control, dispatch, lifecycle
// ============================================================================

class Server {
 public:
  enum class State { kCreated, kBound, kServing, kStopping, kClosed };

  // Resolve host:port (empty host = all interfaces), bind and listen.
  // Throws BindError on failure, ConfigError on a bad TLS setup.
  Server(const std::string& host, uint16_t port, HandlerType handler, EventLoop& loop,
         ServerOptions options = ServerOptions());

  // Adopt an already bound socket. The server takes ownership of listen_fd.
  Server(int listen_fd, HandlerType handler, EventLoop& loop, ServerOptions options = ServerOptions());

  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * @brief Run the event loop.
   *
   * Returns after shutdown(), an interrupt, or one pass when non-blocking.
   * With blocking set every connection is closed before returning. In a
   * pre-forked pool this returns in each worker after its loop ends and in
   * the supervisor once every worker has exited.
   *
   * @throws ConfigError worker_processes != 1 combined with blocking == false,
   *         or the server is already closed.
   * @return error(kInterrupted) when an interrupt was observed and
   *         handle_interrupt is false; error(kSocketError) on a poll failure;
   *         the pool error when pre-forking failed.
   */
  expected<void, ErrorCode> serve(const ServeOptions& options = ServeOptions());

  // Thread-safe request to leave serve()
  void shutdown();

  // Close every connection and the listening socket. Idempotent.
  void close_all();

  // Called for every accepted socket. Never throws.
  // Returns the handler when it was started with handle(), null otherwise.
  std::shared_ptr<Handler> handle_accepted(sockpp::tcp_socket&& sock, const PeerAddress& peer);

  // --- Configuration ---

  Server& set_max_cons(size_t max) {
    admission_.set_max_cons(max);
    return *this;
  }

  Server& set_max_cons_per_ip(size_t max) {
    admission_.set_max_cons_per_ip(max);
    return *this;
  }

  Server& set_tcp_tuning(const TcpTuning& tuning) {
    tcp_tuning_ = tuning;
    return *this;
  }

  size_t max_cons() const { return admission_.max_cons(); }
  size_t max_cons_per_ip() const { return admission_.max_cons_per_ip(); }
  int backlog() const { return backlog_; }

  // --- Status ---

  State state() const { return state_.load(std::memory_order_acquire); }
  const PeerAddress& address() const { return address_; }
  size_t connection_count() const { return loop_.channel_count(); }
  size_t address_count(const std::string& host) const;
  size_t tracked_addresses() const;
  int worker_id() const { return worker_id_; }

  const ServerStats& stats() const { return stats_; }
  const Logger& logger() const { return logger_; }
  const TlsContext* tls_context() const { return tls_context_.get(); }

  // Handler close path: drop one entry for host from the address map
  void release_address(const std::string& host);

 private:
  void load_tls(const TlsConfig& config);
  void bind_and_listen(const std::string& host, uint16_t port);
  void adopt(int listen_fd);
  void read_bound_address();

  void handle_accept();
  void record_address(const std::string& host);
  void discard_failed(const std::shared_ptr<Handler>& handler, const std::string& host, bool recorded);
  void apply_tcp_tuning(int fd);
  void log_start(ConcurrencyModel model);

  HandlerType handler_;
  EventLoop& loop_;
  Logger logger_;
  int backlog_;
  AdmissionController admission_;
  TcpTuning tcp_tuning_;
  std::unique_ptr<TlsContext> tls_context_;

  sockpp::socket listener_;
  PeerAddress address_;

  // Live connections per remote host
  std::unordered_map<std::string, size_t> ip_map_;

  std::atomic<State> state_{State::kCreated};
  int worker_id_ = -1;

  ServerStats stats_;

  static constexpr int kMaxAcceptsPerPass = 64;
};

const char* to_string(Server::State state);
const char* to_string(ConcurrencyModel model);

}  // namespace srvfront

#endif  // SRVFRONT_SERVER_HPP_
