#include "srvfront/server.hpp"

#include "srvfront/prefork.hpp"
#include "srvfront/signals.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace srvfront {

const char* to_string(Server::State state) {
  switch (state) {
    case Server::State::kCreated:
      return "created";
    case Server::State::kBound:
      return "bound";
    case Server::State::kServing:
      return "serving";
    case Server::State::kStopping:
      return "stopping";
    case Server::State::kClosed:
      return "closed";
  }
  return "unknown";
}

const char* to_string(ConcurrencyModel model) {
  return model == ConcurrencyModel::kPreFork ? "prefork + async" : "async";
}

// ============================================================================
// Construction (CREATED -> BOUND)
// ============================================================================

Server::Server(const std::string& host, uint16_t port, HandlerType handler, EventLoop& loop,
               ServerOptions options)
    : handler_(std::move(handler)),
      loop_(loop),
      logger_(options.logger),
      backlog_(options.backlog),
      admission_(options.max_cons, options.max_cons_per_ip),
      tcp_tuning_(options.tcp_tuning) {
  if (!handler_.create) {
    SRVFRONT_THROW(ConfigError("no handler factory given"));
  }
  // TLS first: a bad certificate must fail before any socket exists
  if (options.tls.enabled()) {
    load_tls(options.tls);
  }
  bind_and_listen(host, port);
  read_bound_address();
  state_.store(State::kBound, std::memory_order_release);
  SRVFRONT_LOG_DEBUG(logger_, "listening on " << address_.host << ":" << address_.port);
}

Server::Server(int listen_fd, HandlerType handler, EventLoop& loop, ServerOptions options)
    : handler_(std::move(handler)),
      loop_(loop),
      logger_(options.logger),
      backlog_(options.backlog),
      admission_(options.max_cons, options.max_cons_per_ip),
      tcp_tuning_(options.tcp_tuning) {
  if (!handler_.create) {
    ::close(listen_fd);
    SRVFRONT_THROW(ConfigError("no handler factory given"));
  }
  if (options.tls.enabled()) {
    try {
      load_tls(options.tls);
    } catch (const ConfigError&) {
      ::close(listen_fd);
      throw;
    }
  }
  adopt(listen_fd);
  read_bound_address();
  state_.store(State::kBound, std::memory_order_release);
  SRVFRONT_LOG_DEBUG(logger_, "adopted listening socket " << address_.host << ":" << address_.port);
}

Server::~Server() {
  close_all();
}

void Server::load_tls(const TlsConfig& config) {
  auto ctx = std::make_unique<TlsContext>();
  int ret = ctx->init(config);
  if (ret != 0) {
    SRVFRONT_THROW(ConfigError("TLS setup failed for " + config.cert_path + ": " + tls_error_string(ret)));
  }
  tls_context_ = std::move(ctx);
}

void Server::bind_and_listen(const std::string& host, uint16_t port) {
  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  const std::string service = std::to_string(port);
  struct addrinfo* results = nullptr;
  int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &results);
  if (rc != 0) {
    SRVFRONT_THROW(BindError("cannot resolve " + host + ":" + service + ": " + gai_strerror(rc)));
  }
  ScopeGuard free_results([results]() { ::freeaddrinfo(results); });

  std::string last_error = "no usable address";
  for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = strerror(errno);
      continue;
    }

    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (::bind(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
      last_error = strerror(errno);
      ::close(fd);
      continue;
    }

    if (::listen(fd, backlog_) < 0) {
      last_error = strerror(errno);
      ::close(fd);
      continue;
    }

    listener_ = sockpp::socket(fd);
    listener_.set_non_blocking(true);
    return;
  }

  SRVFRONT_THROW(BindError("cannot bind " + (host.empty() ? std::string("*") : host) + ":" + service + ": " +
                           last_error));
}

void Server::adopt(int listen_fd) {
  int type = 0;
  socklen_t len = sizeof(type);
  if (listen_fd < 0) {
    SRVFRONT_THROW(BindError("invalid listening socket descriptor"));
  }
  if (::getsockopt(listen_fd, SOL_SOCKET, SO_TYPE, &type, &len) < 0) {
    int err = errno;
    ::close(listen_fd);
    SRVFRONT_THROW(BindError("invalid listening socket: " + std::string(strerror(err))));
  }
  if (type != SOCK_STREAM) {
    ::close(listen_fd);
    SRVFRONT_THROW(BindError("listening socket is not a stream socket"));
  }

  listener_ = sockpp::socket(listen_fd);
  listener_.set_non_blocking(true);
  if (::listen(listen_fd, backlog_) < 0) {
    int err = errno;
    listener_.close();
    SRVFRONT_THROW(BindError("listen() failed on adopted socket: " + std::string(strerror(err))));
  }
}

void Server::read_bound_address() {
  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  if (::getsockname(listener_.handle(), reinterpret_cast<sockaddr*>(&ss), &len) == 0) {
    address_ = to_peer_address(reinterpret_cast<const sockaddr*>(&ss), len);
  }
}

// ============================================================================
// Serving (BOUND -> SERVING -> STOPPING -> CLOSED)
// ============================================================================

expected<void, ErrorCode> Server::serve(const ServeOptions& options) {
  State current = state();
  if (current == State::kStopping || current == State::kClosed) {
    SRVFRONT_THROW(ConfigError("serve() called on a closed server"));
  }

  const bool prefork = options.model() == ConcurrencyModel::kPreFork;
  if (prefork && !options.blocking) {
    SRVFRONT_THROW(ConfigError("'worker_processes' and 'blocking' are mutually exclusive"));
  }

  const bool log = options.handle_interrupt && options.blocking;
  std::unique_ptr<InterruptScope> interrupt_scope;
  if (options.handle_interrupt) {
    interrupt_scope = std::make_unique<InterruptScope>();
    if (!interrupt_scope->installed()) {
      SRVFRONT_LOG_WARN(logger_, "could not install SIGINT/SIGTERM handlers: " << strerror(errno));
    }
  }

  if (prefork && current == State::kBound) {
    if (log) {
      log_start(ConcurrencyModel::kPreFork);
    }
    auto role = fork_workers(options.worker_processes, logger_);
    if (!role.has_value()) {
      SRVFRONT_LOG_ERROR(logger_, "pre-fork failed: " << to_string(role.get_error()));
      close_all();
      return expected<void, ErrorCode>::error(role.get_error());
    }
    if (role.value().is_supervisor()) {
      // Every worker has exited; the supervisor never served a connection
      if (options.handle_interrupt) {
        clear_interrupt();
      }
      close_all();
      return expected<void, ErrorCode>::success();
    }
    worker_id_ = role.value().id;
  } else if (log && current == State::kBound) {
    log_start(ConcurrencyModel::kInline);
  }

  if (current == State::kBound) {
    loop_.watch_listener(listener_.handle(), [this]() { handle_accept(); });
    state_.store(State::kServing, std::memory_order_release);
    SRVFRONT_LOG_INFO(logger_, ">>> starting " << (tls_context_ ? "TLS " : "") << "server on " << address_.host
                                               << ":" << address_.port << ", pid=" << ::getpid() << " <<<");
  }

  auto result = loop_.loop(options.timeout_ms, options.blocking);
  if (!result.has_value()) {
    if (result.get_error() != ErrorCode::kInterrupted) {
      SRVFRONT_LOG_ERROR(logger_, "event loop failed: " << to_string(result.get_error()));
      close_all();
      return result;
    }
    if (!options.handle_interrupt) {
      return result;
    }
    SRVFRONT_LOG_INFO(logger_, "received interrupt signal");
    clear_interrupt();
    result = expected<void, ErrorCode>::success();
  }

  if (options.blocking) {
    state_.store(State::kStopping, std::memory_order_release);
    if (log) {
      SRVFRONT_LOG_INFO(logger_, ">>> shutting down server, " << loop_.channel_count() << " socket(s), pid="
                                                             << ::getpid() << " <<<");
    }
    close_all();
  }
  return result;
}

void Server::shutdown() {
  loop_.stop();
}

void Server::close_all() {
  if (state() == State::kClosed) {
    return;
  }
  state_.store(State::kStopping, std::memory_order_release);

  loop_.close();
  loop_.unwatch_listener();
  if (listener_.is_open()) {
    listener_.close();
  }

  state_.store(State::kClosed, std::memory_order_release);
}

// ============================================================================
// Accept and dispatch
// ============================================================================

void Server::handle_accept() {
  // A handler may call close_all() while we are still accepting
  for (int i = 0; i < kMaxAcceptsPerPass && state() == State::kServing; ++i) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    int client = ::accept(listener_.handle(), reinterpret_cast<sockaddr*>(&ss), &len);
    if (client < 0) {
      int err = errno;
      if (err == EAGAIN || err == EWOULDBLOCK) {
        return;
      }
      // Client reset before we got to it, or a signal
      if (err == ECONNABORTED || err == EINTR) {
        continue;
      }
      // EMFILE, ENFILE, ENOBUFS...: leave the rest in the backlog
      stats_.accept_errors.fetch_add(1, std::memory_order_relaxed);
      SRVFRONT_LOG_WARN(logger_, "accept() failed: " << strerror(err));
      return;
    }

    apply_tcp_tuning(client);
    stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
    handle_accepted(sockpp::tcp_socket(client), to_peer_address(reinterpret_cast<const sockaddr*>(&ss), len));
  }
}

std::shared_ptr<Handler> Server::handle_accepted(sockpp::tcp_socket&& sock, const PeerAddress& peer) {
  std::shared_ptr<Handler> handler;
  bool recorded = false;

  try {
    handler = handler_.create(std::move(sock), *this, loop_);
    if (!handler || !handler->connected()) {
      return nullptr;
    }
    loop_.add(handler);

    record_address(peer.host);
    recorded = true;
    handler->bind_address(peer.host);

    // fds are the scarce resource, so the global limit is checked first
    switch (admission_.decide(loop_.channel_count(), address_count(peer.host))) {
      case AdmissionVerdict::kRejectGlobal:
        stats_.rejected_max_cons.fetch_add(1, std::memory_order_relaxed);
        SRVFRONT_LOG_DEBUG(logger_, "max connections reached, rejecting " << peer.host << ":" << peer.port);
        handler->handle_max_cons();
        return nullptr;
      case AdmissionVerdict::kRejectPerAddress:
        stats_.rejected_max_cons_per_ip.fetch_add(1, std::memory_order_relaxed);
        SRVFRONT_LOG_DEBUG(logger_, "max connections per ip reached, rejecting " << peer.host << ":" << peer.port);
        handler->handle_max_cons_per_ip();
        return nullptr;
      case AdmissionVerdict::kAccept:
        break;
    }

    try {
      handler->handle();
    } catch (const std::exception& e) {
      stats_.handler_faults.fetch_add(1, std::memory_order_relaxed);
      SRVFRONT_LOG_ERROR(logger_, "handler #" << handler->id() << " failed to start for " << peer.host << ":"
                                              << peer.port << ": " << e.what());
      handler->handle_error();
      return nullptr;
    } catch (...) {
      stats_.handler_faults.fetch_add(1, std::memory_order_relaxed);
      SRVFRONT_LOG_ERROR(logger_, "handler #" << handler->id() << " failed to start for " << peer.host << ":"
                                              << peer.port << ": unknown exception");
      handler->handle_error();
      return nullptr;
    }
    stats_.handled_connections.fetch_add(1, std::memory_order_relaxed);
    return handler;
  } catch (const std::exception& e) {
    // A bug in handler construction or in our own bookkeeping. Keep
    // serving everybody else.
    stats_.dispatch_faults.fetch_add(1, std::memory_order_relaxed);
    SRVFRONT_LOG_ERROR(logger_, "error dispatching connection from " << peer.host << ":" << peer.port
                                                                     << " (handler " << handler_.name
                                                                     << "): " << e.what());
    discard_failed(handler, peer.host, recorded);
    return nullptr;
  } catch (...) {
    stats_.dispatch_faults.fetch_add(1, std::memory_order_relaxed);
    SRVFRONT_LOG_ERROR(logger_, "error dispatching connection from " << peer.host << ":" << peer.port
                                                                     << " (handler " << handler_.name
                                                                     << "): unknown exception");
    discard_failed(handler, peer.host, recorded);
    return nullptr;
  }
}

void Server::discard_failed(const std::shared_ptr<Handler>& handler, const std::string& host, bool recorded) {
  if (handler) {
    if (recorded && !handler->owns_address()) {
      release_address(host);
    }
    try {
      handler->close();
    } catch (const std::exception& e) {
      SRVFRONT_LOG_ERROR(logger_, "error closing handler #" << handler->id() << ": " << e.what());
    } catch (...) {
      SRVFRONT_LOG_ERROR(logger_, "error closing handler #" << handler->id() << ": unknown exception");
    }
  } else if (recorded) {
    release_address(host);
  }
}

// ============================================================================
// Address map
// ============================================================================

void Server::record_address(const std::string& host) {
  ++ip_map_[host];
}

void Server::release_address(const std::string& host) {
  auto it = ip_map_.find(host);
  if (it == ip_map_.end()) {
    return;
  }
  if (--it->second == 0) {
    ip_map_.erase(it);
  }
}

size_t Server::address_count(const std::string& host) const {
  auto it = ip_map_.find(host);
  return it == ip_map_.end() ? 0 : it->second;
}

size_t Server::tracked_addresses() const {
  size_t total = 0;
  for (const auto& entry : ip_map_) {
    total += entry.second;
  }
  return total;
}

// ============================================================================
// Helpers
// ============================================================================

void Server::apply_tcp_tuning(int fd) {
  int opt = 1;

  if (tcp_tuning_.tcp_nodelay) {
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
  }

#ifdef TCP_QUICKACK
  if (tcp_tuning_.tcp_quickack) {
    setsockopt(fd, IPPROTO_TCP, TCP_QUICKACK, &opt, sizeof(opt));
  }
#endif

  if (tcp_tuning_.so_keepalive) {
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));

#ifdef TCP_KEEPIDLE
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &tcp_tuning_.keepalive_idle_s, sizeof(tcp_tuning_.keepalive_idle_s));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &tcp_tuning_.keepalive_interval_s,
               sizeof(tcp_tuning_.keepalive_interval_s));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &tcp_tuning_.keepalive_count, sizeof(tcp_tuning_.keepalive_count));
#endif
  }
}

void Server::log_start(ConcurrencyModel model) {
  SRVFRONT_LOG_INFO(logger_, "concurrency model: " << to_string(model));
  SRVFRONT_LOG_DEBUG(logger_, "poller: " << loop_.name());
  SRVFRONT_LOG_DEBUG(logger_, "handler: " << handler_.name);
  SRVFRONT_LOG_DEBUG(logger_, "transport: " << (tls_context_ ? "tls" : "tcp"));
  if (admission_.max_cons() == 0) {
    SRVFRONT_LOG_DEBUG(logger_, "max connections: unlimited");
  } else {
    SRVFRONT_LOG_DEBUG(logger_, "max connections: " << admission_.max_cons());
  }
  if (admission_.max_cons_per_ip() == 0) {
    SRVFRONT_LOG_DEBUG(logger_, "max connections per ip: unlimited");
  } else {
    SRVFRONT_LOG_DEBUG(logger_, "max connections per ip: " << admission_.max_cons_per_ip());
  }
  SRVFRONT_LOG_DEBUG(logger_, "backlog: " << backlog_);
}

}  // namespace srvfront
