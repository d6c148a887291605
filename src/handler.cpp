#include "srvfront/handler.hpp"

#include "srvfront/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace srvfront {

static uint64_t g_next_handler_id = 1;

PeerAddress to_peer_address(const sockaddr* addr, socklen_t len) {
  PeerAddress peer;
  char host[INET6_ADDRSTRLEN] = {0};
  if (addr->sa_family == AF_INET && len >= static_cast<socklen_t>(sizeof(sockaddr_in))) {
    const auto* in4 = reinterpret_cast<const sockaddr_in*>(addr);
    ::inet_ntop(AF_INET, &in4->sin_addr, host, sizeof(host));
    peer.host = host;
    peer.port = ntohs(in4->sin_port);
  } else if (addr->sa_family == AF_INET6 && len >= static_cast<socklen_t>(sizeof(sockaddr_in6))) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(addr);
    ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
    peer.host = host;
    peer.port = ntohs(in6->sin6_port);
  } else if (addr->sa_family == AF_UNIX) {
    peer.host = "unix";
  }
  return peer;
}

Handler::Handler(sockpp::tcp_socket&& sock, Server& server, EventLoop& loop)
    : id_(g_next_handler_id++), server_(server), loop_(loop) {
  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  // ENOTCONN here means the client gave up between accept() and now
  bool peer_ok = sock.is_open() && ::getpeername(sock.handle(), reinterpret_cast<sockaddr*>(&ss), &len) == 0;
  if (peer_ok) {
    peer_ = to_peer_address(reinterpret_cast<const sockaddr*>(&ss), len);
  }

  const TlsContext* tls = server_.tls_context();
  if (tls != nullptr) {
    auto transport = std::make_unique<TlsTransport>(std::move(sock), *tls);
    connected_ = peer_ok && transport->ready();
    transport_ = std::move(transport);
  } else {
    transport_ = std::make_unique<PlainTransport>(std::move(sock));
    connected_ = peer_ok;
  }
}

Handler::~Handler() = default;

const Logger& Handler::logger() const {
  return server_.logger();
}

void Handler::bind_address(const std::string& host) {
  address_ = host;
  owns_address_ = true;
}

// ============================================================================
// Dispatch entry points
// ============================================================================

void Handler::handle_max_cons() {
  push(max_cons_reply());
  close_when_done();
}

void Handler::handle_max_cons_per_ip() {
  push(max_cons_per_ip_reply());
  close_when_done();
}

// ============================================================================
// Channel
// ============================================================================

int Handler::fd() const {
  return transport_->fd();
}

bool Handler::readable() const {
  return !closed_;
}

bool Handler::writable() const {
  if (closed_) {
    return false;
  }
  if (transport_->handshake_pending()) {
    return transport_->handshake_wants_write();
  }
  return !tx_buffer_.empty();
}

void Handler::handle_read_event() {
  if (transport_->handshake_pending()) {
    advance_handshake();
    if (closed_ || transport_->handshake_pending()) {
      return;
    }
  }

  uint8_t buf[kReadChunkSize];
  for (int i = 0; i < kMaxReadsPerEvent && !closed_; ++i) {
    auto result = transport_->read(buf, sizeof(buf));
    if (!result.has_value()) {
      switch (result.get_error()) {
        case ErrorCode::kWouldBlock:
          return;
        case ErrorCode::kConnectionClosed:
          handle_close_event();
          return;
        default:
          SRVFRONT_LOG_DEBUG(logger(), "read error on #" << id_ << ": " << to_string(result.get_error()));
          close();
          return;
      }
    }
    size_t n = result.value();
    on_data(std::string_view(reinterpret_cast<const char*>(buf), n));
    if (n < sizeof(buf) && transport_->pending() == 0) {
      return;
    }
  }
}

void Handler::handle_write_event() {
  if (transport_->handshake_pending()) {
    advance_handshake();
    return;
  }
  flush();
}

void Handler::handle_close_event() {
  close();
}

void Handler::handle_error() {
  SRVFRONT_LOG_ERROR(logger(), "unhandled error in handler #" << id_ << " (" << transport_->name() << " "
                                                              << peer_.host << ":" << peer_.port
                                                              << "), closing connection");
  close();
}

void Handler::close() {
  if (closed_) {
    return;
  }
  closed_ = true;

  // The registry may hold the last reference
  auto self = weak_from_this().lock();

  loop_.remove(*this);
  transport_->close();
  if (owns_address_) {
    owns_address_ = false;
    server_.release_address(address_);
  }
  on_close();
}

// ============================================================================
// Output
// ============================================================================

void Handler::push(std::string_view data) {
  if (closed_ || data.empty()) {
    return;
  }
  tx_buffer_.append(data.data(), data.size());
  if (!transport_->handshake_pending()) {
    flush();
  }
}

void Handler::close_when_done() {
  closing_ = true;
  if (tx_buffer_.empty()) {
    close();
    return;
  }
  if (!transport_->handshake_pending()) {
    flush();
  }
}

void Handler::flush() {
  while (!tx_buffer_.empty() && !closed_) {
    auto result = transport_->write(reinterpret_cast<const uint8_t*>(tx_buffer_.data()), tx_buffer_.size());
    if (!result.has_value()) {
      if (result.get_error() == ErrorCode::kWouldBlock) {
        return;
      }
      SRVFRONT_LOG_DEBUG(logger(), "write error on #" << id_ << ": " << to_string(result.get_error()));
      close();
      return;
    }
    if (result.value() == 0) {
      return;
    }
    tx_buffer_.erase(0, result.value());
  }

  if (closing_ && tx_buffer_.empty()) {
    close();
  }
}

void Handler::advance_handshake() {
  auto result = transport_->continue_handshake();
  if (result.has_value()) {
    if (closing_ && tx_buffer_.empty()) {
      close();
      return;
    }
    flush();
    return;
  }
  if (result.get_error() == ErrorCode::kWouldBlock) {
    return;
  }
  SRVFRONT_LOG_DEBUG(logger(), "handshake with " << peer_.host << ":" << peer_.port
                                                 << " failed: " << to_string(result.get_error()));
  close();
}

}  // namespace srvfront
