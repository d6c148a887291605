#include "srvfront/transport.hpp"

#include <cerrno>

#include <mbedtls/net_sockets.h>
#include <sys/socket.h>
#include <unistd.h>

namespace srvfront {

// ============================================================================
// PlainTransport
// ============================================================================

PlainTransport::PlainTransport(sockpp::tcp_socket&& sock) : socket_(std::move(sock)) {
  if (socket_.is_open()) {
    socket_.set_non_blocking(true);
  }
}

PlainTransport::~PlainTransport() {
  close();
}

expected<size_t, ErrorCode> PlainTransport::read(uint8_t* buf, size_t len) {
  ssize_t n = ::recv(socket_.handle(), buf, len, 0);
  if (n > 0) {
    return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
  }
  if (n == 0) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  int err = errno;
  if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kWouldBlock);
  }
  if (err == ECONNRESET || err == ENOTCONN || err == ESHUTDOWN || err == ECONNABORTED) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
}

expected<size_t, ErrorCode> PlainTransport::write(const uint8_t* buf, size_t len) {
  ssize_t n = ::send(socket_.handle(), buf, len, MSG_NOSIGNAL);
  if (n >= 0) {
    return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
  }
  int err = errno;
  if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kWouldBlock);
  }
  if (err == EPIPE || err == ECONNRESET || err == ENOTCONN) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
}

void PlainTransport::close() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

// ============================================================================
// TlsSession BIO callbacks (MSG_NOSIGNAL, non-blocking)
// ============================================================================

int TlsSession::bio_send(void* ctx, const unsigned char* buf, size_t len) {
  int fd = *static_cast<int*>(ctx);
  ssize_t n = ::send(fd, buf, len, MSG_NOSIGNAL);
  if (n >= 0) {
    return static_cast<int>(n);
  }
  int err = errno;
  if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
    return MBEDTLS_ERR_SSL_WANT_WRITE;
  }
  if (err == EPIPE || err == ECONNRESET) {
    return MBEDTLS_ERR_NET_CONN_RESET;
  }
  return MBEDTLS_ERR_NET_SEND_FAILED;
}

int TlsSession::bio_recv(void* ctx, unsigned char* buf, size_t len) {
  int fd = *static_cast<int*>(ctx);
  ssize_t n = ::recv(fd, buf, len, 0);
  if (n >= 0) {
    return static_cast<int>(n);
  }
  int err = errno;
  if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
    return MBEDTLS_ERR_SSL_WANT_READ;
  }
  if (err == ECONNRESET) {
    return MBEDTLS_ERR_NET_CONN_RESET;
  }
  return MBEDTLS_ERR_NET_RECV_FAILED;
}

// ============================================================================
// TlsTransport
// ============================================================================

TlsTransport::TlsTransport(sockpp::tcp_socket&& sock, const TlsContext& ctx) : socket_(std::move(sock)) {
  if (!socket_.is_open()) {
    return;
  }
  socket_.set_non_blocking(true);
  setup_ok_ = session_.setup(ctx, socket_.handle()) == 0;
}

TlsTransport::~TlsTransport() {
  close();
}

expected<void, ErrorCode> TlsTransport::continue_handshake() {
  if (handshake_done_) {
    return expected<void, ErrorCode>::success();
  }
  int ret = session_.handshake();
  if (ret == 0) {
    handshake_done_ = true;
    wants_write_ = false;
    return expected<void, ErrorCode>::success();
  }
  if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
    wants_write_ = ret == MBEDTLS_ERR_SSL_WANT_WRITE;
    return expected<void, ErrorCode>::error(ErrorCode::kWouldBlock);
  }
  if (ret == MBEDTLS_ERR_NET_CONN_RESET) {
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  return expected<void, ErrorCode>::error(ErrorCode::kTlsError);
}

expected<size_t, ErrorCode> TlsTransport::read(uint8_t* buf, size_t len) {
  if (!handshake_done_) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kWouldBlock);
  }
  int ret = session_.read(buf, len);
  if (ret > 0) {
    return expected<size_t, ErrorCode>::success(static_cast<size_t>(ret));
  }
  if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kWouldBlock);
  }
  if (ret == 0 || ret == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY || ret == MBEDTLS_ERR_NET_CONN_RESET) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  return expected<size_t, ErrorCode>::error(ErrorCode::kTlsError);
}

expected<size_t, ErrorCode> TlsTransport::write(const uint8_t* buf, size_t len) {
  if (!handshake_done_) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kWouldBlock);
  }
  int ret = session_.write(buf, len);
  if (ret >= 0) {
    return expected<size_t, ErrorCode>::success(static_cast<size_t>(ret));
  }
  if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kWouldBlock);
  }
  if (ret == MBEDTLS_ERR_NET_CONN_RESET) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  return expected<size_t, ErrorCode>::error(ErrorCode::kTlsError);
}

void TlsTransport::close() {
  if (!socket_.is_open()) {
    return;
  }
  if (handshake_done_) {
    // Best effort; the peer may already be gone
    int ret = session_.close_notify();
    (void)ret;
  }
  socket_.close();
}

}  // namespace srvfront
