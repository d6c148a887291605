#ifndef SRVFRONT_TRANSPORT_HPP_
#define SRVFRONT_TRANSPORT_HPP_

#include "tls.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <memory>
#include <sockpp/tcp_socket.h>

namespace srvfront {

// ============================================================================
// Transport - byte stream under a Handler (plain TCP or TLS)
// ============================================================================
//
// read()/write() never block. They return error(kWouldBlock) when the socket
// is not ready, error(kConnectionClosed) on orderly EOF and
// error(kSocketError) / error(kTlsError) on failure.

class Transport {
 public:
  virtual ~Transport() = default;

  virtual int fd() const = 0;
  virtual bool is_open() const = 0;

  virtual expected<size_t, ErrorCode> read(uint8_t* buf, size_t len) = 0;
  virtual expected<size_t, ErrorCode> write(const uint8_t* buf, size_t len) = 0;

  // Bytes already decrypted and waiting inside the transport
  virtual size_t pending() const { return 0; }

  // Handshake state for transports that have one
  virtual bool handshake_pending() const { return false; }
  virtual bool handshake_wants_write() const { return false; }
  virtual expected<void, ErrorCode> continue_handshake() { return expected<void, ErrorCode>::success(); }

  virtual void close() = 0;

  virtual const char* name() const = 0;
};

class PlainTransport final : public Transport {
 public:
  explicit PlainTransport(sockpp::tcp_socket&& sock);
  ~PlainTransport() override;

  int fd() const override { return socket_.handle(); }
  bool is_open() const override { return socket_.is_open(); }

  expected<size_t, ErrorCode> read(uint8_t* buf, size_t len) override;
  expected<size_t, ErrorCode> write(const uint8_t* buf, size_t len) override;

  void close() override;

  const char* name() const override { return "tcp"; }

 private:
  sockpp::tcp_socket socket_;
};

class TlsTransport final : public Transport {
 public:
  TlsTransport(sockpp::tcp_socket&& sock, const TlsContext& ctx);
  ~TlsTransport() override;

  // False when mbedtls_ssl_setup() failed; the handler then reports
  // itself as not connected.
  bool ready() const { return setup_ok_; }

  int fd() const override { return socket_.handle(); }
  bool is_open() const override { return socket_.is_open(); }

  expected<size_t, ErrorCode> read(uint8_t* buf, size_t len) override;
  expected<size_t, ErrorCode> write(const uint8_t* buf, size_t len) override;
  size_t pending() const override { return session_.bytes_available(); }

  bool handshake_pending() const override { return !handshake_done_; }
  bool handshake_wants_write() const override { return wants_write_; }
  expected<void, ErrorCode> continue_handshake() override;

  void close() override;

  const char* name() const override { return "tls"; }

 private:
  sockpp::tcp_socket socket_;
  TlsSession session_;
  bool setup_ok_ = false;
  bool handshake_done_ = false;
  bool wants_write_ = false;
};

}  // namespace srvfront

#endif  // SRVFRONT_TRANSPORT_HPP_
