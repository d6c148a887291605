#ifndef SRVFRONT_HANDLER_HPP_
#define SRVFRONT_HANDLER_HPP_

#include "event_loop.hpp"
#include "log.hpp"
#include "transport.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <sockpp/tcp_socket.h>
#include <string>
#include <string_view>
#include <sys/socket.h>

namespace srvfront {

class Server;

struct PeerAddress {
  std::string host;
  uint16_t port = 0;
};

// Host string and port of an AF_INET/AF_INET6 address; "unix" for AF_UNIX
PeerAddress to_peer_address(const sockaddr* addr, socklen_t len);

// ============================================================================
// Handler - per-connection protocol object
// ============================================================================
//
// Protocols derive from Handler and implement handle(). The server creates
// one instance per accepted socket, registers it with the event loop and
// then calls exactly one of handle(), handle_max_cons() or
// handle_max_cons_per_ip(). After that the loop owns the instance.
//
// close() runs its teardown once: unregister from the loop, close the
// transport, release the peer address held in the server's address map.

class Handler : public Channel, public std::enable_shared_from_this<Handler> {
 public:
  static constexpr size_t kReadChunkSize = 4096;
  static constexpr int kMaxReadsPerEvent = 16;

  Handler(sockpp::tcp_socket&& sock, Server& server, EventLoop& loop);
  ~Handler() override;

  Handler(const Handler&) = delete;
  Handler& operator=(const Handler&) = delete;

  // False when the peer vanished before construction finished
  bool connected() const { return connected_; }

  // --- Dispatch entry points ---

  // Protocol start, called once after admission. May throw; the server
  // routes the exception to handle_error().
  virtual void handle() = 0;

  // Global connection limit reached: reply and close once drained
  virtual void handle_max_cons();

  // Per-address limit reached: reply and close once drained
  virtual void handle_max_cons_per_ip();

  // --- Channel ---

  int fd() const override;
  bool readable() const override;
  bool writable() const override;
  void handle_read_event() override;
  void handle_write_event() override;
  void handle_close_event() override;
  void handle_error() override;
  void close() override;

  // --- Output ---

  // Queue data and try to send it right away
  void push(std::string_view data);
  // Close after the output queue drains
  void close_when_done();

  bool is_closed() const { return closed_; }
  bool closing() const { return closing_; }

  // --- Bookkeeping ---

  uint64_t id() const { return id_; }
  const PeerAddress& peer() const { return peer_; }

  // The server recorded host in its address map; close() releases it
  void bind_address(const std::string& host);
  bool owns_address() const { return owns_address_; }

 protected:
  Server& server() { return server_; }
  EventLoop& loop() { return loop_; }
  const Logger& logger() const;

  // Called with every chunk read from the transport
  virtual void on_data(std::string_view /* data */) {}
  // Called once from close(), after the transport is closed
  virtual void on_close() {}

  virtual std::string max_cons_reply() const {
    return "421 Too many connections. Service temporarily unavailable.\r\n";
  }
  virtual std::string max_cons_per_ip_reply() const {
    return "421 Too many connections from the same IP address.\r\n";
  }

 private:
  void flush();
  void advance_handshake();

  uint64_t id_;
  Server& server_;
  EventLoop& loop_;
  std::unique_ptr<Transport> transport_;
  PeerAddress peer_;
  std::string tx_buffer_;

  bool connected_ = false;
  bool closing_ = false;
  bool closed_ = false;
  bool owns_address_ = false;
  std::string address_;
};

}  // namespace srvfront

#endif  // SRVFRONT_HANDLER_HPP_
