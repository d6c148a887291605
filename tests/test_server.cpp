#include "srvfront/server.hpp"
#include "srvfront/signals.hpp"

#include <arpa/inet.h>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

using namespace srvfront;

namespace {

class NullHandler : public Handler {
 public:
  using Handler::Handler;
  void handle() override {}
};

int bound_loopback_socket() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    ::close(fd);
    return -1;
  }
  return fd;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("Server - binds an ephemeral port", "[server]") {
  PollLoop loop;
  Server server("127.0.0.1", 0, handler_type<NullHandler>("NullHandler"), loop);

  REQUIRE(server.state() == Server::State::kBound);
  REQUIRE(server.address().host == "127.0.0.1");
  REQUIRE(server.address().port != 0);
  REQUIRE(server.backlog() == 100);
  REQUIRE(server.max_cons() == 512);
  REQUIRE(server.max_cons_per_ip() == 0);
  REQUIRE(server.connection_count() == 0);
  REQUIRE(server.tls_context() == nullptr);
}

TEST_CASE("Server - port in use throws BindError", "[server]") {
  PollLoop loop;
  Server first("127.0.0.1", 0, handler_type<NullHandler>("NullHandler"), loop);

  PollLoop other_loop;
  REQUIRE_THROWS_AS(
      Server("127.0.0.1", first.address().port, handler_type<NullHandler>("NullHandler"), other_loop),
      BindError);
}

TEST_CASE("Server - unresolvable host throws BindError", "[server]") {
  PollLoop loop;
  REQUIRE_THROWS_AS(Server("no-such-host.invalid", 0, handler_type<NullHandler>("NullHandler"), loop), BindError);
}

TEST_CASE("Server - missing handler factory throws ConfigError", "[server]") {
  PollLoop loop;
  REQUIRE_THROWS_AS(Server("127.0.0.1", 0, HandlerType{"none", nullptr}, loop), ConfigError);
}

TEST_CASE("Server - adopts a pre-bound socket", "[server]") {
  int fd = bound_loopback_socket();
  REQUIRE(fd >= 0);

  PollLoop loop;
  ServerOptions options;
  options.backlog = 8;
  Server server(fd, handler_type<NullHandler>("NullHandler"), loop, options);

  REQUIRE(server.state() == Server::State::kBound);
  REQUIRE(server.address().host == "127.0.0.1");
  REQUIRE(server.address().port != 0);
  REQUIRE(server.backlog() == 8);
}

TEST_CASE("Server - invalid descriptor throws BindError", "[server]") {
  PollLoop loop;
  REQUIRE_THROWS_AS(Server(-1, handler_type<NullHandler>("NullHandler"), loop), BindError);
}

TEST_CASE("Server - TLS with a missing certificate fails at construction", "[server]") {
  PollLoop loop;
  ServerOptions options;
  options.tls.cert_path = "/nonexistent/server.crt";
  options.tls.key_path = "/nonexistent/server.key";

  REQUIRE_THROWS_AS(Server("127.0.0.1", 0, handler_type<NullHandler>("NullHandler"), loop, options), ConfigError);
}

// ============================================================================
// Configuration
// ============================================================================

TEST_CASE("Server - setter chaining", "[server]") {
  PollLoop loop;
  Server server("127.0.0.1", 0, handler_type<NullHandler>("NullHandler"), loop);

  TcpTuning tuning;
  tuning.tcp_nodelay = true;
  server.set_max_cons(10).set_max_cons_per_ip(2).set_tcp_tuning(tuning);

  REQUIRE(server.max_cons() == 10);
  REQUIRE(server.max_cons_per_ip() == 2);
}

TEST_CASE("Server - prefork with non-blocking serve throws ConfigError", "[server]") {
  PollLoop loop;
  Server server("127.0.0.1", 0, handler_type<NullHandler>("NullHandler"), loop);

  ServeOptions options;
  options.worker_processes = 2;
  options.blocking = false;

  REQUIRE_THROWS_AS(server.serve(options), ConfigError);
  // Nothing happened to the listener
  REQUIRE(server.state() == Server::State::kBound);
}

TEST_CASE("Server - ServeOptions selects the concurrency model", "[server]") {
  ServeOptions options;
  REQUIRE(options.model() == ConcurrencyModel::kInline);
  options.worker_processes = 4;
  REQUIRE(options.model() == ConcurrencyModel::kPreFork);
  options.worker_processes = 0;
  REQUIRE(options.model() == ConcurrencyModel::kPreFork);
  REQUIRE(std::string(to_string(ConcurrencyModel::kPreFork)) == "prefork + async");
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("Server - non-blocking serve keeps the server open", "[server]") {
  clear_interrupt();
  PollLoop loop;
  Server server("127.0.0.1", 0, handler_type<NullHandler>("NullHandler"), loop);

  ServeOptions options;
  options.blocking = false;
  options.timeout_ms = 0;

  REQUIRE(server.serve(options).has_value());
  REQUIRE(server.state() == Server::State::kServing);
  REQUIRE(server.serve(options).has_value());
  REQUIRE(server.state() == Server::State::kServing);

  server.close_all();
  REQUIRE(server.state() == Server::State::kClosed);
}

TEST_CASE("Server - shutdown before a blocking serve closes everything", "[server]") {
  clear_interrupt();
  PollLoop loop;
  Server server("127.0.0.1", 0, handler_type<NullHandler>("NullHandler"), loop);

  server.shutdown();
  ServeOptions options;
  options.timeout_ms = 10;
  REQUIRE(server.serve(options).has_value());
  REQUIRE(server.state() == Server::State::kClosed);
}

TEST_CASE("Server - serve on a closed server throws ConfigError", "[server]") {
  PollLoop loop;
  Server server("127.0.0.1", 0, handler_type<NullHandler>("NullHandler"), loop);
  server.close_all();
  server.close_all();
  REQUIRE(server.state() == Server::State::kClosed);
  REQUIRE_THROWS_AS(server.serve(), ConfigError);
}

TEST_CASE("Server - interrupt with handle_interrupt shuts down", "[server]") {
  clear_interrupt();
  PollLoop loop;
  Server server("127.0.0.1", 0, handler_type<NullHandler>("NullHandler"), loop);

  raise_interrupt();
  ServeOptions options;
  options.timeout_ms = 10;
  REQUIRE(server.serve(options).has_value());
  REQUIRE(server.state() == Server::State::kClosed);
  REQUIRE_FALSE(interrupt_pending());
}

TEST_CASE("Server - interrupt without handle_interrupt is returned", "[server]") {
  clear_interrupt();
  PollLoop loop;
  Server server("127.0.0.1", 0, handler_type<NullHandler>("NullHandler"), loop);

  raise_interrupt();
  ServeOptions options;
  options.timeout_ms = 10;
  options.handle_interrupt = false;
  auto result = server.serve(options);

  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kInterrupted);
  REQUIRE(server.state() == Server::State::kServing);
  clear_interrupt();
}

TEST_CASE("Server - state names", "[server]") {
  REQUIRE(std::string(to_string(Server::State::kCreated)) == "created");
  REQUIRE(std::string(to_string(Server::State::kBound)) == "bound");
  REQUIRE(std::string(to_string(Server::State::kServing)) == "serving");
  REQUIRE(std::string(to_string(Server::State::kStopping)) == "stopping");
  REQUIRE(std::string(to_string(Server::State::kClosed)) == "closed");
}
