#include "srvfront/event_loop.hpp"
#include "srvfront/signals.hpp"

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace srvfront;

// ============================================================================
// Test channel over one end of a socketpair
// ============================================================================

namespace {

class FakeChannel : public Channel {
 public:
  explicit FakeChannel(EventLoop& loop) : loop_(loop) {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0) {
      fd_ = fds[0];
      peer_fd_ = fds[1];
    }
  }

  ~FakeChannel() override {
    if (fd_ >= 0) ::close(fd_);
    close_peer();
  }

  int fd() const override { return fd_; }
  bool readable() const override { return want_read; }

  void handle_read_event() override {
    ++reads;
    char buf[64];
    ssize_t n = ::recv(fd_, buf, sizeof(buf), MSG_DONTWAIT);
    (void)n;
    if (throw_on_read) {
      throw std::runtime_error("protocol bug");
    }
    if (throw_int_on_read) {
      throw 42;
    }
    if (close_loop_on_read) {
      loop_.close();
    }
  }
  void handle_write_event() override { ++writes; }
  void handle_close_event() override {
    ++close_events;
    close();
  }
  void handle_error() override {
    ++errors;
    close();
  }
  void close() override {
    ++closes;
    loop_.remove(*this);
  }

  void close_peer() {
    if (peer_fd_ >= 0) {
      ::close(peer_fd_);
      peer_fd_ = -1;
    }
  }

  int peer_fd() const { return peer_fd_; }

  bool want_read = true;
  bool throw_on_read = false;
  bool throw_int_on_read = false;
  bool close_loop_on_read = false;
  int reads = 0;
  int writes = 0;
  int close_events = 0;
  int errors = 0;
  int closes = 0;

 private:
  EventLoop& loop_;
  int fd_ = -1;
  int peer_fd_ = -1;
};

struct InterruptReset {
  InterruptReset() { clear_interrupt(); }
  ~InterruptReset() { clear_interrupt(); }
};

}  // namespace

// ============================================================================
// Registry
// ============================================================================

TEST_CASE("PollLoop - add, contains, remove", "[event_loop]") {
  PollLoop loop;
  auto a = std::make_shared<FakeChannel>(loop);
  auto b = std::make_shared<FakeChannel>(loop);

  REQUIRE(loop.channel_count() == 0);
  loop.add(a);
  loop.add(b);
  REQUIRE(loop.channel_count() == 2);
  REQUIRE(loop.contains(*a));

  loop.remove(*a);
  REQUIRE_FALSE(loop.contains(*a));
  REQUIRE(loop.channel_count() == 1);
  REQUIRE(std::string(loop.name()) == "poll");
}

TEST_CASE("PollLoop - close closes every channel exactly once", "[event_loop]") {
  PollLoop loop;
  std::vector<std::shared_ptr<FakeChannel>> channels;
  for (int i = 0; i < 5; ++i) {
    channels.push_back(std::make_shared<FakeChannel>(loop));
    loop.add(channels.back());
  }

  loop.close();
  REQUIRE(loop.channel_count() == 0);
  for (auto& ch : channels) {
    REQUIRE(ch->closes == 1);
  }

  // Idempotent
  loop.close();
  for (auto& ch : channels) {
    REQUIRE(ch->closes == 1);
  }
}

TEST_CASE("PollLoop - listener is not a registry entry", "[event_loop]") {
  PollLoop loop;
  int fds[2];
  REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

  int ready = 0;
  loop.watch_listener(fds[0], [&ready]() { ++ready; });
  REQUIRE(loop.channel_count() == 0);

  REQUIRE(::write(fds[1], "x", 1) == 1);
  REQUIRE(loop.loop(100, false).has_value());
  REQUIRE(ready == 1);

  loop.unwatch_listener();
  REQUIRE(loop.loop(0, false).has_value());
  REQUIRE(ready == 1);

  ::close(fds[0]);
  ::close(fds[1]);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_CASE("PollLoop - non-blocking pass with nothing ready", "[event_loop]") {
  InterruptReset reset;
  PollLoop loop;
  auto ch = std::make_shared<FakeChannel>(loop);
  loop.add(ch);

  auto result = loop.loop(0, false);
  REQUIRE(result.has_value());
  REQUIRE(ch->reads == 0);
}

TEST_CASE("PollLoop - readable channel is dispatched", "[event_loop]") {
  InterruptReset reset;
  PollLoop loop;
  auto ch = std::make_shared<FakeChannel>(loop);
  loop.add(ch);

  REQUIRE(::write(ch->peer_fd(), "hello", 5) == 5);
  REQUIRE(loop.loop(100, false).has_value());
  REQUIRE(ch->reads == 1);
  REQUIRE(ch->errors == 0);
}

TEST_CASE("PollLoop - callback exception routes to handle_error", "[event_loop]") {
  InterruptReset reset;
  PollLoop loop;
  auto faulty = std::make_shared<FakeChannel>(loop);
  auto healthy = std::make_shared<FakeChannel>(loop);
  faulty->throw_on_read = true;
  loop.add(faulty);
  loop.add(healthy);

  REQUIRE(::write(faulty->peer_fd(), "a", 1) == 1);
  REQUIRE(::write(healthy->peer_fd(), "b", 1) == 1);
  REQUIRE(loop.loop(100, false).has_value());

  REQUIRE(faulty->errors == 1);
  REQUIRE(faulty->closes == 1);
  REQUIRE_FALSE(loop.contains(*faulty));
  REQUIRE(healthy->reads == 1);
  REQUIRE(loop.contains(*healthy));
}

TEST_CASE("PollLoop - non-standard exception routes to handle_error", "[event_loop]") {
  InterruptReset reset;
  PollLoop loop;
  auto faulty = std::make_shared<FakeChannel>(loop);
  faulty->throw_int_on_read = true;
  loop.add(faulty);

  REQUIRE(::write(faulty->peer_fd(), "a", 1) == 1);
  expected<void, ErrorCode> result = expected<void, ErrorCode>::success();
  REQUIRE_NOTHROW(result = loop.loop(100, false));

  REQUIRE(result.has_value());
  REQUIRE(faulty->errors == 1);
  REQUIRE_FALSE(loop.contains(*faulty));
}

TEST_CASE("PollLoop - close from a callback with several channels ready", "[event_loop]") {
  InterruptReset reset;
  PollLoop loop;
  std::vector<std::shared_ptr<FakeChannel>> channels;
  for (int i = 0; i < 4; ++i) {
    channels.push_back(std::make_shared<FakeChannel>(loop));
    channels.back()->close_loop_on_read = true;
    loop.add(channels.back());
    REQUIRE(::write(channels.back()->peer_fd(), "x", 1) == 1);
  }

  REQUIRE(loop.loop(100, false).has_value());

  int reads = 0;
  for (auto& ch : channels) {
    reads += ch->reads;
    REQUIRE(ch->closes == 1);
  }
  REQUIRE(reads == 1);
  REQUIRE(loop.channel_count() == 0);
}

TEST_CASE("PollLoop - hangup without read interest closes", "[event_loop]") {
  InterruptReset reset;
  PollLoop loop;
  auto ch = std::make_shared<FakeChannel>(loop);
  ch->want_read = false;
  loop.add(ch);

  ch->close_peer();
  REQUIRE(loop.loop(100, false).has_value());
  REQUIRE(ch->close_events == 1);
  REQUIRE(loop.channel_count() == 0);
}

// ============================================================================
// Termination
// ============================================================================

TEST_CASE("PollLoop - pending interrupt is reported", "[event_loop]") {
  InterruptReset reset;
  PollLoop loop;

  raise_interrupt();
  auto result = loop.loop(1000, true);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kInterrupted);
}

TEST_CASE("PollLoop - stop before loop returns at once", "[event_loop]") {
  InterruptReset reset;
  PollLoop loop;

  loop.stop();
  auto result = loop.loop(1000, true);
  REQUIRE(result.has_value());

  // The request was consumed
  REQUIRE_FALSE(loop.stop_requested());
}

TEST_CASE("PollLoop - stop from another thread", "[event_loop]") {
  InterruptReset reset;
  PollLoop loop;
  std::atomic<bool> done{false};
  bool ok = false;

  std::thread runner([&]() {
    ok = loop.loop(20, true).has_value();
    done = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  CHECK_FALSE(done.load());
  loop.stop();
  runner.join();
  REQUIRE(done.load());
  REQUIRE(ok);
}

TEST_CASE("PollLoop - poll latency is recorded", "[event_loop]") {
  InterruptReset reset;
  PollLoop loop;
  REQUIRE(loop.loop(20, false).has_value());
  REQUIRE(loop.max_poll_latency_us() >= loop.last_poll_latency_us());
  REQUIRE(loop.max_poll_latency_us() > 0);
}
