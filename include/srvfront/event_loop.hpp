#ifndef SRVFRONT_EVENT_LOOP_HPP_
#define SRVFRONT_EVENT_LOOP_HPP_

#include "log.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <functional>
#include <memory>
#include <poll.h>
#include <unordered_map>
#include <vector>

namespace srvfront {

// ============================================================================
// Channel - one socket registered with an event loop
// ============================================================================

class Channel {
 public:
  virtual ~Channel() = default;

  virtual int fd() const = 0;

  // Interest set for the next poll pass
  virtual bool readable() const { return true; }
  virtual bool writable() const { return false; }

  virtual void handle_read_event() = 0;
  virtual void handle_write_event() = 0;
  // POLLERR / POLLHUP without pending input
  virtual void handle_close_event() = 0;
  // A callback above threw; the channel decides how to recover
  virtual void handle_error() = 0;

  // Must remove the channel from its loop. Called at most once per channel
  // by EventLoop::close().
  virtual void close() = 0;
};

// ============================================================================
// EventLoop - channel registry plus readiness dispatch
// ============================================================================

class EventLoop {
 public:
  virtual ~EventLoop() = default;

  virtual void add(std::shared_ptr<Channel> channel) = 0;
  virtual void remove(const Channel& channel) = 0;
  virtual bool contains(const Channel& channel) const = 0;

  // Number of registered connection channels. The listener is not counted.
  virtual size_t channel_count() const = 0;

  // Watch a listening socket; on_ready runs when it becomes readable.
  virtual void watch_listener(int fd, std::function<void()> on_ready) = 0;
  virtual void unwatch_listener() = 0;

  // Blocking: dispatch until stop() or a pending interrupt.
  // Non-blocking: one poll pass, then return.
  // Returns error(kInterrupted) when an interrupt is observed.
  virtual expected<void, ErrorCode> loop(int timeout_ms, bool blocking) = 0;

  // Thread-safe. The running (or next) loop() returns at its next pass.
  virtual void stop() = 0;

  // Close every registered channel. Idempotent.
  virtual void close() = 0;

  virtual const char* name() const = 0;
};

// ============================================================================
// PollLoop - poll(2) reactor
// ============================================================================

class PollLoop final : public EventLoop {
 public:
  explicit PollLoop(Logger logger = Logger()) : logger_(logger) {}
  ~PollLoop() override;

  PollLoop(const PollLoop&) = delete;
  PollLoop& operator=(const PollLoop&) = delete;

  void add(std::shared_ptr<Channel> channel) override;
  void remove(const Channel& channel) override;
  bool contains(const Channel& channel) const override;
  size_t channel_count() const override { return channels_.size(); }

  void watch_listener(int fd, std::function<void()> on_ready) override;
  void unwatch_listener() override;

  expected<void, ErrorCode> loop(int timeout_ms, bool blocking) override;
  void stop() override { stop_requested_.store(true, std::memory_order_release); }
  void close() override;

  const char* name() const override { return "poll"; }

  bool stop_requested() const { return stop_requested_.load(std::memory_order_acquire); }

  uint64_t last_poll_latency_us() const { return last_poll_latency_us_.load(std::memory_order_relaxed); }
  uint64_t max_poll_latency_us() const { return max_poll_latency_us_.load(std::memory_order_relaxed); }

 private:
  using ChannelPtr = std::shared_ptr<Channel>;

  expected<void, ErrorCode> poll_once(int timeout_ms);
  void dispatch(const ChannelPtr& channel, short revents);
  void record_latency(uint64_t poll_us);

  Logger logger_;
  std::unordered_map<const Channel*, ChannelPtr> channels_;

  int listener_fd_ = -1;
  std::function<void()> on_listener_ready_;

  std::atomic<bool> stop_requested_{false};

  // Reused across passes
  std::vector<pollfd> poll_fds_;
  std::vector<ChannelPtr> poll_targets_;

  std::atomic<uint64_t> last_poll_latency_us_{0};
  std::atomic<uint64_t> max_poll_latency_us_{0};
};

}  // namespace srvfront

#endif  // SRVFRONT_EVENT_LOOP_HPP_
