#include "srvfront/event_loop.hpp"

#include "srvfront/signals.hpp"

#include <cerrno>
#include <cstring>

#include <chrono>

namespace srvfront {

PollLoop::~PollLoop() {
  close();
}

void PollLoop::add(std::shared_ptr<Channel> channel) {
  const Channel* key = channel.get();
  channels_[key] = std::move(channel);
}

void PollLoop::remove(const Channel& channel) {
  channels_.erase(&channel);
}

bool PollLoop::contains(const Channel& channel) const {
  return channels_.find(&channel) != channels_.end();
}

void PollLoop::watch_listener(int fd, std::function<void()> on_ready) {
  listener_fd_ = fd;
  on_listener_ready_ = std::move(on_ready);
}

void PollLoop::unwatch_listener() {
  listener_fd_ = -1;
  on_listener_ready_ = nullptr;
}

expected<void, ErrorCode> PollLoop::loop(int timeout_ms, bool blocking) {
  do {
    if (interrupt_pending()) {
      return expected<void, ErrorCode>::error(ErrorCode::kInterrupted);
    }
    // Consumed here so a later loop() call runs again
    if (stop_requested_.exchange(false, std::memory_order_acq_rel)) {
      break;
    }
    auto result = poll_once(timeout_ms);
    if (!result.has_value()) {
      return result;
    }
  } while (blocking);

  // A signal may land during the last non-blocking pass
  if (interrupt_pending()) {
    return expected<void, ErrorCode>::error(ErrorCode::kInterrupted);
  }
  return expected<void, ErrorCode>::success();
}

void PollLoop::close() {
  // Snapshot first: every close() removes its channel from the map
  std::vector<ChannelPtr> snapshot;
  snapshot.reserve(channels_.size());
  for (auto& entry : channels_) {
    snapshot.push_back(entry.second);
  }

  for (auto& channel : snapshot) {
    if (!contains(*channel)) {
      continue;
    }
    try {
      channel->close();
    } catch (const std::exception& e) {
      SRVFRONT_LOG_ERROR(logger_, "error closing channel fd=" << channel->fd() << ": " << e.what());
    } catch (...) {
      SRVFRONT_LOG_ERROR(logger_, "error closing channel fd=" << channel->fd() << ": unknown exception");
    }
    channels_.erase(channel.get());
  }

  // poll_targets_ is left alone: close() may run from a callback while
  // poll_once() is still walking it
  channels_.clear();
}

expected<void, ErrorCode> PollLoop::poll_once(int timeout_ms) {
  poll_fds_.clear();
  poll_targets_.clear();

  const bool has_listener = listener_fd_ >= 0;
  if (has_listener) {
    poll_fds_.push_back({listener_fd_, POLLIN, 0});
  }

  for (auto& entry : channels_) {
    const ChannelPtr& channel = entry.second;
    short events = 0;
    if (channel->readable()) {
      events |= POLLIN;
    }
    if (channel->writable()) {
      events |= POLLOUT;
    }
    poll_fds_.push_back({channel->fd(), events, 0});
    poll_targets_.push_back(channel);
  }

  auto poll_start = std::chrono::steady_clock::now();
  int ret = ::poll(poll_fds_.data(), static_cast<nfds_t>(poll_fds_.size()), timeout_ms);
  auto poll_end = std::chrono::steady_clock::now();
  record_latency(static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(poll_end - poll_start).count()));

  if (ret < 0) {
    int err = errno;
    if (err == EINTR) {
      return expected<void, ErrorCode>::success();
    }
    SRVFRONT_LOG_ERROR(logger_, "poll() failed: " << strerror(err));
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }

  if (ret == 0) {
    return expected<void, ErrorCode>::success();
  }

  size_t first = 0;
  if (has_listener) {
    first = 1;
    if ((poll_fds_[0].revents & POLLIN) && on_listener_ready_) {
      // A copy, since the callback may unwatch the listener
      auto on_ready = on_listener_ready_;
      try {
        on_ready();
      } catch (const std::exception& e) {
        SRVFRONT_LOG_ERROR(logger_, "error accepting connection: " << e.what());
      } catch (...) {
        SRVFRONT_LOG_ERROR(logger_, "error accepting connection: unknown exception");
      }
    }
  }

  for (size_t i = first; i < poll_fds_.size(); ++i) {
    short revents = poll_fds_[i].revents;
    if (revents == 0) {
      continue;
    }
    const ChannelPtr& channel = poll_targets_[i - first];
    // Closed by an earlier callback in this pass
    if (!contains(*channel)) {
      continue;
    }
    dispatch(channel, revents);
  }

  poll_targets_.clear();
  return expected<void, ErrorCode>::success();
}

void PollLoop::dispatch(const ChannelPtr& channel, short revents) {
  try {
    if (revents & (POLLIN | POLLPRI)) {
      channel->handle_read_event();
    }
    if ((revents & POLLOUT) && contains(*channel)) {
      channel->handle_write_event();
    }
    bool hangup = (revents & (POLLERR | POLLNVAL)) || ((revents & POLLHUP) && !(revents & POLLIN));
    if (hangup && contains(*channel)) {
      channel->handle_close_event();
    }
  } catch (const std::exception& e) {
    SRVFRONT_LOG_ERROR(logger_, "uncaught error on fd=" << channel->fd() << ": " << e.what());
    channel->handle_error();
  } catch (...) {
    SRVFRONT_LOG_ERROR(logger_, "uncaught error on fd=" << channel->fd() << ": unknown exception");
    channel->handle_error();
  }
}

void PollLoop::record_latency(uint64_t poll_us) {
  last_poll_latency_us_.store(poll_us, std::memory_order_relaxed);
  uint64_t prev_max = max_poll_latency_us_.load(std::memory_order_relaxed);
  if (poll_us > prev_max) {
    max_poll_latency_us_.store(poll_us, std::memory_order_relaxed);
  }
}

}  // namespace srvfront
