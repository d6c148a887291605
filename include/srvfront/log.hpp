/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file log.hpp
 * @brief Logging handle for srvfront.
 *
 * A Logger is a small copyable handle onto a LogSink. The server receives
 * one at construction; the default handle discards everything. Provides
 * SRVFRONT_LOG_DEBUG, SRVFRONT_LOG_INFO, SRVFRONT_LOG_WARN and
 * SRVFRONT_LOG_ERROR macros that skip message formatting below the
 * configured level.
 */

#ifndef SRVFRONT_LOG_HPP_
#define SRVFRONT_LOG_HPP_

#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unistd.h>

namespace srvfront {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

inline const char* level_prefix(LogLevel level) {
  const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
  return prefix[static_cast<int>(level)];
}

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
 public:
  virtual ~LogSink() = default;
  virtual void write(LogLevel level, std::string_view msg) = 0;
};

class NullSink final : public LogSink {
 public:
  void write(LogLevel /* level */, std::string_view /* msg */) override {}
};

/**
 * @brief Writes "[INFO] 2026-01-01 12:00:00 msg" lines to stderr.
 *
 * With with_pid set the pid is added after the timestamp, which keeps the
 * interleaved output of pre-forked workers readable.
 */
class StderrSink final : public LogSink {
 public:
  explicit StderrSink(bool with_pid = false) : with_pid_(with_pid) {}

  void write(LogLevel level, std::string_view msg) override {
    char stamp[32];
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << level_prefix(level) << " " << stamp;
    if (with_pid_) {
      std::cerr << " " << ::getpid();
    }
    std::cerr << " " << msg << std::endl;
  }

 private:
  bool with_pid_;
  std::mutex mutex_;
};

// ============================================================================
// Logger handle
// ============================================================================

class Logger {
 public:
  Logger() : sink_(&null_sink()) {}

  explicit Logger(LogSink& sink, LogLevel min_level = LogLevel::kInfo)
      : sink_(&sink), min_level_(min_level) {}

  bool enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void log(LogLevel level, std::string_view msg) const {
    if (enabled(level)) {
      sink_->write(level, msg);
    }
  }

  LogLevel min_level() const { return min_level_; }

 private:
  static NullSink& null_sink() {
    static NullSink sink;
    return sink;
  }

  LogSink* sink_;
  LogLevel min_level_ = LogLevel::kInfo;
};

#define SRVFRONT_LOG(logger, level, expr)          \
  do {                                              \
    if ((logger).enabled(level)) {                  \
      std::ostringstream srvfront_log_oss_;         \
      srvfront_log_oss_ << expr;                    \
      (logger).log(level, srvfront_log_oss_.str()); \
    }                                               \
  } while (0)

#define SRVFRONT_LOG_DEBUG(logger, expr) SRVFRONT_LOG(logger, ::srvfront::LogLevel::kDebug, expr)
#define SRVFRONT_LOG_INFO(logger, expr) SRVFRONT_LOG(logger, ::srvfront::LogLevel::kInfo, expr)
#define SRVFRONT_LOG_WARN(logger, expr) SRVFRONT_LOG(logger, ::srvfront::LogLevel::kWarn, expr)
#define SRVFRONT_LOG_ERROR(logger, expr) SRVFRONT_LOG(logger, ::srvfront::LogLevel::kError, expr)

}  // namespace srvfront

#endif  // SRVFRONT_LOG_HPP_
