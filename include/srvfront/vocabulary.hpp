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
 * @file vocabulary.hpp
 * @brief Vocabulary types for srvfront: ErrorCode, expected, FixedFunction,
 *        ScopeGuard, and the exception types thrown at start-up.
 *
 * expected<> carries run-time results (event loop passes, worker pool
 * supervision). Exceptions are reserved for failures that must abort
 * start-up: BindError and ConfigError.
 */

#ifndef SRVFRONT_VOCABULARY_HPP_
#define SRVFRONT_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

// Assertion macro (no-op in release)
#ifndef SRVFRONT_ASSERT
#define SRVFRONT_ASSERT(cond) ((void)(cond))
#endif

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define SRVFRONT_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define SRVFRONT_THROW(ex)        \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

namespace srvfront {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kSocketError = 1,
  kInterrupted = 2,
  kForkFailed = 3,
  kTooManyRestarts = 4,
  kTlsError = 6,
  kWouldBlock = 7,
  kConnectionClosed = 8,
  kInternalError = 255
};

inline const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kSocketError:
      return "socket error";
    case ErrorCode::kInterrupted:
      return "interrupted";
    case ErrorCode::kForkFailed:
      return "fork failed";
    case ErrorCode::kTooManyRestarts:
      return "too many child restarts";
    case ErrorCode::kTlsError:
      return "tls error";
    case ErrorCode::kWouldBlock:
      return "would block";
    case ErrorCode::kConnectionClosed:
      return "connection closed";
    case ErrorCode::kInternalError:
      return "internal error";
  }
  return "unknown";
}

/**
 * @brief Listening socket could not be resolved, bound or put in listen mode.
 *
 * Thrown from the Server constructors. Not retried.
 */
class BindError : public std::runtime_error {
 public:
  explicit BindError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Invalid combination of server or serve options.
 *
 * Thrown before any socket I/O takes place.
 */
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Use static factory methods success() and error() to construct.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(val);
    return e;
  }

  static expected success(V&& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) noexcept : storage_{}, err_(other.err_),
                                             has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    }
  }

  expected& operator=(const expected& other) noexcept {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(other.value());
      }
    }
    return *this;
  }

  expected(expected&& other) noexcept : storage_{}, err_(other.err_),
                                        has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.value()));
    }
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(static_cast<V&&>(other.value()));
      }
    }
    return *this;
  }

  ~expected() {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
    }
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    SRVFRONT_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    SRVFRONT_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  E get_error() const noexcept {
    SRVFRONT_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& default_val) const noexcept {
    return has_value_ ? value() : default_val;
  }

 private:
  expected() noexcept : storage_{}, err_{}, has_value_(false) {}

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_{};
  E err_{};
  bool has_value_{false};
};

/**
 * @brief Void specialization - represents success or error with no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    SRVFRONT_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  E err_{};
  bool has_value_{false};
};

// ============================================================================
// FixedFunction<Sig, BufferSize> - SBO callback
// ============================================================================

template <typename Signature, size_t BufferSize = 4 * sizeof(void*)>
class FixedFunction;

/**
 * @brief Fixed-size callable wrapper with small buffer optimization.
 */
template <typename Ret, typename... Args, size_t BufferSize>
class FixedFunction<Ret(Args...), BufferSize> final {
 public:
  FixedFunction() noexcept = default;

  // NOLINTNEXTLINE(google-explicit-constructor)
  FixedFunction(std::nullptr_t) noexcept {}

  template <typename F, typename = typename std::enable_if<
                            !std::is_same<typename std::decay<F>::type,
                                          FixedFunction>::value&&
                                !std::is_same<typename std::decay<F>::type,
                                              std::nullptr_t>::value>::type>
  FixedFunction(F&& f) noexcept {  // NOLINT
    using Decay = typename std::decay<F>::type;
    static_assert(sizeof(Decay) <= BufferSize,
                  "Callable too large for FixedFunction buffer");
    static_assert(alignof(Decay) <= alignof(Storage),
                  "Callable alignment exceeds buffer alignment");
    ::new (&storage_) Decay(static_cast<F&&>(f));
    invoker_ = [](const Storage& s, Args... args) -> Ret {
      return (*reinterpret_cast<const Decay*>(&s))(
          static_cast<Args&&>(args)...);
    };
    destroyer_ = [](Storage& s) {
      reinterpret_cast<Decay*>(&s)->~Decay();
    };
  }

  FixedFunction(FixedFunction&& other) noexcept
      : invoker_(other.invoker_), destroyer_(other.destroyer_) {
    if (other.invoker_) {
      std::memcpy(&storage_, &other.storage_, BufferSize);
      other.invoker_ = nullptr;
      other.destroyer_ = nullptr;
    }
  }

  FixedFunction& operator=(FixedFunction&& other) noexcept {
    if (this != &other) {
      if (destroyer_) {
        destroyer_(storage_);
      }
      invoker_ = other.invoker_;
      destroyer_ = other.destroyer_;
      if (other.invoker_) {
        std::memcpy(&storage_, &other.storage_, BufferSize);
        other.invoker_ = nullptr;
        other.destroyer_ = nullptr;
      }
    }
    return *this;
  }

  ~FixedFunction() {
    if (destroyer_) {
      destroyer_(storage_);
    }
  }

  FixedFunction(const FixedFunction&) = delete;
  FixedFunction& operator=(const FixedFunction&) = delete;

  Ret operator()(Args... args) const {
    SRVFRONT_ASSERT(invoker_);
    return invoker_(storage_, static_cast<Args&&>(args)...);
  }

  explicit operator bool() const noexcept { return invoker_ != nullptr; }

 private:
  using Storage = typename std::aligned_storage<BufferSize, alignof(void*)>::type;
  using Invoker = Ret (*)(const Storage&, Args...);
  using Destroyer = void (*)(Storage&);

  Storage storage_{};
  Invoker invoker_ = nullptr;
  Destroyer destroyer_ = nullptr;
};

// ============================================================================
// ScopeGuard - RAII cleanup guard
// ============================================================================

/**
 * @brief Executes a cleanup callback on scope exit unless released.
 */
class ScopeGuard final {
 public:
  explicit ScopeGuard(FixedFunction<void()> cleanup) noexcept
      : cleanup_(static_cast<FixedFunction<void()>&&>(cleanup)) {}

  ~ScopeGuard() {
    if (active_ && cleanup_) {
      cleanup_();
    }
  }

  void release() noexcept { active_ = false; }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

  ScopeGuard(ScopeGuard&& other) noexcept
      : cleanup_(static_cast<FixedFunction<void()>&&>(other.cleanup_)),
        active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard& operator=(ScopeGuard&&) = delete;

 private:
  FixedFunction<void()> cleanup_;
  bool active_{true};
};

}  // namespace srvfront

#endif  // SRVFRONT_VOCABULARY_HPP_
