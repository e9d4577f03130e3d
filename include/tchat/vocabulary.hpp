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
 * @brief Vocabulary types for TCHAT: ErrorCode, expected, optional,
 *        function_ref, FixedFunction, ScopeGuard.
 */

#ifndef TCHAT_VOCABULARY_HPP_
#define TCHAT_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

#ifndef TCHAT_ASSERT
#define TCHAT_ASSERT(cond) ((void)(cond))
#endif

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define TCHAT_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define TCHAT_THROW(ex)           \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

namespace tchat {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kConnectionClosed = 1,  // Peer closed the stream (clean or mid-frame)
  kMalformedHeader = 2,   // Length prefix cannot describe a valid frame
  kFrameTooLarge = 3,     // Declared length exceeds the configured maximum
  kSocketError = 4,       // Reset, broken pipe, timeout or other OS failure
  kUsernameTaken = 5,
  kInvalidUsername = 6,
  kInvalidState = 7,
  kInvalidArgument = 8,
  kInternalError = 255
};

inline const char* error_message(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kConnectionClosed:
      return "connection closed";
    case ErrorCode::kMalformedHeader:
      return "malformed frame header";
    case ErrorCode::kFrameTooLarge:
      return "frame too large";
    case ErrorCode::kSocketError:
      return "socket error";
    case ErrorCode::kUsernameTaken:
      return "username taken";
    case ErrorCode::kInvalidUsername:
      return "invalid username";
    case ErrorCode::kInvalidState:
      return "invalid state";
    case ErrorCode::kInvalidArgument:
      return "invalid argument";
    case ErrorCode::kInternalError:
      break;
  }
  return "internal error";
}

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
  static expected success(const V& val) {
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

  expected(const expected& other) : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(other.value());
      }
    }
    return *this;
  }

  expected(expected&& other) noexcept : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.value()));
    }
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(static_cast<V&&>(other.value()));
      }
    }
    return *this;
  }

  ~expected() { destroy(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    TCHAT_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    TCHAT_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  E get_error() const noexcept {
    TCHAT_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& default_val) const { return has_value_ ? value() : default_val; }

 private:
  expected() noexcept : storage_{}, err_{}, has_value_(false) {}

  void destroy() noexcept {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
      has_value_ = false;
    }
  }

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
    TCHAT_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  E err_{};
  bool has_value_{false};
};

// ============================================================================
// optional<T> - Lightweight nullable value
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& val) : has_value_(true) {  // NOLINT
    ::new (&storage_) T(val);
  }

  optional(T&& val) noexcept : has_value_(true) {  // NOLINT
    ::new (&storage_) T(static_cast<T&&>(val));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(other.value());
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) T(other.value());
      }
    }
    return *this;
  }

  optional(optional&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(static_cast<T&&>(other.value()));
    }
  }

  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) T(static_cast<T&&>(other.value()));
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    TCHAT_ASSERT(has_value_);
    return *reinterpret_cast<T*>(&storage_);
  }

  const T& value() const noexcept {
    TCHAT_ASSERT(has_value_);
    return *reinterpret_cast<const T*>(&storage_);
  }

  T value_or(const T& default_val) const { return has_value_ ? value() : default_val; }

  void reset() noexcept {
    if (has_value_) {
      reinterpret_cast<T*>(&storage_)->~T();
      has_value_ = false;
    }
  }

 private:
  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

// ============================================================================
// FixedFunction<Sig, BufferSize> - SBO callback
// ============================================================================

template <typename Signature, size_t BufferSize = 2 * sizeof(void*)>
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
                            !std::is_same<typename std::decay<F>::type, FixedFunction>::value &&
                            !std::is_same<typename std::decay<F>::type, std::nullptr_t>::value>::type>
  FixedFunction(F&& f) noexcept {  // NOLINT
    using Decay = typename std::decay<F>::type;
    static_assert(sizeof(Decay) <= BufferSize, "Callable too large for FixedFunction buffer");
    static_assert(alignof(Decay) <= alignof(Storage), "Callable alignment exceeds buffer alignment");
    ::new (&storage_) Decay(static_cast<F&&>(f));
    invoker_ = [](const Storage& s, Args... args) -> Ret {
      return (*reinterpret_cast<const Decay*>(&s))(static_cast<Args&&>(args)...);
    };
    destroyer_ = [](Storage& s) { reinterpret_cast<Decay*>(&s)->~Decay(); };
  }

  FixedFunction(FixedFunction&& other) noexcept : invoker_(other.invoker_), destroyer_(other.destroyer_) {
    if (other.invoker_) {
      std::memcpy(&storage_, &other.storage_, BufferSize);
      other.invoker_ = nullptr;
      other.destroyer_ = nullptr;
    }
  }

  FixedFunction& operator=(FixedFunction&&) = delete;
  FixedFunction(const FixedFunction&) = delete;
  FixedFunction& operator=(const FixedFunction&) = delete;

  ~FixedFunction() {
    if (destroyer_) {
      destroyer_(storage_);
    }
  }

  Ret operator()(Args... args) const {
    TCHAT_ASSERT(invoker_);
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
// function_ref<Sig> - Non-owning callable reference
// ============================================================================

template <typename Sig>
class function_ref;

/**
 * @brief Non-owning lightweight callable reference (2 pointers).
 *
 * The referenced callable must outlive the function_ref.
 */
template <typename Ret, typename... Args>
class function_ref<Ret(Args...)> final {
 public:
  template <typename F,
            typename = typename std::enable_if<!std::is_same<typename std::decay<F>::type, function_ref>::value>::type>
  function_ref(F&& f) noexcept  // NOLINT
      : obj_(const_cast<void*>(static_cast<const void*>(&f))),
        invoker_([](void* o, Args... args) -> Ret {
          return (*static_cast<typename std::remove_reference<F>::type*>(o))(static_cast<Args&&>(args)...);
        }) {}

  Ret operator()(Args... args) const { return invoker_(obj_, static_cast<Args&&>(args)...); }

 private:
  void* obj_;
  Ret (*invoker_)(void*, Args...);
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
  ScopeGuard(ScopeGuard&&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

 private:
  FixedFunction<void()> cleanup_;
  bool active_{true};
};

}  // namespace tchat

#endif  // TCHAT_VOCABULARY_HPP_
