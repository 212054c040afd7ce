/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
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
 * @brief Vocabulary types shared by every dlcore component.
 *
 * - expected<V, E>      : value-or-error return type (no exceptions)
 * - optional<T>         : nullable value (timestamps, config lookups)
 * - FixedString<N>      : bounded inline string for names and ids
 * - FixedVector<T, N>   : bounded inline vector (dependency lists)
 * - function_ref<Sig>   : non-owning callable reference (store mutators)
 * - NewType<T, Tag>     : strong typedef for identifiers
 *
 * Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef DLCORE_VOCABULARY_HPP_
#define DLCORE_VOCABULARY_HPP_

#include "dlcore/platform.hpp"

#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

namespace dlcore {

// ============================================================================
// Shared Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue
};

enum class TimerError : uint8_t {
  kInvalidPeriod = 0,
  kSlotsFull,
  kNotRunning,
  kAlreadyRunning
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through the static factories success() and error().
 * Accessing value() on an error (or get_error() on a value) is a
 * programming error and trips DLCORE_ASSERT in debug builds.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) { return expected(ValueTag{}, val); }
  static expected success(V&& val) {
    return expected(ValueTag{}, std::move(val));
  }
  static expected error(const E& err) { return expected(ErrorTag{}, err); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(other.value_);
    } else {
      ::new (static_cast<void*>(&error_)) E(other.error_);
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
    } else {
      ::new (static_cast<void*>(&error_)) E(std::move(other.error_));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(other.value_);
      } else {
        ::new (static_cast<void*>(&error_)) E(other.error_);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
      } else {
        ::new (static_cast<void*>(&error_)) E(std::move(other.error_));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    DLCORE_ASSERT(has_value_);
    return value_;
  }
  const V& value() const& {
    DLCORE_ASSERT(has_value_);
    return value_;
  }
  V&& value() && {
    DLCORE_ASSERT(has_value_);
    return std::move(value_);
  }

  const E& get_error() const {
    DLCORE_ASSERT(!has_value_);
    return error_;
  }

  template <typename U>
  V value_or(U&& default_val) const& {
    return has_value_ ? value_ : static_cast<V>(std::forward<U>(default_val));
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  template <typename... Args>
  explicit expected(ValueTag, Args&&... args) : has_value_(true) {
    ::new (static_cast<void*>(&value_)) V(std::forward<Args>(args)...);
  }

  explicit expected(ErrorTag, const E& err) : has_value_(false) {
    ::new (static_cast<void*>(&error_)) E(err);
  }

  void Destroy() noexcept {
    if (has_value_) {
      value_.~V();
    } else {
      error_.~E();
    }
  }

  union {
    V value_;
    E error_;
  };
  bool has_value_;
};

/**
 * @brief Specialization for operations that only report success or error.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(); }
  static expected error(const E& err) {
    expected r;
    r.error_ = err;
    r.has_value_ = false;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  void value() const { DLCORE_ASSERT(has_value_); }

  const E& get_error() const {
    DLCORE_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected() : error_(), has_value_(true) {}

  E error_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}
  optional(const T& val) : has_value_(true) {
    ::new (static_cast<void*>(&value_)) T(val);
  }
  optional(T&& val) : has_value_(true) {
    ::new (static_cast<void*>(&value_)) T(std::move(val));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) ::new (static_cast<void*>(&value_)) T(other.value_);
  }
  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&value_)) T(other.value_);
        has_value_ = true;
      }
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & {
    DLCORE_ASSERT(has_value_);
    return value_;
  }
  const T& value() const& {
    DLCORE_ASSERT(has_value_);
    return value_;
  }

  template <typename U>
  T value_or(U&& default_val) const {
    return has_value_ ? value_ : static_cast<T>(std::forward<U>(default_val));
  }

  T& operator*() { return value(); }
  const T& operator*() const { return value(); }
  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

  void reset() noexcept {
    if (has_value_) {
      value_.~T();
      has_value_ = false;
    }
  }

 private:
  union {
    T value_;
  };
  bool has_value_;
};

// ============================================================================
// FixedString<Capacity>
// ============================================================================

/// Tag selecting the truncating constructors of FixedString.
struct TruncateToCapacity_t {
  explicit TruncateToCapacity_t() = default;
};
constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Inline, null-terminated string with a compile-time capacity.
 *
 * Literals are checked against the capacity at compile time. Runtime strings
 * go through the TruncateToCapacity constructors and are cut silently.
 */
template <uint32_t Capacity>
class FixedString final {
 public:
  FixedString() noexcept : size_(0) { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&str)[N]) noexcept {
    static_assert(N > 0U, "string literal must be null-terminated");
    static_assert(N - 1U <= Capacity,
                  "string literal exceeds FixedString capacity");
    Copy(str, N - 1U);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const std::string& str) noexcept {
    Copy(str.c_str(), static_cast<uint32_t>(str.size()));
  }

  FixedString& assign(TruncateToCapacity_t, const char* str) noexcept {
    if (str == nullptr) {
      clear();
      return *this;
    }
    Copy(str, static_cast<uint32_t>(std::strlen(str)));
    return *this;
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  bool operator==(const FixedString& other) const noexcept {
    return size_ == other.size_ && std::memcmp(buf_, other.buf_, size_) == 0;
  }
  bool operator!=(const FixedString& other) const noexcept {
    return !(*this == other);
  }
  bool operator==(const char* str) const noexcept {
    return str != nullptr && std::strcmp(buf_, str) == 0;
  }
  bool operator!=(const char* str) const noexcept { return !(*this == str); }
  bool operator<(const FixedString& other) const noexcept {
    return std::strcmp(buf_, other.buf_) < 0;
  }

 private:
  void Copy(const char* str, uint32_t len) noexcept {
    // Stop at an embedded terminator so size() matches strlen(c_str()).
    uint32_t n = 0U;
    while (n < len && n < Capacity && str[n] != '\0') {
      buf_[n] = str[n];
      ++n;
    }
    buf_[n] = '\0';
    size_ = n;
  }

  char buf_[Capacity + 1U];
  uint32_t size_;
};

/// Human readable error or status text carried in results and snapshots.
using ErrorText = FixedString<128>;

// ============================================================================
// FixedVector<T, Capacity>
// ============================================================================

/**
 * @brief Inline vector with a compile-time capacity. push_back() and
 *        emplace_back() report overflow by returning false.
 */
template <typename T, uint32_t Capacity>
class FixedVector final {
 public:
  FixedVector() noexcept : size_(0U) {}

  FixedVector(std::initializer_list<T> init) : size_(0U) {
    for (const T& v : init) {
      if (!push_back(v)) break;
    }
  }

  FixedVector(const FixedVector& other) : size_(0U) {
    for (const T& v : other) push_back(v);
  }

  FixedVector& operator=(const FixedVector& other) {
    if (this != &other) {
      clear();
      for (const T& v : other) push_back(v);
    }
    return *this;
  }

  ~FixedVector() { clear(); }

  bool push_back(const T& val) {
    if (full()) return false;
    ::new (static_cast<void*>(Data() + size_)) T(val);
    ++size_;
    return true;
  }

  template <typename... Args>
  bool emplace_back(Args&&... args) {
    if (full()) return false;
    ::new (static_cast<void*>(Data() + size_)) T(std::forward<Args>(args)...);
    ++size_;
    return true;
  }

  void pop_back() noexcept {
    if (size_ == 0U) return;
    --size_;
    Data()[size_].~T();
  }

  /// Removes element @p index by moving the last element into its place.
  bool erase_unordered(uint32_t index) {
    if (index >= size_) return false;
    if (index != size_ - 1U) {
      Data()[index] = std::move(Data()[size_ - 1U]);
    }
    pop_back();
    return true;
  }

  void clear() noexcept {
    while (size_ > 0U) pop_back();
  }

  T& operator[](uint32_t i) noexcept { return Data()[i]; }
  const T& operator[](uint32_t i) const noexcept { return Data()[i]; }

  T* begin() noexcept { return Data(); }
  T* end() noexcept { return Data() + size_; }
  const T* begin() const noexcept { return Data(); }
  const T* end() const noexcept { return Data() + size_; }

  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  bool full() const noexcept { return size_ >= Capacity; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

 private:
  T* Data() noexcept { return reinterpret_cast<T*>(storage_); }
  const T* Data() const noexcept {
    return reinterpret_cast<const T*>(storage_);
  }

  alignas(T) unsigned char storage_[sizeof(T) * Capacity];
  uint32_t size_;
};

// ============================================================================
// function_ref<Signature>
// ============================================================================

template <typename Signature>
class function_ref;

/**
 * @brief Non-owning reference to a callable. The referenced callable must
 *        outlive every call made through the function_ref.
 */
template <typename R, typename... Args>
class function_ref<R(Args...)> final {
 public:
  template <typename F,
            typename = typename std::enable_if<!std::is_same<
                typename std::decay<F>::type, function_ref>::value>::type>
  function_ref(F&& fn) noexcept
      : obj_(const_cast<void*>(static_cast<const void*>(std::addressof(fn)))),
        invoke_(&Invoke<typename std::remove_reference<F>::type>) {}

  R operator()(Args... args) const {
    return invoke_(obj_, std::forward<Args>(args)...);
  }

 private:
  template <typename F>
  static R Invoke(void* obj, Args... args) {
    return (*static_cast<F*>(obj))(std::forward<Args>(args)...);
  }

  void* obj_;
  R (*invoke_)(void*, Args...);
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/**
 * @brief Strong typedef: two NewTypes over the same T with different tags
 *        do not convert into each other.
 */
template <typename T, typename Tag>
class NewType final {
 public:
  constexpr NewType() noexcept : val_() {}
  constexpr explicit NewType(T val) noexcept : val_(val) {}

  constexpr T value() const noexcept { return val_; }

  constexpr bool operator==(const NewType& other) const noexcept {
    return val_ == other.val_;
  }
  constexpr bool operator!=(const NewType& other) const noexcept {
    return val_ != other.val_;
  }
  constexpr bool operator<(const NewType& other) const noexcept {
    return val_ < other.val_;
  }

 private:
  T val_;
};

struct TimerTaskIdTag {};
using TimerTaskId = NewType<uint32_t, TimerTaskIdTag>;

struct JobIdTag {};
using JobId = NewType<uint64_t, JobIdTag>;

struct SubscriptionIdTag {};
using SubscriptionId = NewType<uint32_t, SubscriptionIdTag>;

}  // namespace dlcore

#endif  // DLCORE_VOCABULARY_HPP_
