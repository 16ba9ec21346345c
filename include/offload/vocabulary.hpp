/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared across the engine: expected, FixedString
 *        and the error enumerations returned by public APIs.
 */

#ifndef OFFLOAD_VOCABULARY_HPP_
#define OFFLOAD_VOCABULARY_HPP_

#include "offload/platform.hpp"

#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace offload {

// ============================================================================
// Error enumerations
// ============================================================================

/// @brief Reasons a submission is refused synchronously.
enum class SubmitError : uint8_t {
  kQueueFull = 0,       ///< Selected worker queue at capacity
  kNoWorkersAvailable,  ///< No running worker to place the job on
  kPoolShuttingDown,    ///< Shutdown() has begun
  kNotInitialized,      ///< Initialize() has not been called
  kInvalidMode,         ///< One-shot job on streaming API or vice versa
  kNullJob,             ///< Job pointer was empty
};

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

/// @brief Short, static, human readable name for a SubmitError.
inline const char* SubmitErrorName(SubmitError e) noexcept {
  switch (e) {
    case SubmitError::kQueueFull:
      return "QueueFull";
    case SubmitError::kNoWorkersAvailable:
      return "NoWorkersAvailable";
    case SubmitError::kPoolShuttingDown:
      return "PoolShuttingDown";
    case SubmitError::kNotInitialized:
      return "NotInitialized";
    case SubmitError::kInvalidMode:
      return "InvalidMode";
    case SubmitError::kNullJob:
      return "NullJob";
  }
  return "Unknown";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Minimal value-or-error return type.
 *
 * Constructed only through success() / error(). Accessing value() on an
 * error (or get_error() on a value) is a programming error and asserts.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(v); }
  static expected success(V&& v) { return expected(std::move(v)); }
  static expected error(E e) noexcept { return expected(e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_) V(*other.Ptr());
    } else {
      err_ = other.err_;
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_) V(std::move(*other.Ptr()));
    } else {
      err_ = other.err_;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_) V(*other.Ptr());
      } else {
        err_ = other.err_;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        new (&storage_) V(std::move(*other.Ptr()));
      } else {
        err_ = other.err_;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    OFFLOAD_ASSERT(has_value_);
    return *Ptr();
  }
  const V& value() const& noexcept {
    OFFLOAD_ASSERT(has_value_);
    return *Ptr();
  }

  E get_error() const noexcept {
    OFFLOAD_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const { return has_value_ ? *Ptr() : fallback; }

 private:
  explicit expected(const V& v) : has_value_(true) { new (&storage_) V(v); }
  explicit expected(V&& v) : has_value_(true) { new (&storage_) V(std::move(v)); }
  explicit expected(E e) noexcept : has_value_(false), err_(e) {}

  V* Ptr() noexcept { return std::launder(reinterpret_cast<V*>(&storage_)); }
  const V* Ptr() const noexcept {
    return std::launder(reinterpret_cast<const V*>(&storage_));
  }

  void Destroy() noexcept {
    if (has_value_) {
      Ptr()->~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  bool has_value_;
  E err_{};
};

/// @brief expected<void, E>: success carries no value.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    OFFLOAD_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : has_value_(ok), err_(e) {}

  bool has_value_;
  E err_;
};

// ============================================================================
// FixedString<N>
// ============================================================================

/**
 * @brief Fixed-capacity, null-terminated string stored inline.
 *
 * Assignment from a longer string truncates to N characters.
 */
template <uint32_t N>
class FixedString final {
 public:
  FixedString() noexcept { buf_[0] = '\0'; }

  FixedString(const char* s) noexcept { Assign(s); }  // NOLINT(runtime/explicit)

  FixedString& operator=(const char* s) noexcept {
    Assign(s);
    return *this;
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t Capacity() noexcept { return N; }

  bool operator==(const char* s) const noexcept {
    return (s != nullptr) && (std::strcmp(buf_, s) == 0);
  }

 private:
  void Assign(const char* s) noexcept {
    size_ = 0U;
    if (s != nullptr) {
      while (size_ < N && s[size_] != '\0') {
        buf_[size_] = s[size_];
        ++size_;
      }
    }
    buf_[size_] = '\0';
  }

  char buf_[N + 1U];
  uint32_t size_{0U};
};

}  // namespace offload

#endif  // OFFLOAD_VOCABULARY_HPP_
