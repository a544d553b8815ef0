/**
 * @file vocabulary.hpp
 * @brief Error-code based result type and fixed-capacity string.
 *
 *   - expected<V, E> : value-or-error return type (E is a uint8_t enum)
 *   - FixedString<N> : stack-allocated, null-terminated string
 *
 * Header-only, C++17, no heap allocation.
 */

#ifndef IODRV_VOCABULARY_HPP_
#define IODRV_VOCABULARY_HPP_

#include "iodrv/platform.hpp"

#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace iodrv {

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error code of type E.
 *
 * Built with the static factories success() / error(). Accessing value()
 * on an error (or get_error() on a value) is a debug assertion.
 *
 * @code
 *   expected<uint32_t, DriverError> r = driver.Submit(ops, 0, n);
 *   if (!r.has_value()) { HandleClosed(r.get_error()); }
 * @endcode
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) { return expected(v); }
  static expected success(V&& v) { return expected(std::move(v)); }
  static expected error(E e) noexcept { return expected(ErrorTag{}, e); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.Ref());
    } else {
      err_ = other.err_;
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(std::move(other.Ref()));
    } else {
      err_ = other.err_;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) V(other.Ref());
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
        ::new (&storage_) V(std::move(other.Ref()));
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
    IODRV_ASSERT(has_value_);
    return Ref();
  }
  const V& value() const& noexcept {
    IODRV_ASSERT(has_value_);
    return Ref();
  }

  E get_error() const noexcept {
    IODRV_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const { return has_value_ ? Ref() : fallback; }

 private:
  struct ErrorTag {};

  explicit expected(const V& v) : has_value_(true) { ::new (&storage_) V(v); }
  explicit expected(V&& v) : has_value_(true) { ::new (&storage_) V(std::move(v)); }
  expected(ErrorTag, E e) noexcept : has_value_(false), err_(e) {}

  V& Ref() noexcept { return *std::launder(reinterpret_cast<V*>(&storage_)); }
  const V& Ref() const noexcept { return *std::launder(reinterpret_cast<const V*>(&storage_)); }

  void Destroy() noexcept {
    if (has_value_) {
      Ref().~V();
      has_value_ = false;
    }
  }

  bool has_value_;
  E err_{};
  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
};

/** @brief void specialization: success carries no payload. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    IODRV_ASSERT(!has_value_);
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

/// @brief Tag selecting the truncating FixedString constructors.
struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Null-terminated string with inline storage of N characters.
 *
 * Literal construction is checked at compile time; runtime strings go
 * through the TruncateToCapacity overloads.
 */
template <uint32_t N>
class FixedString final {
 public:
  FixedString() noexcept : size_(0U) { buf_[0] = '\0'; }

  template <uint32_t M>
  FixedString(const char (&str)[M]) noexcept : size_(M - 1U) {  // NOLINT(google-explicit-constructor)
    static_assert(M - 1U <= N, "string literal exceeds FixedString capacity");
    std::memcpy(buf_, str, M);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept { assign(TruncateToCapacity, str); }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    const uint32_t len = (str == nullptr) ? 0U : static_cast<uint32_t>(std::strlen(str));
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    size_ = (len > N) ? N : len;
    if (size_ > 0U) {
      std::memcpy(buf_, str, size_);
    }
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return N; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  template <uint32_t M>
  bool operator==(const FixedString<M>& rhs) const noexcept {
    return size_ == rhs.size() && std::memcmp(buf_, rhs.c_str(), size_) == 0;
  }

  bool operator==(const char* rhs) const noexcept {
    return rhs != nullptr && std::strcmp(buf_, rhs) == 0;
  }

  template <uint32_t M>
  bool operator!=(const FixedString<M>& rhs) const noexcept {
    return !(*this == rhs);
  }

 private:
  char buf_[N + 1U];
  uint32_t size_;
};

}  // namespace iodrv

#endif  // IODRV_VOCABULARY_HPP_
