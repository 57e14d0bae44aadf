#pragma once
#include <memory>
#include <namedvec/assert.hpp>
#include <type_traits>
#include <utility>

namespace namedvec {

template <typename E> class unexpected {
  E m_error;

public:
  constexpr explicit unexpected(E e) : m_error(std::move(e)) {}
  constexpr E &value() & { return m_error; }
  constexpr const E &value() const & { return m_error; }
  constexpr E &&value() && { return std::move(m_error); }
};

template <typename E> unexpected(E) -> unexpected<E>;

/**
 * @brief Value-or-error return type used by every fallible operation.
 * Accessing the wrong alternative is a precondition violation and trips
 * NAMEDVEC_ASSERT.
 */
template <typename T, typename E> class [[nodiscard]] expected {
  static_assert(std::is_nothrow_move_constructible_v<T>,
                "T must be nothrow move constructible");
  static_assert(std::is_nothrow_move_constructible_v<E>,
                "E must be nothrow move constructible");

  union {
    T m_value;
    E m_error;
  };
  bool m_has_value;

public:
  using value_type = T;
  using error_type = E;

  template <typename U = T>
    requires std::is_nothrow_default_constructible_v<U>
  constexpr expected() noexcept : m_has_value(true) {
    new (&m_value) T();
  }

  constexpr expected(T &&val) noexcept : m_has_value(true) {
    new (&m_value) T(std::move(val));
  }

  template <typename U>
    requires(!std::is_same_v<std::remove_cvref_t<U>, expected> &&
             std::is_constructible_v<T, U &&>)
  constexpr expected(U &&val) : m_has_value(true) {
    new (&m_value) T(std::forward<U>(val));
  }

  template <typename G>
    requires std::is_constructible_v<E, G &&>
  constexpr expected(unexpected<G> &&err) : m_has_value(false) {
    new (&m_error) E(std::move(err.value()));
  }

  template <typename G>
    requires std::is_constructible_v<E, const G &>
  constexpr expected(const unexpected<G> &err) : m_has_value(false) {
    new (&m_error) E(err.value());
  }

  constexpr expected(expected &&other) noexcept
      : m_has_value(other.m_has_value) {
    if (m_has_value)
      new (&m_value) T(std::move(other.m_value));
    else
      new (&m_error) E(std::move(other.m_error));
  }

  constexpr expected(const expected &other)
    requires std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>
      : m_has_value(other.m_has_value) {
    if (m_has_value)
      new (&m_value) T(other.m_value);
    else
      new (&m_error) E(other.m_error);
  }

  expected &operator=(const expected &) = delete;

  constexpr expected &operator=(expected &&other) noexcept {
    if (this != &other) {
      destroy();
      m_has_value = other.m_has_value;
      if (m_has_value)
        new (&m_value) T(std::move(other.m_value));
      else
        new (&m_error) E(std::move(other.m_error));
    }
    return *this;
  }

  constexpr ~expected() { destroy(); }

  constexpr bool has_value() const noexcept { return m_has_value; }
  constexpr explicit operator bool() const noexcept { return m_has_value; }

  constexpr T &value() & {
    NAMEDVEC_ASSERT(m_has_value && "Result does not contain a value");
    return m_value;
  }

  constexpr T &&value() && {
    NAMEDVEC_ASSERT(m_has_value && "Result does not contain a value");
    return std::move(m_value);
  }

  constexpr const T &value() const & {
    NAMEDVEC_ASSERT(m_has_value && "Result does not contain a value");
    return m_value;
  }

  constexpr E &error() & {
    NAMEDVEC_ASSERT(!m_has_value && "Result does not contain an error");
    return m_error;
  }

  constexpr const E &error() const & {
    NAMEDVEC_ASSERT(!m_has_value && "Result does not contain an error");
    return m_error;
  }

  template <typename F> auto transform(F &&f) const & {
    using NewValue = decltype(f(value()));
    if (m_has_value)
      return expected<NewValue, E>(f(m_value));
    return expected<NewValue, E>(unexpected(m_error));
  }

  template <typename F> auto and_then(F &&f) const & {
    if (m_has_value)
      return f(m_value);
    return decltype(f(value()))(unexpected(m_error));
  }

  template <typename U> constexpr T value_or(U &&fallback) const & {
    return m_has_value ? m_value : static_cast<T>(std::forward<U>(fallback));
  }

  constexpr T *operator->() noexcept { return &value(); }
  constexpr const T *operator->() const noexcept { return &value(); }

  constexpr T &operator*() & noexcept { return value(); }
  constexpr const T &operator*() const & noexcept { return value(); }
  constexpr T &&operator*() && noexcept { return std::move(value()); }

  constexpr bool operator==(const expected &other) const {
    if (m_has_value != other.m_has_value)
      return false;
    if (m_has_value)
      return m_value == other.m_value;
    return m_error == other.m_error;
  }

private:
  constexpr void destroy() noexcept {
    if (m_has_value)
      m_value.~T();
    else
      m_error.~E();
  }
};

template <typename E> class [[nodiscard]] expected<void, E> {
  union {
    E m_error;
  };
  bool m_has_value;

public:
  using value_type = void;
  using error_type = E;

  constexpr expected() noexcept : m_has_value(true) {}

  template <typename G>
    requires std::is_constructible_v<E, G &&>
  constexpr expected(unexpected<G> &&err) : m_has_value(false) {
    new (&m_error) E(std::move(err.value()));
  }

  constexpr expected(expected &&other) noexcept
      : m_has_value(other.m_has_value) {
    if (!m_has_value)
      new (&m_error) E(std::move(other.m_error));
  }

  constexpr expected(const expected &other) : m_has_value(other.m_has_value) {
    if (!m_has_value)
      new (&m_error) E(other.m_error);
  }

  expected &operator=(const expected &) = delete;

  constexpr ~expected() {
    if (!m_has_value)
      m_error.~E();
  }

  constexpr bool has_value() const noexcept { return m_has_value; }
  constexpr explicit operator bool() const noexcept { return m_has_value; }

  void value() const {
    NAMEDVEC_ASSERT(m_has_value && "Result contains an error");
  }

  constexpr const E &error() const & {
    NAMEDVEC_ASSERT(!m_has_value && "Result does not contain an error");
    return m_error;
  }

  constexpr bool operator==(const expected &other) const {
    if (m_has_value != other.m_has_value)
      return false;
    if (m_has_value)
      return true;
    return m_error == other.m_error;
  }
};

} // namespace namedvec
