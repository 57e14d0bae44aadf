#pragma once
#include <limits>
#include <namedvec/assert.hpp>
#include <namedvec/core.hpp>
#include <namedvec/rvalue_safety.hpp>
#include <utility>

namespace namedvec {

namespace detail {

template <typename T>
[[nodiscard]] constexpr bool manual_check_mul(T a, T b, T *result) noexcept {
  if (a > 0 && b > std::numeric_limits<T>::max() / a) {
    return true;
  }
  *result = a * b;
  return false;
}

/**
 * @brief Overflow-safe multiplication: result = a * b
 * @return true if overflow occurred, false otherwise.
 */
template <typename T>
[[nodiscard]] constexpr bool check_mul(T a, T b, T *result) noexcept {
#if defined(__GNUC__) || defined(__clang__)
  return __builtin_mul_overflow(a, b, result);
#else
  return manual_check_mul(a, b, result);
#endif
}

/**
 * @brief Overflow-safe addition: result = a + b
 * @return true if overflow occurred, false otherwise.
 */
template <typename T>
[[nodiscard]] constexpr bool check_add(T a, T b, T *result) noexcept {
#if defined(__GNUC__) || defined(__clang__)
  return __builtin_add_overflow(a, b, result);
#else
  if (b > std::numeric_limits<T>::max() - a)
    return true;
  *result = a + b;
  return false;
#endif
}

} // namespace detail

/**
 * @brief An RAII handle for a fallibly allocated and constructed array.
 * Move-only. Destroys every element and returns the block to its allocator
 * unless ownership is given up with unsafe_release().
 */
template <typename T> class [[nodiscard]] fallible_array_ptr {
  friend class allocator_helper;

  constexpr fallible_array_ptr(T *ptr, std::size_t count,
                               fallible_allocator *alloc) noexcept
      : m_ptr(ptr), m_count(count), m_alloc(alloc) {}

public:
  constexpr fallible_array_ptr() noexcept
      : m_ptr(nullptr), m_count(0), m_alloc(nullptr) {}

  fallible_array_ptr(const fallible_array_ptr &) = delete;
  fallible_array_ptr &operator=(const fallible_array_ptr &) = delete;

  constexpr fallible_array_ptr(fallible_array_ptr &&other) noexcept
      : m_ptr(std::exchange(other.m_ptr, nullptr)),
        m_count(std::exchange(other.m_count, 0)),
        m_alloc(std::exchange(other.m_alloc, nullptr)) {}

  ~fallible_array_ptr() { reset(); }

  fallible_array_ptr &operator=(fallible_array_ptr &&other) noexcept {
    if (this != &other) {
      reset();
      m_ptr = std::exchange(other.m_ptr, nullptr);
      m_count = std::exchange(other.m_count, 0);
      m_alloc = std::exchange(other.m_alloc, nullptr);
    }
    return *this;
  }

  NAMEDVEC_BLOCK_RVALUE_ACCESS(T);

  [[nodiscard]] constexpr T *unsafe_get() const & noexcept { return m_ptr; }
  [[nodiscard]] constexpr std::size_t size() const noexcept { return m_count; }
  [[nodiscard]] constexpr bool empty() const noexcept { return m_count == 0; }

  [[nodiscard]] constexpr T &operator[](std::size_t index) const & noexcept {
    NAMEDVEC_ASSERT(index < m_count, "fallible_array_ptr index out of bounds");
    return m_ptr[index];
  }

  /**
   * @brief Gives up ownership without destroying anything.
   * Containers call this once they have taken over the block; they become
   * responsible for destroying the elements and freeing the memory.
   */
  [[nodiscard]] constexpr T *unsafe_release() noexcept {
    m_count = 0;
    return std::exchange(m_ptr, nullptr);
  }

private:
  void reset() noexcept {
    if (m_ptr && m_alloc) {
      if constexpr (!std::is_trivially_destructible_v<T>) {
        for (std::size_t i = m_count; i > 0; --i) {
          m_ptr[i - 1].~T();
        }
      }
      m_alloc->deallocate(m_ptr, m_count * sizeof(T));
    }
    m_ptr = nullptr;
    m_count = 0;
  }

  T *m_ptr;
  std::size_t m_count;
  fallible_allocator *m_alloc;
};

class allocator_helper {
public:
  constexpr explicit allocator_helper(fallible_allocator &alloc) noexcept
      : m_alloc(&alloc) {}

  /**
   * @brief Allocates and constructs a single object of type T.
   * Construction must not fail; build fallible parts before calling this.
   */
  template <typename T, typename... Args>
    requires std::is_constructible_v<T, Args &&...>
  [[nodiscard]] result<T *> try_allocate(Args &&...args) const noexcept {
    auto block_res = m_alloc->allocate(sizeof(T), alignof(T));
    if (!block_res)
      return unexpected(block_res.error());

    return new (block_res->ptr) T(std::forward<Args>(args)...);
  }

  /**
   * @brief Destroys and deallocates an object from try_allocate().
   */
  template <typename T> void deallocate(T *ptr) const noexcept {
    if (ptr) {
      ptr->~T();
      m_alloc->deallocate(ptr, sizeof(T));
    }
  }

  /**
   * @brief Allocates an array of value-initialized T with an overflow-safe
   * byte count.
   */
  template <typename T>
    requires std::is_default_constructible_v<T>
  [[nodiscard]] result<fallible_array_ptr<T>>
  allocate_array(std::size_t count) const noexcept {
    if (count == 0)
      return unexpected(error::invalid_argument);

    std::size_t total_bytes;
    if (detail::check_mul(count, sizeof(T), &total_bytes)) {
      return unexpected(error::integer_overflow);
    }

    auto block_res = m_alloc->allocate(total_bytes, alignof(T));
    if (!block_res)
      return unexpected(block_res.error());

    T *elements = static_cast<T *>(block_res->ptr);
    for (std::size_t i = 0; i < count; ++i)
      new (elements + i) T();

    return fallible_array_ptr<T>(elements, count, m_alloc);
  }

  /**
   * @brief Destroys and frees an array previously released from a
   * fallible_array_ptr.
   */
  template <typename T>
  void deallocate_array(T *elements, std::size_t count) const noexcept {
    if (!elements)
      return;
    if constexpr (!std::is_trivially_destructible_v<T>) {
      for (std::size_t i = count; i > 0; --i)
        elements[i - 1].~T();
    }
    m_alloc->deallocate(elements, count * sizeof(T));
  }

  fallible_allocator &get_allocator() const noexcept { return *m_alloc; }

private:
  fallible_allocator *m_alloc;
};

} // namespace namedvec
