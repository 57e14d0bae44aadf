#pragma once
#include <functional>
#include <namedvec/assert.hpp>
#include <namedvec/core.hpp>
#include <span>

namespace namedvec {

/**
 * @brief Non-owning contiguous view with checked element access.
 * operator[] and front()/back() assert; the try_ variants report
 * error::out_of_bounds instead.
 */
template <typename T> class span {
  using base_t = std::span<T>;

  base_t span_;

public:
  using element_type = typename base_t::element_type;
  using value_type = typename base_t::value_type;
  using size_type = typename base_t::size_type;
  using reference = typename base_t::reference;
  using iterator = typename base_t::iterator;
  using reverse_iterator = typename base_t::reverse_iterator;

  constexpr span() noexcept = default;

  constexpr span(T *ptr, size_type count) noexcept
      : span_(ptr, ptr ? count : 0) {}

  [[nodiscard]] constexpr result<std::reference_wrapper<T>>
  try_at(size_type index) const noexcept {
    if (index >= span_.size()) [[unlikely]] {
      return unexpected(error::out_of_bounds);
    }
    return std::ref(span_[index]);
  }

  constexpr T &operator[](size_type index) const noexcept {
    NAMEDVEC_ASSERT(index < span_.size() && "Span index out of bounds");
    return span_[index];
  }

  [[nodiscard]] constexpr T &unsafe_at(size_type index) const noexcept {
    NAMEDVEC_DEBUG_ASSERT(index < span_.size() && "Span index out of bounds");
    return span_.data()[index];
  }

  [[nodiscard]] constexpr result<span>
  try_subspan(size_type offset, size_type count) const noexcept {
    if (offset > span_.size() || count > span_.size() - offset)
      return unexpected(error::out_of_bounds);
    return span(span_.data() + offset, count);
  }

  constexpr size_type size() const noexcept { return span_.size(); }
  constexpr bool empty() const noexcept { return span_.empty(); }
  constexpr T *data() const noexcept { return span_.data(); }

  [[nodiscard]] constexpr iterator begin() const noexcept {
    return span_.begin();
  }
  [[nodiscard]] constexpr iterator end() const noexcept { return span_.end(); }
  [[nodiscard]] constexpr reverse_iterator rbegin() const noexcept {
    return span_.rbegin();
  }
  [[nodiscard]] constexpr reverse_iterator rend() const noexcept {
    return span_.rend();
  }

  constexpr T &front() const noexcept {
    NAMEDVEC_ASSERT(!empty(), "front() called on empty span");
    return span_.front();
  }

  constexpr T &back() const noexcept {
    NAMEDVEC_ASSERT(!empty(), "back() called on empty span");
    return span_.back();
  }

  constexpr std::span<T> to_std() const noexcept { return span_; }
};

} // namespace namedvec
