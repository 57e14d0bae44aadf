#pragma once
#include <concepts>
#include <functional>
#include <namedvec/allocator.hpp>
#include <namedvec/allocator_helper.hpp>
#include <namedvec/concepts.hpp>
#include <namedvec/lookup.hpp>
#include <namedvec/name_index.hpp>
#include <namedvec/rvalue_safety.hpp>
#include <namedvec/span.hpp>
#include <namedvec/vector.hpp>
#include <ostream>
#include <utility>

namespace namedvec {

/**
 * @brief Ordered sequence whose elements can also be found by name.
 *
 * Each element reports its own name through name(). Names are unique: pushing
 * an element whose name is already present replaces that element in place
 * instead of appending. Elements keep insertion order and can be addressed by
 * position or by name through the same accessors (see lookup).
 *
 * Internally a vector<T> holds the elements and a name_index maps each name
 * to its current position. Every mutating member keeps the two in step; no
 * mutable iterator is exposed, so the order can only change through this
 * class.
 *
 * Mutating an element through a reference returned by try_get(), at() or
 * operator[] must not change its name. The index is not told about it and
 * will keep answering with the old name.
 *
 * @tparam T Element type, see named_element.
 * @tparam Alloc Allocator for both the elements and the index.
 */
template <named_element T, typename Alloc = core_allocator>
class named_vector {
public:
  using value_type = T;
  using allocator_type = Alloc;
  using size_type = std::size_t;
  using reference = T &;
  using const_reference = const T &;
  using const_iterator = const T *;
  using index_type = name_index<size_type, Alloc>;

private:
  vector<T, Alloc> items_;
  index_type index_;

public:
  named_vector() noexcept = default;
  explicit named_vector(Alloc &a) noexcept : items_(a), index_(a) {}

  // Move-only; see try_clone()
  named_vector(const named_vector &) = delete;
  named_vector &operator=(const named_vector &) = delete;
  named_vector(named_vector &&) noexcept = default;
  named_vector &operator=(named_vector &&) noexcept = default;

  /**
   * @brief Creates an empty collection able to take `capacity` elements
   * without growing the element buffer or rehashing the index.
   */
  static result<named_vector> try_allocate(Alloc &alloc,
                                           size_type capacity = 0) noexcept {
    named_vector v(alloc);
    if (capacity > 0) {
      auto res = v.try_reserve(capacity);
      if (!res)
        return unexpected(res.error());
    }
    return v;
  }

  static result<named_vector> try_create(size_type capacity = 0) noexcept {
    return try_allocate(get_default_allocator(), capacity);
  }

  NAMEDVEC_BLOCK_RVALUE_KEYED_ACCESS(T, lookup);

  size_type size() const noexcept { return items_.size(); }
  bool empty() const noexcept { return items_.empty(); }
  size_type capacity() const noexcept { return items_.capacity(); }

  /**
   * @brief Appends `item`, or replaces the element that already carries its
   * name.
   *
   * A replacement keeps the old element's position. On failure the
   * collection is unchanged.
   *
   * @return The stored element, error::invalid_argument for an empty name,
   * or error::allocation_failed.
   */
  [[nodiscard]] result<T *> try_push(T &&item) noexcept {
    const std::string_view name = item.name();
    if (name.empty())
      return unexpected(error::invalid_argument);

    if (auto existing = index_.try_at(name); existing) {
      T &slot = items_[**existing];
      slot = std::move(item);
      return &slot;
    }

    // Reserve the slot first so the push below cannot fail once the name is
    // indexed.
    if (auto res = items_.try_grow(1); !res)
      return unexpected(res.error());

    if (auto res = index_.try_insert(name, items_.size()); !res)
      return unexpected(res.error());

    return items_.try_push_back(std::move(item));
  }

  template <typename... Args>
  [[nodiscard]] result<T *> try_emplace(Args &&...args) noexcept {
    if constexpr (has_try_create<T, Args...>) {
      auto res = T::try_create(std::forward<Args>(args)...);
      if (!res)
        return unexpected(res.error());
      return try_push(std::move(*res));
    } else {
      return try_push(T(std::forward<Args>(args)...));
    }
  }

  /**
   * @brief Removes and returns the last element.
   * @return error::container_empty if there is nothing to pop.
   */
  [[nodiscard]] result<T> try_pop() noexcept {
    if (items_.empty())
      return unexpected(error::container_empty);

    T &last = items_.back();
    index_.erase(last.name());
    T out(std::move(last));
    items_.truncate(items_.size() - 1);
    return out;
  }

  /**
   * @brief Keeps the first `len` elements and drops the rest.
   * Does nothing if `len >= size()`.
   */
  void truncate(size_type len) noexcept {
    const size_type current = items_.size();
    if (len >= current)
      return;

    for (size_type i = len; i < current; ++i)
      index_.erase(items_[i].name());
    items_.truncate(len);
  }

  void clear() noexcept {
    index_.clear();
    items_.clear();
  }

  /**
   * @brief Makes room for `additional` more elements in both the element
   * buffer and the index.
   *
   * Asking for more elements than the address space can hold is a
   * precondition violation.
   */
  [[nodiscard]] result<void> try_reserve(size_type additional) noexcept {
    size_type total;
    NAMEDVEC_ASSERT(!detail::check_add(items_.size(), additional, &total) &&
                        total <= items_.max_size(),
                    "named_vector capacity overflow");

    if (auto res = items_.try_reserve(total); !res)
      return res;
    return index_.try_reserve(total);
  }

  [[nodiscard]] result<void> try_shrink_to_fit() noexcept {
    if (auto res = items_.try_shrink_to_fit(); !res)
      return res;
    return index_.try_shrink_to_fit();
  }

  bool contains(std::string_view name) const noexcept {
    return index_.contains(name);
  }

  [[nodiscard]] result<size_type>
  try_position_of(std::string_view name) const noexcept {
    auto slot = index_.try_at(name);
    if (!slot)
      return unexpected(slot.error());
    return **slot;
  }

  /**
   * @brief Finds an element by name or position.
   * @return error::not_found for an unknown name, error::out_of_range for a
   * position past the end.
   */
  [[nodiscard]] result<std::reference_wrapper<const T>>
  try_get(lookup key) const & noexcept {
    return resolve(key).transform(
        [this](size_type i) { return std::cref(items_[i]); });
  }

  [[nodiscard]] result<std::reference_wrapper<T>>
  try_get(lookup key) & noexcept {
    return resolve(key).transform(
        [this](size_type i) { return std::ref(items_[i]); });
  }

  // Asserted access: a key that does not resolve is fatal.
  const T &at(lookup key) const & noexcept { return items_[must_resolve(key)]; }
  T &at(lookup key) & noexcept { return items_[must_resolve(key)]; }

  const T &operator[](lookup key) const & noexcept { return at(key); }
  T &operator[](lookup key) & noexcept { return at(key); }

  /**
   * @brief Exchanges the elements addressed by `first` and `second`.
   *
   * Both keys must resolve; a missing name or a position past the end is a
   * precondition violation, not a no-op. Swapping an element with itself
   * leaves everything untouched.
   */
  void swap(lookup first, lookup second) noexcept {
    const size_type a = must_resolve(first);
    const size_type b = must_resolve(second);
    if (a == b)
      return;

    // Repoint the index while the names still live at their old positions.
    auto slot_a = index_.try_at(items_[a].name());
    auto slot_b = index_.try_at(items_[b].name());
    NAMEDVEC_ASSERT(slot_a && slot_b, "name index out of sync with elements");
    **slot_a = b;
    **slot_b = a;

    using std::swap;
    swap(items_[a], items_[b]);
  }

  span<const T> as_span() const & noexcept { return items_.as_span(); }

  /**
   * @brief Read-only view of positions [first, last).
   * Bounds outside the collection or first > last are fatal.
   */
  span<const T> slice(size_type first, size_type last) const & noexcept {
    NAMEDVEC_ASSERT(first <= last && last <= items_.size(),
                    "named_vector slice out of bounds");
    return span<const T>(items_.begin() + first, last - first);
  }

  span<const T> slice_from(size_type first) const & noexcept {
    return slice(first, items_.size());
  }

  span<const T> slice_to(size_type last) const & noexcept {
    return slice(0, last);
  }

  [[nodiscard]] result<span<const T>>
  try_slice(size_type first, size_type last) const & noexcept {
    if (first > last)
      return unexpected(error::out_of_bounds);
    return items_.as_span().try_subspan(first, last - first);
  }

  const_iterator begin() const & noexcept { return items_.begin(); }
  const_iterator end() const & noexcept { return items_.end(); }

  // Name to position map, exposed read-only for inspection.
  const index_type &index() const noexcept { return index_; }

  [[nodiscard]] result<named_vector> try_clone() const noexcept {
    auto items = items_.try_clone();
    if (!items)
      return unexpected(items.error());
    auto index = index_.try_clone();
    if (!index)
      return unexpected(index.error());

    named_vector clone(items_.get_allocator());
    clone.items_ = std::move(*items);
    clone.index_ = std::move(*index);
    return clone;
  }

  bool operator==(const named_vector &other) const noexcept
    requires std::equality_comparable<T>
  {
    if (size() != other.size())
      return false;
    for (size_type i = 0; i < size(); ++i) {
      if (!(items_[i] == other.items_[i]))
        return false;
    }
    return true;
  }

  Alloc &get_allocator() const noexcept { return items_.get_allocator(); }

private:
  result<size_type> resolve(lookup key) const noexcept {
    if (key.is_name())
      return try_position_of(key.name());
    if (key.position() >= items_.size())
      return unexpected(error::out_of_range);
    return key.position();
  }

  size_type must_resolve(lookup key) const noexcept {
    auto pos = resolve(key);
    NAMEDVEC_ASSERT(pos.has_value(), "named_vector key does not resolve");
    return *pos;
  }
};

// Prints elements in position order. Elements without their own operator<<
// print as their quoted name.
template <named_element T, typename Alloc>
std::ostream &operator<<(std::ostream &os, const named_vector<T, Alloc> &v) {
  os << '[';
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i > 0)
      os << ", ";
    if constexpr (requires { os << v[i]; })
      os << v[i];
    else
      os << '"' << std::string_view(v[i].name()) << '"';
  }
  return os << ']';
}

} // namespace namedvec
