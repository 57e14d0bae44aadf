#pragma once
#include <algorithm>
#include <cstring>
#include <iterator>
#include <limits>
#include <namedvec/allocator.hpp>
#include <namedvec/allocator_helper.hpp>
#include <namedvec/concepts.hpp>
#include <namedvec/span.hpp>

namespace namedvec {

template <typename T, typename Alloc = core_allocator> class vector {
  static_assert(std::is_nothrow_move_constructible_v<T>,
                "vector elements must be nothrow move constructible");

  Alloc *alloc_;
  T *data_ = nullptr;
  std::size_t size_ = 0;
  std::size_t cap_ = 0;

public:
  using value_type = T;
  using allocator_type = Alloc;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using reference = T &;
  using const_reference = const T &;
  using iterator = T *;
  using const_iterator = const T *;
  using reverse_iterator = std::reverse_iterator<iterator>;
  using const_reverse_iterator = std::reverse_iterator<const_iterator>;

  vector() noexcept : alloc_(&get_default_allocator()) {}
  explicit vector(Alloc &a) noexcept : alloc_(&a) {}

  // Move-only
  vector(const vector &) = delete;
  vector &operator=(const vector &) = delete;

  vector(vector &&other) noexcept
      : alloc_(other.alloc_), data_(std::exchange(other.data_, nullptr)),
        size_(std::exchange(other.size_, 0)),
        cap_(std::exchange(other.cap_, 0)) {}

  vector &operator=(vector &&other) noexcept {
    if (this != &other) {
      release();
      alloc_ = other.alloc_;
      data_ = std::exchange(other.data_, nullptr);
      size_ = std::exchange(other.size_, 0);
      cap_ = std::exchange(other.cap_, 0);
    }
    return *this;
  }

  ~vector() { release(); }

  static result<vector> try_allocate(Alloc &alloc,
                                     std::size_t initial_cap = 0) noexcept {
    vector v(alloc);
    if (initial_cap > 0) {
      auto res = v.try_reserve(initial_cap);
      if (!res)
        return unexpected(res.error());
    }
    return v;
  }

  static result<vector> try_create(std::size_t initial_cap = 0) noexcept {
    return try_allocate(get_default_allocator(), initial_cap);
  }

  iterator begin() noexcept { return data_; }
  iterator end() noexcept { return data_ + size_; }
  const_iterator begin() const noexcept { return data_; }
  const_iterator end() const noexcept { return data_ + size_; }
  reverse_iterator rbegin() noexcept { return reverse_iterator(end()); }
  reverse_iterator rend() noexcept { return reverse_iterator(begin()); }
  const_reverse_iterator rbegin() const noexcept {
    return const_reverse_iterator(end());
  }
  const_reverse_iterator rend() const noexcept {
    return const_reverse_iterator(begin());
  }

  size_type size() const noexcept { return size_; }
  size_type capacity() const noexcept { return cap_; }
  bool empty() const noexcept { return size_ == 0; }

  static constexpr size_type max_size() noexcept {
    return std::numeric_limits<size_type>::max() / sizeof(T);
  }

  reference operator[](size_type pos) noexcept {
    NAMEDVEC_ASSERT(pos < size_, "vector index out of bounds");
    return data_[pos];
  }
  const_reference operator[](size_type pos) const noexcept {
    NAMEDVEC_ASSERT(pos < size_, "vector index out of bounds");
    return data_[pos];
  }

  reference back() noexcept {
    NAMEDVEC_ASSERT(size_ > 0, "back() called on empty vector");
    return data_[size_ - 1];
  }
  const_reference back() const noexcept {
    NAMEDVEC_ASSERT(size_ > 0, "back() called on empty vector");
    return data_[size_ - 1];
  }

  [[nodiscard]] result<T *> try_at(size_type index) noexcept {
    if (index >= size_)
      return unexpected(error::out_of_range);
    return &data_[index];
  }

  [[nodiscard]] result<const T *> try_at(size_type index) const noexcept {
    if (index >= size_)
      return unexpected(error::out_of_range);
    return &data_[index];
  }

  span<const T> as_span() const noexcept { return span<const T>(data_, size_); }

  [[nodiscard]] result<void> try_reserve(size_type new_cap) noexcept {
    if (new_cap <= cap_)
      return {};

    std::size_t new_bytes;
    if (detail::check_mul(new_cap, sizeof(T), &new_bytes))
      return unexpected(error::integer_overflow);

    // Try in-place growth
    if (data_) {
      if (auto res = alloc_->expand_in_place(data_, cap_ * sizeof(T), new_bytes);
          res) {
        cap_ = new_cap;
        return {};
      }
    }

    return relocate(new_cap);
  }

  /**
   * @brief Makes room for `additional` more elements with geometric growth,
   * so repeated single insertions stay amortized O(1).
   */
  [[nodiscard]] result<void> try_grow(size_type additional) noexcept {
    if (additional <= cap_ - size_)
      return {};
    if (additional > max_size() - size_)
      return unexpected(error::integer_overflow);

    const size_type needed = size_ + additional;
    size_type grown = 8;
    if (cap_ != 0)
      grown = cap_ <= max_size() / 2 ? cap_ * 2 : max_size();
    return try_reserve(std::max(needed, grown));
  }

  /**
   * @brief Releases unused capacity. An empty vector gives its block back
   * entirely.
   */
  [[nodiscard]] result<void> try_shrink_to_fit() noexcept {
    if (cap_ == size_)
      return {};
    if (size_ == 0) {
      alloc_->deallocate(data_, cap_ * sizeof(T));
      data_ = nullptr;
      cap_ = 0;
      return {};
    }
    return relocate(size_);
  }

  template <typename... Args>
  [[nodiscard]] result<T *> try_emplace_back(Args &&...args) noexcept {
    if (auto res = try_grow(1); !res)
      return unexpected(res.error());

    T *ptr = data_ + size_;

    if constexpr (has_try_create<T, Args...>) {
      auto res = T::try_create(std::forward<Args>(args)...);
      if (!res)
        return unexpected(res.error());
      new (ptr) T(std::move(*res));
    } else {
      new (ptr) T(std::forward<Args>(args)...);
    }

    size_++;
    return ptr;
  }

  [[nodiscard]] result<T *> try_push_back(T &&val) noexcept {
    if (auto res = try_grow(1); !res)
      return unexpected(res.error());

    T *ptr = new (data_ + size_) T(std::move(val));
    size_++;
    return ptr;
  }

  [[nodiscard]] result<void> try_pop_back() noexcept {
    if (size_ == 0)
      return unexpected(error::container_empty);
    data_[--size_].~T();
    return {};
  }

  // Destroys the elements at [len, size()). No-op when len >= size().
  void truncate(size_type len) noexcept {
    while (size_ > len)
      data_[--size_].~T();
  }

  void clear() noexcept { truncate(0); }

  [[nodiscard]] result<vector> try_clone() const noexcept {
    vector clone(*alloc_);
    auto res = clone.try_reserve(size_);
    if (!res)
      return unexpected(res.error());

    for (size_type i = 0; i < size_; ++i) {
      if constexpr (has_try_clone<T>) {
        auto item_res = data_[i].try_clone();
        if (!item_res)
          return unexpected(item_res.error());
        new (clone.data_ + i) T(std::move(*item_res));
      } else {
        static_assert(std::is_copy_constructible_v<T>,
                      "cloning requires try_clone() or a copy constructor");
        new (clone.data_ + i) T(data_[i]);
      }
      clone.size_++;
    }
    return clone;
  }

  Alloc &get_allocator() const noexcept { return *alloc_; }

private:
  // Moves the elements into a block of exactly new_cap elements.
  [[nodiscard]] result<void> relocate(size_type new_cap) noexcept {
    if constexpr (is_relocatable<T>::value) {
      auto res = alloc_->reallocate(data_, cap_ * sizeof(T),
                                    new_cap * sizeof(T), alignof(T));
      if (!res)
        return unexpected(error::allocation_failed);
      data_ = static_cast<T *>(res->ptr);
    } else {
      auto res = alloc_->allocate(new_cap * sizeof(T), alignof(T));
      if (!res)
        return unexpected(error::allocation_failed);

      T *new_ptr = static_cast<T *>(res->ptr);
      for (size_type i = 0; i < size_; ++i) {
        new (new_ptr + i) T(std::move(data_[i]));
        data_[i].~T();
      }
      if (data_)
        alloc_->deallocate(data_, cap_ * sizeof(T));
      data_ = new_ptr;
    }
    cap_ = new_cap;
    return {};
  }

  void release() noexcept {
    clear();
    if (data_)
      alloc_->deallocate(data_, cap_ * sizeof(T));
    data_ = nullptr;
    cap_ = 0;
  }
};

template <typename T, typename A>
struct is_relocatable<vector<T, A>> : std::true_type {};

} // namespace namedvec
