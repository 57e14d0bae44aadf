#pragma once
#include <cstring>
#include <namedvec/allocator.hpp>
#include <string_view>
#include <utility>

namespace namedvec {

/**
 * @brief Move-only, allocator-aware owning string.
 * Always null-terminated. The contents are fixed at creation; allocation
 * failure is reported through result instead of throwing.
 */
template <typename Alloc = core_allocator> class basic_string {
  Alloc *alloc_;
  char *data_;
  std::size_t size_ = 0;
  std::size_t cap_ = 0;

  // Empty strings point here so accessors never see nullptr
  static inline char empty_char = '\0';

public:
  using value_type = char;
  using allocator_type = Alloc;
  using size_type = std::size_t;

  basic_string() noexcept
      : alloc_(&get_default_allocator()), data_(&empty_char) {}

  explicit basic_string(Alloc &a) noexcept : alloc_(&a), data_(&empty_char) {}

  basic_string(const basic_string &) = delete;
  basic_string &operator=(const basic_string &) = delete;

  basic_string(basic_string &&other) noexcept
      : alloc_(other.alloc_), data_(std::exchange(other.data_, &empty_char)),
        size_(std::exchange(other.size_, 0)),
        cap_(std::exchange(other.cap_, 0)) {}

  basic_string &operator=(basic_string &&other) noexcept {
    if (this != &other) {
      release();
      alloc_ = other.alloc_;
      data_ = std::exchange(other.data_, &empty_char);
      size_ = std::exchange(other.size_, 0);
      cap_ = std::exchange(other.cap_, 0);
    }
    return *this;
  }

  ~basic_string() noexcept { release(); }

  static result<basic_string> try_allocate(Alloc &alloc,
                                           std::string_view sv) noexcept {
    basic_string str(alloc);
    if (sv.empty())
      return str;
    if (sv.size() == std::string_view::npos)
      return unexpected(error::integer_overflow);

    auto block = alloc.allocate(sv.size() + 1, alignof(char));
    if (!block)
      return unexpected(error::allocation_failed);

    str.data_ = static_cast<char *>(block->ptr);
    std::memcpy(str.data_, sv.data(), sv.size());
    str.data_[sv.size()] = '\0';
    str.size_ = sv.size();
    str.cap_ = sv.size();
    return str;
  }

  static result<basic_string> try_create(std::string_view sv) noexcept {
    return try_allocate(get_default_allocator(), sv);
  }

  const char *c_str() const noexcept { return data_; }
  size_type size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }

  std::string_view view() const noexcept {
    return std::string_view(data_, size_);
  }

  operator std::string_view() const noexcept { return view(); }

  bool operator==(const basic_string &other) const noexcept {
    return view() == other.view();
  }

  bool operator==(std::string_view other) const noexcept {
    return view() == other;
  }

  allocator_type &get_allocator() const noexcept { return *alloc_; }

private:
  void release() noexcept {
    if (cap_ > 0 && data_ != &empty_char)
      alloc_->deallocate(data_, cap_ + 1);
    data_ = &empty_char;
    size_ = 0;
    cap_ = 0;
  }
};

using string = basic_string<>;

} // namespace namedvec
