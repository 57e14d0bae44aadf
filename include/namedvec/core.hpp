#pragma once
#include <cstddef>
#include <namedvec/expected.hpp>
#include <type_traits>

namespace namedvec {

enum class error : int {
  allocation_failed = 1,
  in_place_growth_failed,
  unsupported_operation,
  integer_overflow,
  out_of_range,
  out_of_bounds,
  invalid_argument,
  already_exists,
  container_empty,
  not_found
};

template <typename T> using result = expected<T, error>;

struct mem_block {
  void *ptr;
  std::size_t size;
};

class fallible_allocator {
public:
  virtual ~fallible_allocator() noexcept = default;

  [[nodiscard]] virtual result<mem_block>
  allocate(std::size_t bytes, std::size_t alignment) noexcept = 0;

  [[nodiscard]] virtual result<std::size_t>
  expand_in_place(void *ptr, std::size_t old_size,
                  std::size_t new_size) noexcept = 0;

  // Grows or shrinks a block. On failure the original block stays valid.
  [[nodiscard]] virtual result<mem_block>
  reallocate(void *ptr, std::size_t old_size, std::size_t new_size,
             std::size_t alignment) noexcept = 0;

  virtual void deallocate(void *ptr, std::size_t bytes) noexcept = 0;
};

// Only trivially copyable types are bitwise relocatable by default.
// Specialize for types that survive a memcpy to a new address.
template <typename T> struct is_relocatable : std::is_trivially_copyable<T> {};

} // namespace namedvec
