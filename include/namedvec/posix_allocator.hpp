#pragma once
#include <cstdlib>
#include <cstring>
#include <namedvec/core.hpp>

namespace namedvec {

class posix_allocator final : public fallible_allocator {
public:
  result<mem_block> allocate(std::size_t bytes,
                             std::size_t alignment) noexcept override {
    // posix_memalign wants a power of two no smaller than sizeof(void*)
    if (alignment < sizeof(void *))
      alignment = sizeof(void *);

    void *ptr = nullptr;
    if (::posix_memalign(&ptr, alignment, bytes) != 0) {
      return unexpected(error::allocation_failed);
    }
    return mem_block{ptr, bytes};
  }

  // The heap offers no portable way to grow a block without moving it.
  result<std::size_t> expand_in_place(void *, std::size_t,
                                      std::size_t) noexcept override {
    return unexpected(error::unsupported_operation);
  }

  result<mem_block> reallocate(void *ptr, std::size_t old_size,
                               std::size_t new_size,
                               std::size_t alignment) noexcept override {
    if (!ptr)
      return allocate(new_size, alignment);

    if (alignment <= alignof(std::max_align_t)) {
      void *new_ptr = ::realloc(ptr, new_size);
      if (!new_ptr)
        return unexpected(error::allocation_failed);
      return mem_block{new_ptr, new_size};
    }

    // realloc does not preserve over-alignment
    if (new_size <= old_size)
      return mem_block{ptr, old_size};

    auto new_block_res = allocate(new_size, alignment);
    if (!new_block_res)
      return unexpected(error::allocation_failed);

    void *new_ptr = new_block_res->ptr;
    std::memcpy(new_ptr, ptr, old_size);
    ::free(ptr);

    return mem_block{new_ptr, new_size};
  }

  void deallocate(void *ptr, std::size_t) noexcept override { ::free(ptr); }
};

} // namespace namedvec
