#pragma once
#include <cstring>
#include <memory>
#include <namedvec/core.hpp>

namespace namedvec {

/**
 * @brief Bump allocator over a caller-provided buffer.
 * Individual frees are ignored; the whole arena is recycled with reset().
 * Useful to bound the memory a container may use and to observe how it
 * behaves once the arena is exhausted.
 */
class stack_allocator : public fallible_allocator {
public:
  stack_allocator(void *ptr, const std::size_t size) noexcept
      : buffer_(static_cast<std::byte *>(ptr)), capacity_(size) {}

  [[nodiscard]] result<mem_block>
  allocate(const std::size_t bytes,
           const std::size_t alignment) noexcept override {
    void *current_ptr = buffer_ + offset_;
    std::size_t space = capacity_ - offset_;
    void *aligned_ptr = std::align(alignment, bytes, current_ptr, space);
    if (!aligned_ptr) {
      return unexpected(error::allocation_failed);
    }
    offset_ = static_cast<std::byte *>(aligned_ptr) + bytes - buffer_;
    ++allocations_;
    return mem_block{aligned_ptr, bytes};
  }

  [[nodiscard]] result<std::size_t>
  expand_in_place(void *ptr, std::size_t old_size,
                  std::size_t new_size) noexcept override {
    // Only the most recent block can grow, by bumping the offset
    if (static_cast<std::byte *>(ptr) + old_size == buffer_ + offset_ &&
        new_size >= old_size) {
      const std::size_t added = new_size - old_size;
      if (offset_ + added <= capacity_) {
        offset_ += added;
        return new_size;
      }
    }
    return unexpected(error::in_place_growth_failed);
  }

  [[nodiscard]] result<mem_block>
  reallocate(void *ptr, std::size_t old_size, std::size_t new_size,
             std::size_t alignment) noexcept override {
    if (ptr) {
      if (new_size <= old_size)
        return mem_block{ptr, old_size};
      if (auto grown = expand_in_place(ptr, old_size, new_size); grown)
        return mem_block{ptr, *grown};
    }

    auto block = allocate(new_size, alignment);
    if (!block)
      return unexpected(block.error());
    if (ptr)
      std::memcpy(block->ptr, ptr, old_size);
    return block;
  }

  void deallocate(void *, std::size_t) noexcept override {}

  void reset() noexcept {
    offset_ = 0;
    allocations_ = 0;
  }

  std::size_t used() const noexcept { return offset_; }
  std::size_t allocations() const noexcept { return allocations_; }

private:
  std::byte *buffer_;
  std::size_t capacity_;
  std::size_t offset_ = 0;
  std::size_t allocations_ = 0;
};

} // namespace namedvec
