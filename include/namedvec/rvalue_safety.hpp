#pragma once
#include <cstddef>

namespace namedvec {

/**
 * @def NAMEDVEC_BLOCK_RVALUE_ACCESS
 * @brief Deletes the rvalue overloads of the common accessors.
 * Without it a reference into a temporary container compiles silently:
 * @code
 * auto &ref = (*helper.allocate_array<int>(5))[0]; // array is a temporary
 * @endcode
 * With it the compiler forces the container into an lvalue first. Every
 * accessor the class declares under one of these names must carry a & or
 * const & qualifier.
 * @param Type The underlying element type (e.g., T).
 */
#define NAMEDVEC_BLOCK_RVALUE_ACCESS(Type)                                     \
  /** @name Rvalue Safety Guards */                                            \
  /** @{ */                                                                    \
  Type &operator[](std::size_t) const && = delete;                             \
  auto front() const && = delete;                                              \
  auto back() const && = delete;                                               \
  auto at(std::size_t) const && = delete;                                      \
  auto try_at(std::size_t) const && = delete;                                  \
  auto unsafe_at(std::size_t) const && = delete;                               \
  auto begin() const && = delete;                                              \
  auto end() const && = delete;                                                \
  auto unsafe_get() const && = delete;                                         \
  /** @} */

/**
 * @def NAMEDVEC_BLOCK_RVALUE_KEYED_ACCESS
 * @brief Same guard for containers addressed by a key type rather than a
 * plain position, including their positional range views.
 * @param Type The underlying element type.
 * @param Key The key accepted by operator[], at() and try_get().
 */
#define NAMEDVEC_BLOCK_RVALUE_KEYED_ACCESS(Type, Key)                          \
  /** @name Rvalue Safety Guards */                                            \
  /** @{ */                                                                    \
  Type &operator[](Key) const && = delete;                                     \
  auto at(Key) const && = delete;                                              \
  auto try_get(Key) const && = delete;                                         \
  auto begin() const && = delete;                                              \
  auto end() const && = delete;                                                \
  auto as_span() const && = delete;                                            \
  auto slice(std::size_t, std::size_t) const && = delete;                      \
  auto slice_from(std::size_t) const && = delete;                              \
  auto slice_to(std::size_t) const && = delete;                                \
  auto try_slice(std::size_t, std::size_t) const && = delete;                  \
  /** @} */

} // namespace namedvec
