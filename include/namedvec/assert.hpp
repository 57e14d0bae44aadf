#pragma once
#include <cstdio>
#include <cstdlib>

#if defined(__clang__) || defined(__GNUC__)
#define NAMEDVEC_TRAP() __builtin_trap()
#elif defined(_MSC_VER)
#define NAMEDVEC_TRAP() __debugbreak()
#else
#define NAMEDVEC_TRAP() std::abort()
#endif

namespace namedvec {
// Invoked before the process traps on a failed assertion. Replace it to route
// the report somewhere other than stderr.
using assert_handler_t = void (*)(const char *expression, const char *file,
                                  int line, const char *message);

namespace detail {
inline void default_assert_handler(const char *expr, const char *file, int line,
                                   const char *msg) {
  std::fprintf(stderr,
               "[NAMEDVEC ASSERT] Failure: %s\nAt: %s:%d\nMessage: %s\n", expr,
               file, line, msg);
  std::fflush(stderr);
}

inline assert_handler_t &get_handler_ptr() {
  static assert_handler_t handler = default_assert_handler;
  return handler;
}
} // namespace detail

inline void set_assert_handler(assert_handler_t new_handler) {
  detail::get_handler_ptr() =
      new_handler ? new_handler : detail::default_assert_handler;
}

inline assert_handler_t get_assert_handler() {
  return detail::get_handler_ptr();
}
} // namespace namedvec

#if defined(NAMEDVEC_DISABLE_ASSERT)
#if defined(__clang__) || defined(__GNUC__)
#define NAMEDVEC_ASSERT(cond, ...)                                             \
  do {                                                                         \
    if (!(cond))                                                               \
      __builtin_unreachable();                                                 \
  } while (0)
#else
#define NAMEDVEC_ASSERT(cond, ...) (void)0
#endif
#else
#define NAMEDVEC_ASSERT(cond, ...)                                             \
  do {                                                                         \
    if (!(cond)) [[unlikely]] {                                                \
      ::namedvec::detail::get_handler_ptr()(#cond, __FILE__, __LINE__,         \
                                            "" __VA_ARGS__);                   \
      NAMEDVEC_TRAP();                                                         \
    }                                                                          \
  } while (0)
#endif

// Checks on the unsafe_* paths. Compiled out of release builds.
#if defined(NAMEDVEC_ENABLE_DEBUG_ASSERT) || !defined(NDEBUG)
#define NAMEDVEC_DEBUG_ASSERT(cond, ...) NAMEDVEC_ASSERT(cond, __VA_ARGS__)
#else
#define NAMEDVEC_DEBUG_ASSERT(cond, ...) (void)0
#endif
