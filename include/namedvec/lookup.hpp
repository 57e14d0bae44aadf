#pragma once
#include <concepts>
#include <cstddef>
#include <namedvec/assert.hpp>
#include <ostream>
#include <string_view>
#include <type_traits>

namespace namedvec {

/**
 * @brief Addresses an element of a named container either by name or by
 * position.
 *
 * Built implicitly from the argument at the call site, so
 * `v.try_get("foo")` and `v.try_get(0)` both work without naming this type.
 * Holds a view; it must not outlive the string it was built from.
 */
class lookup {
public:
  enum class kind : unsigned char { name, position };

  constexpr lookup(const char *name) noexcept
      : m_name(name ? std::string_view(name) : std::string_view()),
        m_kind(kind::name) {
    NAMEDVEC_ASSERT(name != nullptr, "lookup built from a null name");
  }

  template <typename S>
    requires(!std::is_integral_v<std::remove_cvref_t<S>> &&
             !std::is_convertible_v<const S &, const char *> &&
             std::is_convertible_v<const S &, std::string_view>)
  constexpr lookup(const S &name) noexcept
      : m_name(static_cast<std::string_view>(name)), m_kind(kind::name) {}

  template <std::integral I>
    requires(!std::is_same_v<I, bool> && !std::is_same_v<I, char>)
  constexpr lookup(I position) noexcept
      : m_position(static_cast<std::size_t>(position)),
        m_kind(kind::position) {
    if constexpr (std::is_signed_v<I>) {
      NAMEDVEC_ASSERT(position >= 0, "lookup built from a negative position");
    }
  }

  static constexpr lookup by_name(std::string_view name) noexcept {
    return lookup(name);
  }

  static constexpr lookup by_position(std::size_t position) noexcept {
    return lookup(position);
  }

  constexpr kind which() const noexcept { return m_kind; }
  constexpr bool is_name() const noexcept { return m_kind == kind::name; }
  constexpr bool is_position() const noexcept {
    return m_kind == kind::position;
  }

  constexpr std::string_view name() const noexcept {
    NAMEDVEC_ASSERT(is_name(), "lookup does not hold a name");
    return m_name;
  }

  constexpr std::size_t position() const noexcept {
    NAMEDVEC_ASSERT(is_position(), "lookup does not hold a position");
    return m_position;
  }

private:
  union {
    std::string_view m_name;
    std::size_t m_position;
  };
  kind m_kind;
};

inline std::ostream &operator<<(std::ostream &os, const lookup &key) {
  if (key.is_name())
    return os << '"' << key.name() << '"';
  return os << '#' << key.position();
}

} // namespace namedvec
