#pragma once
#include <concepts>
#include <namedvec/core.hpp>
#include <string_view>
#include <type_traits>
#include <utility>

namespace namedvec {

/**
 * @brief Types providing a static factory that uses the default allocator.
 * @return Must return a namedvec::result<T>.
 */
template <typename T, typename... Args>
concept has_try_create = requires(Args &&...args) {
  { T::try_create(std::forward<Args>(args)...) } -> std::same_as<result<T>>;
};

template <typename T>
concept has_try_clone = requires(const T &source) {
  { source.try_clone() } -> std::same_as<result<T>>;
};

// name() has to hand out a view of storage the object owns; a returned
// std::string temporary would dangle before the container could copy it.
template <typename R>
concept borrowed_name =
    std::is_lvalue_reference_v<R> ||
    std::same_as<std::remove_cv_t<R>, std::string_view> ||
    std::same_as<std::remove_cv_t<R>, const char *>;

/**
 * @brief Types that report their own name.
 * name() must be pure and must keep returning the same text for as long as
 * the object sits in a container keyed by it.
 */
template <typename T>
concept named = requires(const T &item) {
  { item.name() } -> std::convertible_to<std::string_view>;
} && borrowed_name<decltype(std::declval<const T &>().name())>;

/**
 * @brief Element requirements of named_vector: a name, and moves that
 * cannot fail so replacement and relocation never leave a hole.
 */
template <typename T>
concept named_element = named<T> && std::is_nothrow_move_constructible_v<T> &&
                        std::is_nothrow_move_assignable_v<T> &&
                        std::is_nothrow_destructible_v<T>;

} // namespace namedvec
