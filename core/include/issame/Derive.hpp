#ifndef ISSAME_DERIVE_HPP
#define ISSAME_DERIVE_HPP

#include <concepts>
#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include <issame/IsSame.hpp>
#include <issame/meta/reflection.hpp>
#include <issame/meta/utils.hpp>

#include <fmt/format.h>

#ifdef __GNUC__
#pragma GCC diagnostic push // ignore warnings of external libraries that from this lib-context we do not have any control over
#ifndef __clang__
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
#pragma GCC diagnostic ignored "-Wsign-conversion"
#endif
#include <magic_enum.hpp>
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

/**
 * Derives the equivalence protocol for the enclosing record: `is_same` becomes the AND, in declaration order, of
 * `is_same` over the listed fields and stops at the first field that is not same. Without fields every two instances
 * are same. Reflectable base classes contribute their fields first.
 *
 * \code
 * struct Settings {
 *     std::size_t count;
 *     std::string name;
 *     ISSAME_DERIVE(Settings, count, name);
 * };
 *
 * struct Marker {
 *     ISSAME_DERIVE(Marker);
 * };
 * \endcode
 *
 * Unions, classes deriving from std::variant and records that hold state but list no fields fail to compile with an
 * "unsupported aggregate shape" diagnostic. A record listing no fields may still inherit all of its state from a
 * reflectable base.
 */
#define ISSAME_DERIVE(T, ...)                                                                                                                                                        \
    ISSAME_MAKE_REFLECTABLE(T __VA_OPT__(, ) __VA_ARGS__);                                                                                                                           \
                                                                                                                                                                                     \
    static consteval bool issame_derive_check() {                                                                                                                                    \
        static_assert(::issame::detail::derivable_record<T>, "ISSAME_DERIVE(" #T "): unsupported aggregate shape, only records with named fields or without fields can be derived"); \
        static_assert(::issame::detail::holds_only_listed_state<T>(), "ISSAME_DERIVE(" #T "): unsupported aggregate shape, a record without listed fields must not hold state");  \
        return true;                                                                                                                                                                 \
    }                                                                                                                                                                                \
                                                                                                                                                                                     \
    using issame_derived_type = T

/**
 * Derives the equivalence protocol by position for a tuple-like type, i.e. one that specializes `std::tuple_size` and
 * provides `get<I>` as member or through ADL. Must be used at global namespace scope, like a `std::tuple_size`
 * specialization. Types with commas in their name need an alias.
 */
#define ISSAME_DERIVE_TUPLE(T)                                                                                                                                                                                  \
    template<>                                                                                                                                                                                                  \
    struct issame::IsSame<T, T> {                                                                                                                                                                               \
        static_assert(::issame::detail::positional_record<T>, "ISSAME_DERIVE_TUPLE(" #T "): unsupported aggregate shape, only tuple-like types providing std::tuple_size and get<I> can be derived by position"); \
                                                                                                                                                                                                                \
        static constexpr ::issame::Shape shape = ::issame::Shape::Positional;                                                                                                                                   \
                                                                                                                                                                                                                \
        [[nodiscard]] constexpr bool operator()(const T& lhs, const T& rhs) const {                                                                                                                             \
            return ::issame::detail::same_elements(lhs, rhs, std::make_index_sequence<::issame::detail::tuple_arity<T>>{});                                                                                     \
        }                                                                                                                                                                                                       \
    }

namespace issame {

enum class Shape { Named, Positional, Unit, Unsupported };

namespace detail {

template<typename T>
concept derivable_record = std::is_class_v<T> && !meta::variant_like<T>;

template<typename T>
consteval bool holds_only_listed_state() {
    if constexpr (T::issame_refl_data_member_count != 0UZ) {
        return true;
    } else if constexpr (std::is_void_v<refl::base_type<T>>) {
        return std::is_empty_v<T>;
    } else {
        return sizeof(T) == sizeof(refl::base_type<T>);
    }
}

template<typename T>
concept derived_record = requires { typename T::issame_derived_type; } && std::same_as<typename T::issame_derived_type, T>;

template<typename T, std::size_t I>
concept has_tuple_element = requires(const T& obj) { obj.template get<I>(); } || requires(const T& obj) { get<I>(obj); };

template<typename T>
concept has_tuple_size = requires {
    { std::tuple_size<T>::value } -> std::convertible_to<std::size_t>;
};

template<typename T>
inline constexpr std::size_t tuple_arity = 0UZ;

template<has_tuple_size T>
inline constexpr std::size_t tuple_arity<T> = std::tuple_size<T>::value;

template<typename T, typename Indices = std::make_index_sequence<tuple_arity<T>>>
inline constexpr bool all_tuple_elements = false;

template<typename T, std::size_t... Is>
inline constexpr bool all_tuple_elements<T, std::index_sequence<Is...>> = (has_tuple_element<T, Is> && ...);

template<typename T>
concept positional_record = std::is_class_v<T> && !meta::variant_like<T> && has_tuple_size<T> && all_tuple_elements<T>;

template<typename T>
consteval Shape shape_of_impl() {
    if constexpr (derived_record<T>) {
        return refl::data_member_count<T> == 0UZ ? Shape::Unit : Shape::Named;
    } else if constexpr (requires { IsSame<T, T>::shape; }) {
        return IsSame<T, T>::shape;
    } else {
        return Shape::Unsupported;
    }
}

} // namespace detail

/// how the protocol was derived for T; `Unsupported` also covers types with hand-written or built-in implementations
template<typename T>
inline constexpr Shape shape_of = detail::shape_of_impl<std::remove_cvref_t<T>>();

template<detail::derived_record T>
struct IsSame<T, T> {
    static constexpr Shape shape = refl::data_member_count<T> == 0UZ ? Shape::Unit : Shape::Named;

    [[nodiscard]] constexpr bool operator()(const T& lhs, const T& rhs) const {
        static_assert(T::issame_derive_check());
        return [&]<std::size_t... Is>(std::index_sequence<Is...>) { //
            return (is_same(refl::data_member<Is>(lhs), refl::data_member<Is>(rhs)) && ...);
        }(std::make_index_sequence<refl::data_member_count<T>>());
    }
};

/**
 * Building block for hand-written specializations: AND over the given members, short-circuiting on the first one
 * that is not same.
 *
 * \code
 * template<>
 * struct issame::IsSame<Cache, Cache> {
 *     bool operator()(const Cache& lhs, const Cache& rhs) const { return issame::same_members(lhs, rhs, &Cache::key, &Cache::version); }
 * };
 * \endcode
 */
template<typename T, typename... Members>
requires(std::is_member_object_pointer_v<Members> && ...)
[[nodiscard]] constexpr bool same_members(const T& lhs, const T& rhs, Members... members) {
    return (is_same(lhs.*members, rhs.*members) && ...);
}

} // namespace issame

template<>
struct fmt::formatter<issame::Shape> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(issame::Shape shape, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(magic_enum::enum_name(shape), ctx);
    }
};

#endif // ISSAME_DERIVE_HPP
