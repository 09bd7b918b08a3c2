#ifndef ISSAME_META_UTILS_HPP
#define ISSAME_META_UTILS_HPP

#include <complex>
#include <concepts>
#include <cstddef>
#include <iostream>
#include <iterator>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace issame::meta {

[[gnu::always_inline]] constexpr void precondition(bool cond, const std::source_location loc = std::source_location::current()) {
    if consteval {
        if (not cond) {
            std::unreachable();
        }
    } else {
        struct handle {
            [[noreturn]] static void failure(std::source_location const& location) {
                std::clog << "failed precondition in " << location.file_name() << ':' << location.line() << ':' << location.column() << ": `" << location.function_name() << "`\n";
                __builtin_trap();
            }
        };

        if (not cond) [[unlikely]] {
            handle::failure(loc);
        }
    }
}

/**
 * Compile-time string usable as a non-type template parameter. Only the subset needed for reflected
 * member names and compile-time type names is provided.
 */
template<std::size_t N, typename CharT = char>
struct fixed_string {
    CharT _data[N + 1UZ] = {};

    using value_type      = CharT;
    using const_pointer   = const value_type*;
    using reference       = value_type&;
    using const_reference = const value_type&;
    using size_type       = std::size_t;

    constexpr fixed_string() noexcept = default;

    template<std::size_t... Is>
    requires(sizeof...(Is) == N)
    constexpr fixed_string(std::index_sequence<Is...>, const CharT* txt) noexcept //
        : _data{txt[Is]..., '\0'} {}

    consteval fixed_string(const CharT (&txt)[N + 1]) noexcept //
        : fixed_string(std::make_index_sequence<N>(), txt) {}

    template<typename It, std::sentinel_for<It> S>
    constexpr fixed_string(It begin, S end) //
        : fixed_string(std::make_index_sequence<N>(), std::to_address(begin)) {
        precondition(static_cast<std::size_t>(std::distance(begin, end)) == N);
    }

    static constexpr std::integral_constant<size_type, N> size{};

    [[nodiscard]] static constexpr bool empty() noexcept { return N == 0; }

    [[nodiscard]] constexpr reference       operator[](size_type pos) { return _data[pos]; }
    [[nodiscard]] constexpr const_reference operator[](size_type pos) const { return _data[pos]; }

    [[nodiscard]] constexpr const_pointer    data() const noexcept { return _data; }
    [[nodiscard]] constexpr std::string_view view() const noexcept { return {_data, N}; }

    constexpr operator std::string_view() const noexcept { return {_data, N}; }

    [[nodiscard]] friend constexpr bool operator==(const fixed_string& lhs, const fixed_string& rhs) { return lhs.view() == rhs.view(); }

    template<std::size_t N2>
    requires(N2 != N)
    [[nodiscard]] friend constexpr bool operator==(const fixed_string&, const fixed_string<N2, CharT>&) {
        return false;
    }
};

template<typename CharT, std::size_t N>
fixed_string(const CharT (&str)[N]) -> fixed_string<N - 1, CharT>;

/**
 * Stores a compile-time string as a type rather than a value, so that it can be passed through function
 * parameters and converted to a never-dangling std::string_view.
 */
template<fixed_string S, typename T = std::remove_const_t<decltype(S)>> // T only enables ADL lookup of the fixed_string operators
class constexpr_string {
public:
    static constexpr auto value = S;

    using value_type = typename T::value_type;

    static constexpr auto size = S.size;

    constexpr operator T() const { return value; }

    [[nodiscard]] static constexpr bool empty() noexcept { return S.empty(); }

    [[nodiscard]] consteval const value_type* data() const noexcept { return value.data(); }

    [[nodiscard]] constexpr std::string_view view() const noexcept { return value.view(); }

    constexpr operator std::string_view() const noexcept { return value.view(); }
};

template<template<typename...> class Template, typename Class>
struct is_instantiation : std::false_type {};

template<template<typename...> class Template, typename... Args>
struct is_instantiation<Template, Template<Args...>> : std::true_type {};

template<typename Class, template<typename...> class Template>
concept is_instantiation_of = is_instantiation<Template, std::remove_cv_t<Class>>::value;

template<typename T>
concept complex_like = std::is_same_v<T, std::complex<float>> || std::is_same_v<T, std::complex<double>>;

template<typename T>
concept character_type = std::is_same_v<std::remove_cv_t<T>, char> || std::is_same_v<std::remove_cv_t<T>, wchar_t> || std::is_same_v<std::remove_cv_t<T>, char8_t> //
                         || std::is_same_v<std::remove_cv_t<T>, char16_t> || std::is_same_v<std::remove_cv_t<T>, char32_t>;

namespace detail {
template<typename... Ts>
std::true_type derives_from_variant(const std::variant<Ts...>*);

std::false_type derives_from_variant(const void*);
} // namespace detail

/// true for std::variant and for classes publicly deriving from one, i.e. types with alternative (sum) shape
template<typename T>
concept variant_like = std::is_class_v<T> && decltype(detail::derives_from_variant(static_cast<const T*>(nullptr)))::value;

} // namespace issame::meta

#endif // ISSAME_META_UTILS_HPP
