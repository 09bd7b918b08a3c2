#ifndef ISSAME_META_REFLECTION_HPP
#define ISSAME_META_REFLECTION_HPP

#include <issame/meta/utils.hpp>

#include <concepts>
#include <cstddef>
#include <string_view>
#include <tuple>
#include <utility>

// recursive macro expansion, see https://www.scs.stanford.edu/~dm/blog/va-opt.html

#define ISSAME_REFL_PARENS ()

#define ISSAME_REFL_EXPAND(...)  ISSAME_REFL_EXPAND3(ISSAME_REFL_EXPAND3(ISSAME_REFL_EXPAND3(ISSAME_REFL_EXPAND3(__VA_ARGS__))))
#define ISSAME_REFL_EXPAND3(...) ISSAME_REFL_EXPAND2(ISSAME_REFL_EXPAND2(ISSAME_REFL_EXPAND2(ISSAME_REFL_EXPAND2(__VA_ARGS__))))
#define ISSAME_REFL_EXPAND2(...) ISSAME_REFL_EXPAND1(ISSAME_REFL_EXPAND1(ISSAME_REFL_EXPAND1(ISSAME_REFL_EXPAND1(__VA_ARGS__))))
#define ISSAME_REFL_EXPAND1(...) __VA_ARGS__

#define ISSAME_REFL_TO_STRINGS(...)         __VA_OPT__(ISSAME_REFL_EXPAND(ISSAME_REFL_TO_STRINGS_IMPL(__VA_ARGS__)))
#define ISSAME_REFL_TO_STRINGS_IMPL(x, ...) ::issame::meta::constexpr_string<#x>() __VA_OPT__(, ISSAME_REFL_TO_STRINGS_AGAIN ISSAME_REFL_PARENS(__VA_ARGS__))
#define ISSAME_REFL_TO_STRINGS_AGAIN()      ISSAME_REFL_TO_STRINGS_IMPL

#define ISSAME_REFL_COUNT_ARGS(...)         0 __VA_OPT__(+ISSAME_REFL_EXPAND(ISSAME_REFL_COUNT_ARGS_IMPL(__VA_ARGS__)))
#define ISSAME_REFL_COUNT_ARGS_IMPL(x, ...) 1 __VA_OPT__(+ISSAME_REFL_COUNT_ARGS_AGAIN ISSAME_REFL_PARENS(__VA_ARGS__))
#define ISSAME_REFL_COUNT_ARGS_AGAIN()      ISSAME_REFL_COUNT_ARGS_IMPL

/**
 * Makes the enclosing class reflectable: the listed data members become accessible by index, together with
 * their names. A reflectable base class contributes its members first.
 *
 * \code
 * struct Point {
 *     int x, y;
 *     ISSAME_MAKE_REFLECTABLE(Point, x, y);
 * };
 * static_assert(issame::refl::data_member_name<Point, 1> == "y");
 * \endcode
 */
#define ISSAME_MAKE_REFLECTABLE(T, ...)                                                                                                                                                   \
    friend void* issame_refl_determine_base_type(T const&, ...) { return nullptr; }                                                                                                       \
                                                                                                                                                                                          \
    template<std::derived_from<T> IssameRefl_U>                                                                                                                                           \
    requires(not std::is_same_v<IssameRefl_U, T>) and std::is_void_v<std::remove_pointer_t<decltype(issame_refl_determine_base_type(                                                      \
                 std::declval<::issame::refl::detail::make_dependent_t<IssameRefl_U, T>>(), 0))>>                                                                                        \
    friend T* issame_refl_determine_base_type(IssameRefl_U const&, int) {                                                                                                                 \
        return nullptr;                                                                                                                                                                   \
    }                                                                                                                                                                                     \
                                                                                                                                                                                          \
    template<std::derived_from<T> IssameRefl_U, typename IssameRefl_Not>                                                                                                                  \
    requires(not std::is_same_v<IssameRefl_U, T>) and (not std::derived_from<IssameRefl_Not, T>) and std::is_void_v<std::remove_pointer_t<decltype(issame_refl_determine_base_type(     \
                 std::declval<::issame::refl::detail::make_dependent_t<IssameRefl_U, T>>(), std::declval<IssameRefl_Not>()))>>                                                            \
    friend T* issame_refl_determine_base_type(IssameRefl_U const&, IssameRefl_Not const&) {                                                                                               \
        return nullptr;                                                                                                                                                                   \
    }                                                                                                                                                                                     \
                                                                                                                                                                                          \
    constexpr auto issame_refl_members_as_tuple() & { return std::tie(__VA_ARGS__); }                                                                                                     \
                                                                                                                                                                                          \
    constexpr auto issame_refl_members_as_tuple() const& { return std::tie(__VA_ARGS__); }                                                                                                \
                                                                                                                                                                                          \
    static constexpr std::integral_constant<std::size_t, ISSAME_REFL_COUNT_ARGS(__VA_ARGS__)> issame_refl_data_member_count{};                                                           \
                                                                                                                                                                                          \
    static constexpr auto issame_refl_data_member_names = std::tuple { ISSAME_REFL_TO_STRINGS(__VA_ARGS__) }

namespace issame::refl {

using std::size_t;

namespace detail {

template<typename T, typename U>
struct make_dependent {
    using type = U;
};

template<typename T, typename U>
using make_dependent_t = typename make_dependent<T, U>::type;

template<typename T>
concept class_type = std::is_class_v<T> || std::is_union_v<T>;

struct None {};

template<typename T, typename Excluding>
using find_base = std::remove_pointer_t<decltype(issame_refl_determine_base_type(std::declval<T>(), std::declval<Excluding>()))>;

template<typename T, typename Last = None>
struct base_type_impl {
    using type = void;
};

// Last == None: start of the search
template<class_type T>
struct base_type_impl<T, None> {
    using type = typename base_type_impl<T, std::remove_pointer_t<decltype(issame_refl_determine_base_type(std::declval<T>(), 0))>>::type;
};

// Last == void: no reflectable base
template<class_type T>
struct base_type_impl<T, void> {
    using type = void;
};

// no further base beyond Last: Last is the direct reflectable base
template<class_type T, class_type Last>
requires std::derived_from<T, Last> and std::is_void_v<find_base<T, Last>>
struct base_type_impl<T, Last> {
    using type = Last;
};

template<class_type T, class_type Last>
requires std::derived_from<T, Last> and (not std::is_void_v<find_base<T, Last>>)
struct base_type_impl<T, Last> {
    using type = typename base_type_impl<T, find_base<T, Last>>::type;
};

template<typename T>
constexpr typename base_type_impl<T>::type const& to_base_type(T const& obj) {
    return obj;
}

template<typename T>
constexpr typename base_type_impl<T>::type& to_base_type(T& obj) {
    return obj;
}

template<auto X>
inline constexpr std::integral_constant<std::remove_const_t<decltype(X)>, X> ic = {};

template<typename T>
consteval auto type_to_string(T*) {
#if defined(__GNUC__)
    // gcc: "... [with T = int]", clang: "... [T = int]"
    constexpr auto   fun      = __PRETTY_FUNCTION__;
    constexpr size_t fun_size = sizeof(__PRETTY_FUNCTION__) - 1;
    constexpr auto   range    = [&]() -> std::pair<size_t, size_t> {
        size_t begin = 0;
        while (begin < fun_size and fun[begin] != '=') {
            ++begin;
        }
        if (begin + 2 >= fun_size or fun[begin - 2] != 'T') {
            return {0, fun_size};
        }
        begin += 2; // skip '= '
        size_t length = 0;
        while (begin + length < fun_size and fun[begin + length] != ']' and fun[begin + length] != ';') {
            ++length;
        }
        return {begin, length};
    }();
#elif defined(_MSC_VER)
    // msvc: "auto __cdecl issame::refl::detail::type_to_string<int>(int *)"
    constexpr auto   fun      = __FUNCSIG__;
    constexpr size_t fun_size = sizeof(__FUNCSIG__) - 1;
    constexpr auto   range    = [&]() -> std::pair<size_t, size_t> {
        size_t begin = 0;
        while (begin < fun_size and fun[begin] != '<') {
            ++begin;
        }
        ++begin;
        for (std::string_view prefix : {"struct ", "class ", "union ", "enum "}) {
            if (std::string_view(fun + begin, prefix.size()) == prefix) {
                begin += prefix.size();
                break;
            }
        }
        size_t length = 0;
        while (begin + length < fun_size and fun[begin + length] != '(') {
            ++length;
        }
        return {begin, length - 1};
    }();
#else
#error "Compiler not supported."
#endif
    constexpr size_t offset = range.first;
    constexpr size_t size   = range.second;
    static_assert(offset + size <= fun_size);

    // normalise "a,b" to "a, b" so that names agree across compilers
    constexpr size_t missing_spaces = [&] {
        size_t count = 0;
        for (size_t i = offset; i + 1 < offset + size; ++i) {
            if (fun[i] == ',' and fun[i + 1] != ' ') {
                ++count;
            }
        }
        return count;
    }();
    if constexpr (missing_spaces == 0) {
        return ::issame::meta::fixed_string<size>(fun + offset, fun + offset + size);
    } else {
        ::issame::meta::fixed_string<size + missing_spaces> buf = {};
        for (size_t r = offset, w = 0; r < offset + size; ++w, ++r) {
            buf[w] = fun[r];
            if (fun[r] == ',' and fun[r + 1] != ' ') {
                buf[++w] = ' ';
            }
        }
        return buf;
    }
}
} // namespace detail

template<typename T>
concept reflectable = std::is_class_v<std::remove_cvref_t<T>> || std::is_union_v<std::remove_cvref_t<T>>;

template<typename T>
concept reflected = reflectable<T> and requires {
    { std::remove_cvref_t<T>::issame_refl_data_member_count } -> std::convertible_to<size_t>;
};

/// compile-time name of T, e.g. "int" or "ns::Record<int>"
template<typename T>
inline constexpr auto type_name = ::issame::meta::constexpr_string<detail::type_to_string(static_cast<T*>(nullptr))>();

#define ISSAME_SPECIALIZE_TYPE_NAME(T) \
    template<>                         \
    inline constexpr auto type_name<T> = ::issame::meta::constexpr_string<#T> {}

ISSAME_SPECIALIZE_TYPE_NAME(bool);
ISSAME_SPECIALIZE_TYPE_NAME(char);
ISSAME_SPECIALIZE_TYPE_NAME(wchar_t);
ISSAME_SPECIALIZE_TYPE_NAME(char8_t);
ISSAME_SPECIALIZE_TYPE_NAME(char16_t);
ISSAME_SPECIALIZE_TYPE_NAME(char32_t);
ISSAME_SPECIALIZE_TYPE_NAME(signed char);
ISSAME_SPECIALIZE_TYPE_NAME(unsigned char);
ISSAME_SPECIALIZE_TYPE_NAME(short);
ISSAME_SPECIALIZE_TYPE_NAME(unsigned short);
ISSAME_SPECIALIZE_TYPE_NAME(int);
ISSAME_SPECIALIZE_TYPE_NAME(unsigned int);
ISSAME_SPECIALIZE_TYPE_NAME(long);
ISSAME_SPECIALIZE_TYPE_NAME(unsigned long);
ISSAME_SPECIALIZE_TYPE_NAME(long long);
ISSAME_SPECIALIZE_TYPE_NAME(unsigned long long);
ISSAME_SPECIALIZE_TYPE_NAME(float);
ISSAME_SPECIALIZE_TYPE_NAME(double);
ISSAME_SPECIALIZE_TYPE_NAME(long double);
ISSAME_SPECIALIZE_TYPE_NAME(std::string);
ISSAME_SPECIALIZE_TYPE_NAME(std::string_view);

#undef ISSAME_SPECIALIZE_TYPE_NAME

template<typename T>
using base_type = typename detail::base_type_impl<T>::type;

template<typename T>
constexpr size_t data_member_count = 0;

template<reflected T>
requires std::is_void_v<base_type<T>>
constexpr size_t data_member_count<T> = T::issame_refl_data_member_count;

template<reflected T>
requires(not std::is_void_v<base_type<T>>)
constexpr size_t data_member_count<T> = T::issame_refl_data_member_count + data_member_count<base_type<T>>;

template<typename T, size_t Idx>
constexpr auto data_member_name = [] {
    static_assert(Idx < data_member_count<T>);
    return ::issame::meta::constexpr_string<"Error">();
}();

template<reflected T, size_t Idx>
requires(Idx < data_member_count<base_type<T>>)
constexpr auto data_member_name<T, Idx> = data_member_name<base_type<T>, Idx>;

template<reflected T, size_t Idx>
requires(Idx >= data_member_count<base_type<T>>) and (Idx < data_member_count<T>)
constexpr auto data_member_name<T, Idx> = std::get<Idx - data_member_count<base_type<T>>>(T::issame_refl_data_member_names);

template<size_t Idx>
constexpr decltype(auto) data_member(reflected auto&& obj) {
    using Class    = std::remove_cvref_t<decltype(obj)>;
    using BaseType = base_type<Class>;

    constexpr size_t base_size = data_member_count<BaseType>;

    if constexpr (Idx < base_size) {
        return data_member<Idx>(detail::to_base_type(obj));
    } else {
        return std::get<Idx - base_size>(obj.issame_refl_members_as_tuple());
    }
}

} // namespace issame::refl

#endif // ISSAME_META_REFLECTION_HPP
