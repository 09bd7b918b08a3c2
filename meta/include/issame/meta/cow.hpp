#ifndef ISSAME_META_COW_HPP
#define ISSAME_META_COW_HPP

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace issame::meta {

/**
 * Describes how a cow<T> borrows: what it stores while borrowing and which view it hands out in both states.
 * Strings borrow as std::basic_string_view, vectors as std::span<const E>, everything else as a const reference.
 */
template<typename T>
struct cow_traits {
    using borrowed_type = std::reference_wrapper<const T>;
    using view_type     = const T&;

    static constexpr view_type as_view(const borrowed_type& borrowed) noexcept { return borrowed.get(); }
    static constexpr view_type as_view(const T& owned) noexcept { return owned; }
    static constexpr T         to_owned(const borrowed_type& borrowed) { return borrowed.get(); }
};

template<typename CharT, typename Traits, typename Allocator>
struct cow_traits<std::basic_string<CharT, Traits, Allocator>> {
    using owned_type    = std::basic_string<CharT, Traits, Allocator>;
    using borrowed_type = std::basic_string_view<CharT, Traits>;
    using view_type     = borrowed_type;

    static constexpr view_type  as_view(const borrowed_type& borrowed) noexcept { return borrowed; }
    static constexpr view_type  as_view(const owned_type& owned) noexcept { return owned; }
    static constexpr owned_type to_owned(const borrowed_type& borrowed) { return owned_type(borrowed); }
};

template<typename E, typename Allocator>
struct cow_traits<std::vector<E, Allocator>> {
    using owned_type    = std::vector<E, Allocator>;
    using borrowed_type = std::span<const E>;
    using view_type     = borrowed_type;

    static constexpr view_type  as_view(const borrowed_type& borrowed) noexcept { return borrowed; }
    static constexpr view_type  as_view(const owned_type& owned) noexcept { return owned; }
    static constexpr owned_type to_owned(const borrowed_type& borrowed) { return owned_type(borrowed.begin(), borrowed.end()); }
};

// Borrowed-or-owned holder: starts out either borrowing (lvalue or view) or owning (rvalue),
// clones into the owned state on the first mutable access.
template<typename T>
class cow {
    static_assert(std::is_same_v<T, std::remove_cvref_t<T>>, "T needs to be a value type");
    static_assert(std::is_copy_constructible_v<T>, "T needs to be copy-constructible");

public:
    using value_type    = T;
    using traits_type   = cow_traits<T>;
    using borrowed_type = typename traits_type::borrowed_type;
    using view_type     = typename traits_type::view_type;

private:
    std::variant<borrowed_type, T> _value;

public:
    constexpr cow(borrowed_type borrowed) noexcept : _value(std::in_place_index<0>, borrowed) {}

    constexpr cow(T&& owned) : _value(std::in_place_index<1>, std::move(owned)) {}

    [[nodiscard]] constexpr bool is_borrowed() const noexcept { return _value.index() == 0; }
    [[nodiscard]] constexpr bool is_owned() const noexcept { return _value.index() == 1; }

    [[nodiscard]] constexpr view_type view() const noexcept {
        if (is_borrowed()) {
            return traits_type::as_view(std::get<0>(_value));
        }
        return traits_type::as_view(std::get<1>(_value));
    }

    constexpr T& to_mut() {
        if (is_borrowed()) {
            T owned = traits_type::to_owned(std::get<0>(_value));
            _value.template emplace<1>(std::move(owned));
        }
        return std::get<1>(_value);
    }

    [[nodiscard]] constexpr T into_owned() && {
        if (is_borrowed()) {
            return traits_type::to_owned(std::get<0>(_value));
        }
        return std::move(std::get<1>(_value));
    }
};

template<typename T>
struct is_cow : std::false_type {};

template<typename T>
struct is_cow<cow<T>> : std::true_type {};

template<typename T>
concept CowType = is_cow<T>::value;

} // namespace issame::meta

#endif // ISSAME_META_COW_HPP
