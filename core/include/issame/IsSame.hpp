#ifndef ISSAME_ISSAME_HPP
#define ISSAME_ISSAME_HPP

#include <algorithm>
#include <array>
#include <bit>
#include <complex>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <issame/meta/cow.hpp>
#include <issame/meta/utils.hpp>

namespace issame {

/**
 * @brief Customization point of the change-detection equivalence protocol.
 *
 * A specialization provides `constexpr bool operator()(const T& lhs, const U& rhs) const` deciding whether `rhs` is
 * observably identical to `lhs`, i.e. whether computations depending on `lhs` may be reused for `rhs`. Unlike
 * `operator==` this
 *  - compares floating-point values by their bit pattern (`NaN` is same as an identical `NaN`, `+0.0` is not same as `-0.0`),
 *  - compares shared-ownership handles by identity only, since data published through them is treated as immutable.
 *
 * Types without a specialization are not `Comparable`. User-defined aggregates obtain one via `ISSAME_DERIVE` or
 * `ISSAME_DERIVE_TUPLE` (see <issame/Derive.hpp>), or by specializing this template directly.
 */
template<typename T, typename U = T>
struct IsSame;

template<typename T, typename U = T>
concept Comparable = requires(const T& lhs, const U& rhs) {
    { IsSame<T, U>{}(lhs, rhs) } -> std::same_as<bool>;
};

template<typename T, typename U>
requires Comparable<T, U>
[[nodiscard]] constexpr bool is_same(const T& lhs, const U& rhs) noexcept(noexcept(IsSame<T, U>{}(lhs, rhs))) {
    return IsSame<T, U>{}(lhs, rhs);
}

/// always `!is_same(lhs, rhs)`, not customizable
template<typename T, typename U>
requires Comparable<T, U>
[[nodiscard]] constexpr bool is_not_same(const T& lhs, const U& rhs) noexcept(noexcept(IsSame<T, U>{}(lhs, rhs))) {
    return !is_same(lhs, rhs);
}

namespace detail {

template<typename T>
concept exact_scalar = std::integral<T> || std::is_enum_v<T>;

template<typename T>
concept bit_float = std::same_as<T, float> || std::same_as<T, double>;

template<typename T>
concept unit_type = std::same_as<T, std::monostate> || std::same_as<T, std::nullptr_t>;

template<bit_float T>
using float_bits_t = std::conditional_t<sizeof(T) == sizeof(std::uint32_t), std::uint32_t, std::uint64_t>;

static_assert(sizeof(float_bits_t<float>) == sizeof(float));
static_assert(sizeof(float_bits_t<double>) == sizeof(double));

template<bit_float T>
[[nodiscard]] constexpr float_bits_t<T> to_bits(T value) noexcept {
    return std::bit_cast<float_bits_t<T>>(value);
}

template<typename T>
concept growable_sequence = meta::is_instantiation_of<T, std::vector> || meta::is_instantiation_of<T, std::deque> || meta::is_instantiation_of<T, std::list> //
                            || meta::is_instantiation_of<T, std::basic_string> || meta::is_instantiation_of<T, std::basic_string_view>;

/// length first, then buffer identity (contiguous storage only), then element-wise with short-circuit
template<std::ranges::sized_range L, std::ranges::sized_range R>
[[nodiscard]] constexpr bool same_sequence(const L& lhs, const R& rhs) {
    if (std::ranges::size(lhs) != std::ranges::size(rhs)) {
        return false;
    }
    if constexpr (std::ranges::contiguous_range<const L> && std::ranges::contiguous_range<const R>) {
        if (static_cast<const void*>(std::ranges::data(lhs)) == static_cast<const void*>(std::ranges::data(rhs))) {
            return true;
        }
    }
    using Element = std::ranges::range_value_t<L>;
    if constexpr (exact_scalar<Element> && std::same_as<Element, std::ranges::range_value_t<R>>) {
        return std::ranges::equal(lhs, rhs);
    } else {
        auto right = std::ranges::begin(rhs);
        for (const auto& left : lhs) {
            if (is_not_same(left, *right)) {
                return false;
            }
            ++right;
        }
        return true;
    }
}

template<typename T, std::size_t N>
[[nodiscard]] constexpr bool same_fixed_elements(const T* lhs, const T* rhs) {
    for (std::size_t i = 0UZ; i < N; ++i) {
        if (is_not_same(lhs[i], rhs[i])) {
            return false;
        }
    }
    return true;
}

template<std::size_t I, typename T>
[[nodiscard]] constexpr decltype(auto) element(const T& obj) {
    if constexpr (requires { obj.template get<I>(); }) {
        return obj.template get<I>();
    } else {
        using std::get;
        return get<I>(obj);
    }
}

/// positional AND over tuple-like elements, short-circuits on the first not-same position
template<typename T, std::size_t... Is>
[[nodiscard]] constexpr bool same_elements(const T& lhs, const T& rhs, std::index_sequence<Is...>) {
    return (is_same(element<Is>(lhs), element<Is>(rhs)) && ...);
}

template<typename Compare, typename Key>
[[nodiscard]] constexpr bool equivalent_keys(const Compare& compare, const Key& lhs, const Key& rhs) {
    return !compare(lhs, rhs) && !compare(rhs, lhs);
}

template<typename T>
using cow_view_value_t = std::remove_cvref_t<typename meta::cow<T>::view_type>;

/// rebuilds `path` from its components without empty and interior "." elements, ".." and a leading "." are kept
[[nodiscard]] inline std::filesystem::path normalised_path(const std::filesystem::path& path) {
    std::filesystem::path normal;
    bool                  leading = true;
    for (const auto& element : path) {
        if (element.empty() || (element == "." && !leading)) { // "a/b/" ends in an empty element
            continue;
        }
        normal /= element;
        leading = false;
    }
    return normal;
}

} // namespace detail

// scalars //////////////

template<detail::exact_scalar T>
struct IsSame<T, T> {
    [[nodiscard]] constexpr bool operator()(T lhs, T rhs) const noexcept { return lhs == rhs; }
};

template<detail::unit_type T>
struct IsSame<T, T> {
    [[nodiscard]] constexpr bool operator()(const T&, const T&) const noexcept { return true; }
};

template<detail::bit_float T>
struct IsSame<T, T> {
    [[nodiscard]] constexpr bool operator()(T lhs, T rhs) const noexcept { return detail::to_bits(lhs) == detail::to_bits(rhs); }
};

template<meta::complex_like T>
struct IsSame<T, T> {
    [[nodiscard]] constexpr bool operator()(const T& lhs, const T& rhs) const noexcept { return is_same(lhs.real(), rhs.real()) && is_same(lhs.imag(), rhs.imag()); }
};

template<>
struct IsSame<std::type_index, std::type_index> {
    [[nodiscard]] bool operator()(const std::type_index& lhs, const std::type_index& rhs) const noexcept { return lhs == rhs; }
};

template<>
struct IsSame<std::type_info, std::type_info> {
    [[nodiscard]] bool operator()(const std::type_info& lhs, const std::type_info& rhs) const noexcept { return lhs == rhs; }
};

// pointers and handles //////////////

/**
 * Identity only: same iff both handles share the same control block and point at the same object. The pointee is
 * never inspected, shared data is assumed to be immutable once published.
 */
template<typename T>
struct IsSame<std::shared_ptr<T>, std::shared_ptr<T>> {
    [[nodiscard]] bool operator()(const std::shared_ptr<T>& lhs, const std::shared_ptr<T>& rhs) const noexcept { //
        return lhs.get() == rhs.get() && !lhs.owner_before(rhs) && !rhs.owner_before(lhs);
    }
};

template<typename T>
requires Comparable<std::remove_cv_t<T>>
struct IsSame<std::reference_wrapper<T>, std::reference_wrapper<T>> {
    [[nodiscard]] constexpr bool operator()(std::reference_wrapper<T> lhs, std::reference_wrapper<T> rhs) const {
        if (std::addressof(lhs.get()) == std::addressof(rhs.get())) {
            return true;
        }
        return is_same(lhs.get(), rhs.get());
    }
};

// character pointers are excluded: they would compare only the first character of a C string
template<typename T>
requires std::is_object_v<T> && (!meta::character_type<T>) && Comparable<std::remove_cv_t<T>>
struct IsSame<T*, T*> {
    [[nodiscard]] constexpr bool operator()(const T* lhs, const T* rhs) const {
        if (lhs == rhs) {
            return true;
        }
        if (lhs == nullptr || rhs == nullptr) {
            return false;
        }
        return is_same(*lhs, *rhs);
    }
};

template<typename T>
requires Comparable<T>
struct IsSame<std::optional<T>, std::optional<T>> {
    [[nodiscard]] constexpr bool operator()(const std::optional<T>& lhs, const std::optional<T>& rhs) const {
        if (lhs.has_value() != rhs.has_value()) {
            return false;
        }
        return !lhs.has_value() || is_same(*lhs, *rhs);
    }
};

// sequences //////////////

template<detail::growable_sequence T>
requires Comparable<std::ranges::range_value_t<T>>
struct IsSame<T, T> {
    [[nodiscard]] constexpr bool operator()(const T& lhs, const T& rhs) const { return detail::same_sequence(lhs, rhs); }
};

template<typename CharT, typename Traits, typename Allocator>
struct IsSame<std::basic_string<CharT, Traits, Allocator>, std::basic_string_view<CharT, Traits>> {
    [[nodiscard]] constexpr bool operator()(const std::basic_string<CharT, Traits, Allocator>& lhs, std::basic_string_view<CharT, Traits> rhs) const { return detail::same_sequence(lhs, rhs); }
};

template<typename CharT, typename Traits, typename Allocator>
struct IsSame<std::basic_string_view<CharT, Traits>, std::basic_string<CharT, Traits, Allocator>> {
    [[nodiscard]] constexpr bool operator()(std::basic_string_view<CharT, Traits> lhs, const std::basic_string<CharT, Traits, Allocator>& rhs) const { return detail::same_sequence(lhs, rhs); }
};

template<typename T, std::size_t Extent>
requires Comparable<std::remove_cv_t<T>>
struct IsSame<std::span<T, Extent>, std::span<T, Extent>> {
    [[nodiscard]] constexpr bool operator()(std::span<T, Extent> lhs, std::span<T, Extent> rhs) const { return detail::same_sequence(lhs, rhs); }
};

template<typename T, std::size_t N>
requires Comparable<T>
struct IsSame<std::array<T, N>, std::array<T, N>> {
    [[nodiscard]] constexpr bool operator()(const std::array<T, N>& lhs, const std::array<T, N>& rhs) const { return detail::same_fixed_elements<T, N>(lhs.data(), rhs.data()); }
};

template<typename T, std::size_t N>
requires Comparable<T>
struct IsSame<T[N], T[N]> {
    [[nodiscard]] constexpr bool operator()(const T (&lhs)[N], const T (&rhs)[N]) const { return detail::same_fixed_elements<T, N>(lhs, rhs); }
};

template<typename T>
requires Comparable<detail::cow_view_value_t<T>>
struct IsSame<meta::cow<T>, meta::cow<T>> {
    [[nodiscard]] constexpr bool operator()(const meta::cow<T>& lhs, const meta::cow<T>& rhs) const { return is_same(lhs.view(), rhs.view()); }
};

template<typename T, typename U>
requires(!meta::CowType<U>) && Comparable<detail::cow_view_value_t<T>, U>
struct IsSame<meta::cow<T>, U> {
    [[nodiscard]] constexpr bool operator()(const meta::cow<T>& lhs, const U& rhs) const { return is_same(lhs.view(), rhs); }
};

template<typename U, typename T>
requires(!meta::CowType<U>) && Comparable<U, detail::cow_view_value_t<T>>
struct IsSame<U, meta::cow<T>> {
    [[nodiscard]] constexpr bool operator()(const U& lhs, const meta::cow<T>& rhs) const { return is_same(lhs, rhs.view()); }
};

// associative containers //////////////

/**
 * Keys are paired in ascending order and matched with the map's own ordering (`key_comp()` equivalence), values are
 * matched with the full protocol.
 */
template<typename Key, typename Value, typename Compare, typename Allocator>
requires Comparable<Value>
struct IsSame<std::map<Key, Value, Compare, Allocator>, std::map<Key, Value, Compare, Allocator>> {
    using Map = std::map<Key, Value, Compare, Allocator>;

    [[nodiscard]] bool operator()(const Map& lhs, const Map& rhs) const {
        if (lhs.size() != rhs.size()) {
            return false;
        }
        const auto compare = lhs.key_comp();
        auto       right   = rhs.begin();
        for (const auto& [leftKey, leftValue] : lhs) {
            if (!detail::equivalent_keys(compare, leftKey, right->first) || is_not_same(leftValue, right->second)) {
                return false;
            }
            ++right;
        }
        return true;
    }
};

template<typename Key, typename Compare, typename Allocator>
struct IsSame<std::set<Key, Compare, Allocator>, std::set<Key, Compare, Allocator>> {
    using Set = std::set<Key, Compare, Allocator>;

    [[nodiscard]] bool operator()(const Set& lhs, const Set& rhs) const {
        if (lhs.size() != rhs.size()) {
            return false;
        }
        const auto compare = lhs.key_comp();
        return std::ranges::equal(lhs, rhs, [&compare](const Key& left, const Key& right) { return detail::equivalent_keys(compare, left, right); });
    }
};

template<typename Key, typename Value, typename Hash, typename KeyEqual, typename Allocator>
requires Comparable<Value>
struct IsSame<std::unordered_map<Key, Value, Hash, KeyEqual, Allocator>, std::unordered_map<Key, Value, Hash, KeyEqual, Allocator>> {
    using Map = std::unordered_map<Key, Value, Hash, KeyEqual, Allocator>;

    [[nodiscard]] bool operator()(const Map& lhs, const Map& rhs) const {
        // size check is required: the key scan below cannot see keys that exist only in rhs
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (const auto& [key, leftValue] : lhs) {
            const auto it = rhs.find(key);
            if (it == rhs.end() || is_not_same(leftValue, it->second)) {
                return false;
            }
        }
        return true;
    }
};

template<typename Key, typename Hash, typename KeyEqual, typename Allocator>
requires std::equality_comparable<Key>
struct IsSame<std::unordered_set<Key, Hash, KeyEqual, Allocator>, std::unordered_set<Key, Hash, KeyEqual, Allocator>> {
    [[nodiscard]] bool operator()(const std::unordered_set<Key, Hash, KeyEqual, Allocator>& lhs, const std::unordered_set<Key, Hash, KeyEqual, Allocator>& rhs) const { return lhs == rhs; }
};

// paths //////////////

template<typename U>
requires std::constructible_from<std::filesystem::path, const U&>
struct IsSame<std::filesystem::path, U> {
    [[nodiscard]] bool operator()(const std::filesystem::path& lhs, const U& rhs) const { //
        return detail::normalised_path(lhs) == detail::normalised_path(std::filesystem::path(rhs));
    }
};

// tuples //////////////

template<typename... Ts>
requires(Comparable<std::remove_cvref_t<Ts>> && ...)
struct IsSame<std::tuple<Ts...>, std::tuple<Ts...>> {
    [[nodiscard]] constexpr bool operator()(const std::tuple<Ts...>& lhs, const std::tuple<Ts...>& rhs) const { return detail::same_elements(lhs, rhs, std::index_sequence_for<Ts...>{}); }
};

template<typename First, typename Second>
requires Comparable<std::remove_cvref_t<First>> && Comparable<std::remove_cvref_t<Second>>
struct IsSame<std::pair<First, Second>, std::pair<First, Second>> {
    [[nodiscard]] constexpr bool operator()(const std::pair<First, Second>& lhs, const std::pair<First, Second>& rhs) const { return is_same(lhs.first, rhs.first) && is_same(lhs.second, rhs.second); }
};

} // namespace issame

#endif // ISSAME_ISSAME_HPP
