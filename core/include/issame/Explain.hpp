#ifndef ISSAME_EXPLAIN_HPP
#define ISSAME_EXPLAIN_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <issame/Derive.hpp>
#include <issame/IsSame.hpp>
#include <issame/meta/formatter.hpp>
#include <issame/meta/reflection.hpp>

#include <fmt/format.h>

namespace issame {

/**
 * @brief Why two values are not same.
 *
 * `path` locates the first differing part below the compared value, using `.field` for named record fields, `.N` for
 * positional fields and tuple elements, `[i]` for sequence elements, `[key]` for map values and `.value()` for
 * optionals. It is empty when the compared values themselves differ.
 */
struct Difference {
    std::string path;
    std::string message;
};

namespace detail {

template<typename T>
concept tuple_shaped = meta::is_instantiation_of<T, std::tuple> || meta::is_instantiation_of<T, std::pair> || (requires { IsSame<T, T>::shape; } && IsSame<T, T>::shape == Shape::Positional);

template<typename T>
concept indexed_sequence = growable_sequence<T> || meta::is_instantiation_of<T, std::vector> || std::is_array_v<T> || requires { std::tuple_size<T>::value; typename T::value_type; typename T::iterator; } // std::array
                           || requires { typename T::element_type; T::extent; };                                                                                                  // std::span

template<typename T>
[[nodiscard]] std::string describe_value(const T& value) {
    if constexpr (bit_float<T>) {
        return fmt::format("{} (bits {:#x})", value, to_bits(value));
    } else if constexpr (meta::complex_like<T>) {
        return fmt::format("({} (bits {:#x}), {} (bits {:#x}))", value.real(), to_bits(value.real()), value.imag(), to_bits(value.imag()));
    } else if constexpr (std::is_enum_v<T>) {
        if (const auto name = magic_enum::enum_name(value); !name.empty()) {
            return std::string(name);
        }
        return fmt::format("{}({})", refl::type_name<T>, static_cast<std::underlying_type_t<T>>(value));
    } else if constexpr (meta::character_type<T> && !std::same_as<T, char>) {
        return fmt::format("U+{:04X}", static_cast<std::uint32_t>(value));
    } else if constexpr (std::is_convertible_v<const T&, std::string_view> && !std::is_pointer_v<T>) {
        return fmt::format("\"{}\"", std::string_view(value));
    } else if constexpr (meta::Formattable<T> && !std::is_pointer_v<T>) {
        return fmt::format("{}", value);
    } else {
        return fmt::format("<{}>", refl::type_name<T>);
    }
}

template<typename T, typename U>
[[nodiscard]] Difference describe(const T& lhs, const U& rhs, std::string path);

template<typename T, typename U>
[[nodiscard]] Difference leaf_difference(const T& lhs, const U& rhs, std::string path) {
    return {std::move(path), fmt::format("{} vs {}", describe_value(lhs), describe_value(rhs))};
}

template<typename T>
[[nodiscard]] Difference size_difference(const T& lhs, const T& rhs, std::string path) {
    return {std::move(path), fmt::format("size mismatch: {} vs {} elements", std::size(lhs), std::size(rhs))};
}

/// first not-same position of a derived record or tuple-like value; the values are known to differ
template<typename T, typename Get, typename Name, std::size_t... Is>
[[nodiscard]] Difference first_differing_field(const T& lhs, const T& rhs, const std::string& path, Get&& get, Name&& name, std::index_sequence<Is...>) {
    std::optional<Difference> result;
    const auto                check = [&](auto index) {
        if (is_not_same(get(lhs, index), get(rhs, index))) {
            result = describe(get(lhs, index), get(rhs, index), fmt::format("{}.{}", path, name(index)));
            return true;
        }
        return false;
    };
    static_cast<void>((check(refl::detail::ic<Is>) || ...));
    if (result) {
        return *std::move(result);
    }
    return {path, fmt::format("values of type {} differ", refl::type_name<T>)};
}

template<typename T, typename U>
Difference describe(const T& lhs, const U& rhs, std::string path) {
    if constexpr (!std::same_as<T, U>) {
        if constexpr (meta::CowType<T>) {
            return describe(lhs.view(), rhs, std::move(path));
        } else if constexpr (meta::CowType<U>) {
            return describe(lhs, rhs.view(), std::move(path));
        } else if constexpr (std::same_as<T, std::filesystem::path>) {
            return {std::move(path), fmt::format("\"{}\" vs \"{}\"", normalised_path(lhs).string(), normalised_path(std::filesystem::path(rhs)).string())};
        } else {
            return leaf_difference(lhs, rhs, std::move(path));
        }
    } else if constexpr (derived_record<T>) {
        return first_differing_field(
            lhs, rhs, path, [](const T& obj, auto index) -> decltype(auto) { return refl::data_member<index>(obj); }, [](auto index) { return refl::data_member_name<T, index>.view(); }, std::make_index_sequence<refl::data_member_count<T>>());
    } else if constexpr (tuple_shaped<T>) {
        return first_differing_field(
            lhs, rhs, path, [](const T& obj, auto index) -> decltype(auto) { return element<index>(obj); }, [](auto index) { return std::size_t{index}; }, std::make_index_sequence<std::tuple_size_v<T>>());
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return leaf_difference(lhs, rhs, std::move(path));
    } else if constexpr (indexed_sequence<T>) {
        if (std::size(lhs) != std::size(rhs)) {
            return size_difference(lhs, rhs, std::move(path));
        }
        std::size_t index = 0UZ;
        auto        right = std::begin(rhs);
        for (const auto& left : lhs) {
            if (is_not_same(left, *right)) {
                return describe(left, *right, fmt::format("{}[{}]", path, index));
            }
            ++right;
            ++index;
        }
        return {std::move(path), fmt::format("values of type {} differ", refl::type_name<T>)};
    } else if constexpr (meta::is_instantiation_of<T, std::map>) {
        if (lhs.size() != rhs.size()) {
            return size_difference(lhs, rhs, std::move(path));
        }
        const auto  compare  = lhs.key_comp();
        std::size_t position = 0UZ;
        auto        right    = rhs.begin();
        for (const auto& [leftKey, leftValue] : lhs) {
            if (!equivalent_keys(compare, leftKey, right->first)) {
                return {std::move(path), fmt::format("key mismatch at position {}: {} vs {}", position, describe_value(leftKey), describe_value(right->first))};
            }
            if (is_not_same(leftValue, right->second)) {
                return describe(leftValue, right->second, fmt::format("{}[{}]", path, describe_value(leftKey)));
            }
            ++right;
            ++position;
        }
        return {std::move(path), fmt::format("values of type {} differ", refl::type_name<T>)};
    } else if constexpr (meta::is_instantiation_of<T, std::set>) {
        if (lhs.size() != rhs.size()) {
            return size_difference(lhs, rhs, std::move(path));
        }
        const auto  compare  = lhs.key_comp();
        std::size_t position = 0UZ;
        auto        right    = rhs.begin();
        for (const auto& left : lhs) {
            if (!equivalent_keys(compare, left, *right)) {
                return {std::move(path), fmt::format("key mismatch at position {}: {} vs {}", position, describe_value(left), describe_value(*right))};
            }
            ++right;
            ++position;
        }
        return {std::move(path), fmt::format("values of type {} differ", refl::type_name<T>)};
    } else if constexpr (meta::is_instantiation_of<T, std::unordered_map>) {
        if (lhs.size() != rhs.size()) {
            return size_difference(lhs, rhs, std::move(path));
        }
        for (const auto& [key, leftValue] : lhs) {
            const auto it = rhs.find(key);
            if (it == rhs.end()) {
                return {std::move(path), fmt::format("key {} missing in rhs", describe_value(key))};
            }
            if (is_not_same(leftValue, it->second)) {
                return describe(leftValue, it->second, fmt::format("{}[{}]", path, describe_value(key)));
            }
        }
        return {std::move(path), fmt::format("values of type {} differ", refl::type_name<T>)};
    } else if constexpr (meta::is_instantiation_of<T, std::unordered_set>) {
        if (lhs.size() != rhs.size()) {
            return size_difference(lhs, rhs, std::move(path));
        }
        for (const auto& key : lhs) {
            if (!rhs.contains(key)) {
                return {std::move(path), fmt::format("key {} missing in rhs", describe_value(key))};
            }
        }
        return {std::move(path), fmt::format("values of type {} differ", refl::type_name<T>)};
    } else if constexpr (meta::is_instantiation_of<T, std::optional>) {
        if (lhs.has_value() != rhs.has_value()) {
            return {std::move(path), lhs.has_value() ? "engaged vs empty" : "empty vs engaged"};
        }
        return describe(*lhs, *rhs, path + ".value()");
    } else if constexpr (meta::is_instantiation_of<T, std::shared_ptr>) {
        return {std::move(path), fmt::format("shared handles refer to different allocations ({} vs {})", meta::ptr(lhs.get()), meta::ptr(rhs.get()))};
    } else if constexpr (meta::is_instantiation_of<T, std::reference_wrapper>) {
        return describe(lhs.get(), rhs.get(), std::move(path));
    } else if constexpr (std::is_pointer_v<T>) {
        if (lhs == nullptr || rhs == nullptr) {
            return {std::move(path), fmt::format("{} vs {}", lhs == nullptr ? "null" : meta::ptr(lhs), rhs == nullptr ? "null" : meta::ptr(rhs))};
        }
        return describe(*lhs, *rhs, std::move(path));
    } else if constexpr (meta::CowType<T>) {
        return describe(lhs.view(), rhs.view(), std::move(path));
    } else if constexpr (std::same_as<T, std::filesystem::path>) {
        return {std::move(path), fmt::format("\"{}\" vs \"{}\"", normalised_path(lhs).string(), normalised_path(rhs).string())};
    } else if constexpr (std::same_as<T, std::type_index> || std::same_as<T, std::type_info>) {
        return {std::move(path), fmt::format("{} vs {}", lhs.name(), rhs.name())};
    } else {
        return leaf_difference(lhs, rhs, std::move(path));
    }
}

} // namespace detail

/**
 * Reports why `rhs` is not same as `lhs`. The verdict is always the one of `is_same`:
 * `explain(lhs, rhs).has_value() == is_same(lhs, rhs)`.
 *
 * \code
 * if (auto same = issame::explain(previous, current); !same) {
 *     fmt::println("recomputing, {}", same.error()); // e.g. "recomputing, .gains[2]: 1 (bits 0x3ff0000000000000) vs ..."
 * }
 * \endcode
 */
template<typename T, typename U>
requires Comparable<T, U>
[[nodiscard]] std::expected<void, Difference> explain(const T& lhs, const U& rhs) {
    if (is_same(lhs, rhs)) {
        return {};
    }
    return std::unexpected(detail::describe(lhs, rhs, std::string{}));
}

} // namespace issame

template<>
struct fmt::formatter<issame::Difference> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const issame::Difference& difference, FormatContext& ctx) const {
        if (difference.path.empty()) {
            return fmt::format_to(ctx.out(), "{}", difference.message);
        }
        return fmt::format_to(ctx.out(), "{}: {}", difference.path, difference.message);
    }
};

#endif // ISSAME_EXPLAIN_HPP
