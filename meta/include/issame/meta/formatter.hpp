#ifndef ISSAME_META_FORMATTER_HPP
#define ISSAME_META_FORMATTER_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <issame/meta/utils.hpp>

namespace issame::meta {

template<typename T>
[[nodiscard]] std::string ptr(const T* p) {
    return fmt::format("{:#x}", reinterpret_cast<std::uintptr_t>(p));
}

template<typename T>
concept Formattable = fmt::is_formattable<T, char>::value;

} // namespace issame::meta

template<std::size_t N>
struct fmt::formatter<issame::meta::fixed_string<N>> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const issame::meta::fixed_string<N>& str, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(str.view(), ctx);
    }
};

template<issame::meta::fixed_string S, typename T>
struct fmt::formatter<issame::meta::constexpr_string<S, T>> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const issame::meta::constexpr_string<S, T>& str, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(str.view(), ctx);
    }
};

#endif // ISSAME_META_FORMATTER_HPP
