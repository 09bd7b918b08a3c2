#include <boost/ut.hpp>

#include <filesystem>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include <issame/Explain.hpp>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace issame::test {

enum class Mode { Fast, Exact };

struct Settings {
    double              gain;
    std::vector<double> taps;

    ISSAME_DERIVE(Settings, gain, taps);
};

struct FilterSettings : Settings {
    std::string name;
    Mode        mode;

    ISSAME_DERIVE(FilterSettings, name, mode);
};

template<typename T, typename U>
bool agrees(const T& lhs, const U& rhs) {
    return issame::explain(lhs, rhs).has_value() == issame::is_same(lhs, rhs);
}

const boost::ut::suite<"explain leaves"> leafTests = [] {
    using namespace boost::ut;

    "same values have no difference"_test = [] {
        expect(issame::explain(1, 1).has_value());
        expect(issame::explain("abc"s, "abc"sv).has_value());
        expect(issame::explain(std::vector{1.0, 2.0}, std::vector{1.0, 2.0}).has_value());
    };

    "scalars"_test = [] {
        const auto result = issame::explain(1, 2);
        expect(!result.has_value());
        expect(eq(result.error().path, ""s));
        expect(eq(result.error().message, "1 vs 2"s));
    };

    "floats print value and bits"_test = [] {
        const auto result = issame::explain(0.0, -0.0);
        expect(!result.has_value());
        expect(eq(result.error().message, "0 (bits 0x0) vs -0 (bits 0x8000000000000000)"s));
        expect(eq(issame::explain(1.0f, 2.0f).error().message, "1 (bits 0x3f800000) vs 2 (bits 0x40000000)"s));
    };

    "enumerations print enumerator names"_test = [] { expect(eq(issame::explain(Mode::Fast, Mode::Exact).error().message, "Fast vs Exact"s)); };

    "characters and strings"_test = [] {
        expect(eq(issame::explain(U'a', U'b').error().message, "U+0061 vs U+0062"s));
        expect(eq(issame::explain("abc"s, "abd"s).error().message, R"("abc" vs "abd")"s));
        expect(eq(issame::explain("abc"s, "ab"sv).error().message, R"("abc" vs "ab")"s));
    };

    "shared handles print addresses"_test = [] {
        const auto result = issame::explain(std::make_shared<int>(1), std::make_shared<int>(1));
        expect(!result.has_value());
        expect(result.error().message.starts_with("shared handles refer to different allocations (0x"));
    };

    "paths print their compared components"_test = [] {
        expect(eq(issame::explain(std::filesystem::path("a/./b/"), std::filesystem::path("a/c")).error().message, R"("a/b" vs "a/c")"s));
        expect(eq(issame::explain(std::filesystem::path("a/c/../b"), std::filesystem::path("a/b")).error().message, R"("a/c/../b" vs "a/b")"s));
        expect(eq(issame::explain(std::filesystem::path("./a"), "a"s).error().message, R"("./a" vs "a")"s));
    };

    "copy-on-write compares through its view"_test = [] {
        const meta::cow<std::string> owned("abc"s);
        expect(eq(issame::explain(owned, "abd"sv).error().message, R"("abc" vs "abd")"s));
    };
};

const boost::ut::suite<"explain paths"> pathTests = [] {
    using namespace boost::ut;

    "sequence size"_test = [] {
        const auto result = issame::explain(std::vector{1, 2, 3}, std::vector{1, 2});
        expect(eq(result.error().path, ""s));
        expect(eq(result.error().message, "size mismatch: 3 vs 2 elements"s));
    };

    "sequence element"_test = [] {
        const auto result = issame::explain(std::vector{1, 2, 3}, std::vector{1, 3, 2});
        expect(eq(result.error().path, "[1]"s));
        expect(eq(result.error().message, "2 vs 3"s));
    };

    "named record fields"_test = [] {
        const FilterSettings left{{1.0, {1.0, 2.0}}, "lowpass", Mode::Fast};
        expect(issame::explain(left, left).has_value());
        expect(eq(issame::explain(left, FilterSettings{{1.0, {1.0, 2.0}}, "highpass", Mode::Fast}).error().path, ".name"s));
        expect(eq(issame::explain(left, FilterSettings{{1.0, {1.0, 2.0}}, "lowpass", Mode::Exact}).error().path, ".mode"s));

        const auto nested = issame::explain(left, FilterSettings{{1.0, {1.0, 3.0}}, "lowpass", Mode::Fast});
        expect(eq(nested.error().path, ".taps[1]"s));
        expect(eq(nested.error().message, "2 (bits 0x4000000000000000) vs 3 (bits 0x4008000000000000)"s));
    };

    "first differing field wins"_test = [] {
        const auto result = issame::explain(FilterSettings{{1.0, {}}, "a", Mode::Fast}, FilterSettings{{2.0, {}}, "b", Mode::Exact});
        expect(eq(result.error().path, ".gain"s));
    };

    "tuple positions"_test = [] {
        const auto result = issame::explain(std::tuple{1, 2, "baz"sv}, std::tuple{1, 3, "baz"sv});
        expect(eq(result.error().path, ".1"s));
        expect(eq(result.error().message, "2 vs 3"s));
        expect(eq(issame::explain(std::tuple{1, std::vector{1, 2}}, std::tuple{1, std::vector{0, 2}}).error().path, ".1[0]"s));
    };

    "ordered map"_test = [] {
        const std::map<std::string, int> values{{"x", 1}, {"y", 2}};
        expect(eq(issame::explain(values, std::map<std::string, int>{{"x", 1}, {"y", 3}}).error().path, R"(["y"])"s));

        const auto keys = issame::explain(values, std::map<std::string, int>{{"x", 1}, {"z", 2}});
        expect(eq(keys.error().path, ""s));
        expect(eq(keys.error().message, R"(key mismatch at position 1: "y" vs "z")"s));

        expect(eq(issame::explain(values, std::map<std::string, int>{{"x", 1}}).error().message, "size mismatch: 2 vs 1 elements"s));
    };

    "unordered map"_test = [] {
        const std::unordered_map<std::string, int> values{{"a", 1}, {"b", 2}};
        expect(eq(issame::explain(values, std::unordered_map<std::string, int>{{"a", 1}, {"c", 2}}).error().message, R"(key "b" missing in rhs)"s));
        expect(eq(issame::explain(values, std::unordered_map<std::string, int>{{"a", 1}, {"b", 5}}).error().path, R"(["b"])"s));
    };

    "optional"_test = [] {
        expect(eq(issame::explain(std::optional<int>{1}, std::optional<int>{}).error().message, "engaged vs empty"s));
        expect(eq(issame::explain(std::optional<int>{}, std::optional<int>{1}).error().message, "empty vs engaged"s));
        const auto inner = issame::explain(std::optional<int>{1}, std::optional<int>{2});
        expect(eq(inner.error().path, ".value()"s));
        expect(eq(inner.error().message, "1 vs 2"s));
    };
};

const boost::ut::suite<"explain verdict"> verdictTests = [] {
    using namespace boost::ut;

    "agrees with is_same"_test = [] {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        expect(agrees(nan, nan));
        expect(agrees(0.0, -0.0));
        expect(agrees(std::vector{1, 2}, std::vector{1, 2}));
        expect(agrees(std::vector{1, 2}, std::vector{2, 1}));
        expect(agrees(std::optional<double>{nan}, std::optional<double>{nan}));
        expect(agrees(Settings{1.0, {nan}}, Settings{1.0, {nan}}));
        expect(agrees(Settings{1.0, {0.0}}, Settings{1.0, {-0.0}}));
        const auto handle = std::make_shared<int>(1);
        expect(agrees(handle, handle));
        expect(agrees(handle, std::make_shared<int>(1)));
    };

    "formatting"_test = [] {
        expect(eq(fmt::format("{}", issame::explain(std::vector{1, 2}, std::vector{1, 3}).error()), "[1]: 2 vs 3"s));
        expect(eq(fmt::format("{}", issame::explain(1, 2).error()), "1 vs 2"s));
    };
};

} // namespace issame::test

int main() { /* tests are statically executed */ }
