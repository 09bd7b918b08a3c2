#include <boost/ut.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <fmt/format.h>

#include <issame/Derive.hpp>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace issame::test {

struct MyCustomType {
    std::size_t foo;
    std::string bar;
    char32_t    baz;

    ISSAME_DERIVE(MyCustomType, foo, bar, baz);
};

struct MyUnitStruct {
    ISSAME_DERIVE(MyUnitStruct);
};

class MyTupleStruct {
    std::size_t      _count;
    std::string_view _name;

public:
    constexpr MyTupleStruct(std::size_t count, std::string_view name) : _count(count), _name(name) {}

    template<std::size_t I>
    [[nodiscard]] constexpr const auto& get() const {
        if constexpr (I == 0) {
            return _count;
        } else {
            return _name;
        }
    }

    constexpr void increment() { ++_count; }
};

struct Settings {
    double              gain;
    std::vector<double> taps;

    ISSAME_DERIVE(Settings, gain, taps);
};

struct FilterSettings : Settings {
    std::string                  name;
    std::shared_ptr<const float> window;

    ISSAME_DERIVE(FilterSettings, name, window);
};

struct TunedSettings : Settings {
    ISSAME_DERIVE(TunedSettings);
};

// counts member comparisons to observe short-circuiting
struct Counted {
    int         value;
    static int& comparisons() {
        static int count = 0;
        return count;
    }
};

struct CountedRecord {
    int     first;
    Counted second;

    ISSAME_DERIVE(CountedRecord, first, second);
};

class CountedPosition {
    int     _first;
    Counted _second;

public:
    CountedPosition(int first, Counted second) : _first(first), _second(second) {}

    template<std::size_t I>
    [[nodiscard]] const auto& get() const {
        if constexpr (I == 0) {
            return _first;
        } else {
            return _second;
        }
    }
};

template<typename T>
struct Tagged {
    T           value;
    std::string tag;

    ISSAME_DERIVE(Tagged, value, tag);
};

struct Cache {
    std::string key;
    int         version;
    int         hits; // bookkeeping, not part of the identity
};

} // namespace issame::test

template<>
struct issame::IsSame<issame::test::Counted, issame::test::Counted> {
    bool operator()(const issame::test::Counted& lhs, const issame::test::Counted& rhs) const {
        ++issame::test::Counted::comparisons();
        return lhs.value == rhs.value;
    }
};

template<>
struct std::tuple_size<issame::test::MyTupleStruct> : std::integral_constant<std::size_t, 2> {};

template<std::size_t I>
struct std::tuple_element<I, issame::test::MyTupleStruct> {
    using type = std::remove_cvref_t<decltype(std::declval<const issame::test::MyTupleStruct&>().template get<I>())>;
};

ISSAME_DERIVE_TUPLE(issame::test::MyTupleStruct);

template<>
struct std::tuple_size<issame::test::CountedPosition> : std::integral_constant<std::size_t, 2> {};

template<std::size_t I>
struct std::tuple_element<I, issame::test::CountedPosition> {
    using type = std::remove_cvref_t<decltype(std::declval<const issame::test::CountedPosition&>().template get<I>())>;
};

ISSAME_DERIVE_TUPLE(issame::test::CountedPosition);

template<>
struct issame::IsSame<issame::test::Cache, issame::test::Cache> {
    bool operator()(const issame::test::Cache& lhs, const issame::test::Cache& rhs) const { return issame::same_members(lhs, rhs, &issame::test::Cache::key, &issame::test::Cache::version); }
};

namespace issame::test {

const boost::ut::suite<"named records"> namedRecordTests = [] {
    using namespace boost::ut;

    "field-wise comparison"_test = [] {
        const MyCustomType left{2, "asdf", U'a'};
        MyCustomType       right{2, "asdf", U'a'};
        expect(issame::is_same(left, right));
        right.foo += 1;
        expect(issame::is_not_same(left, right));
    };

    "every field counts"_test = [] {
        const MyCustomType left{2, "asdf", U'a'};
        expect(issame::is_not_same(left, MyCustomType{2, "asdg", U'a'}));
        expect(issame::is_not_same(left, MyCustomType{2, "asdf", U'b'})) << "difference in the last field";
    };

    "fields use the full protocol"_test = [] {
        expect(issame::is_not_same(Settings{0.0, {}}, Settings{-0.0, {}}));
        expect(issame::is_same(Settings{1.0, {1.0, 2.0}}, Settings{1.0, {1.0, 2.0}}));
        expect(issame::is_not_same(Settings{1.0, {1.0, 2.0}}, Settings{1.0, {1.0}}));
    };

    "short-circuits on the first differing field"_test = [] {
        Counted::comparisons() = 0;
        expect(issame::is_not_same(CountedRecord{1, {5}}, CountedRecord{2, {5}}));
        expect(eq(Counted::comparisons(), 0));
        expect(issame::is_same(CountedRecord{1, {5}}, CountedRecord{1, {5}}));
        expect(eq(Counted::comparisons(), 1));
    };

    "reflectable bases contribute their fields first"_test = [] {
        auto                 window = std::make_shared<const float>(0.5f);
        const FilterSettings left{{1.0, {1.0}}, "lowpass", window};
        expect(issame::is_same(left, FilterSettings{{1.0, {1.0}}, "lowpass", window}));
        expect(issame::is_not_same(left, FilterSettings{{2.0, {1.0}}, "lowpass", window})) << "base field";
        expect(issame::is_not_same(left, FilterSettings{{1.0, {1.0}}, "highpass", window}));
        expect(issame::is_not_same(left, FilterSettings{{1.0, {1.0}}, "lowpass", std::make_shared<const float>(0.5f)})) << "handles compare by identity";
    };

    "class templates"_test = [] {
        expect(issame::is_same(Tagged<int>{1, "x"}, Tagged<int>{1, "x"}));
        expect(issame::is_not_same(Tagged<double>{0.0, "x"}, Tagged<double>{-0.0, "x"}));
        expect(issame::is_same(Tagged<Tagged<int>>{{1, "inner"}, "outer"}, Tagged<Tagged<int>>{{1, "inner"}, "outer"}));
    };

    "derived records nest in containers"_test = [] {
        const std::vector<MyCustomType> values{{1, "a", U'a'}, {2, "b", U'b'}};
        expect(issame::is_same(values, std::vector<MyCustomType>{{1, "a", U'a'}, {2, "b", U'b'}}));
        expect(issame::is_not_same(values, std::vector<MyCustomType>{{1, "a", U'a'}, {2, "b", U'c'}}));
    };
};

const boost::ut::suite<"positional and unit records"> positionalRecordTests = [] {
    using namespace boost::ut;

    "tuple-like record"_test = [] {
        const MyTupleStruct left(2, "foo");
        MyTupleStruct       right(2, "foo");
        expect(issame::is_same(left, right));
        right.increment();
        expect(issame::is_not_same(left, right));
        expect(issame::is_not_same(left, MyTupleStruct(2, "bar")));
    };

    "tuple-like record short-circuits on the first differing position"_test = [] {
        Counted::comparisons() = 0;
        expect(issame::is_not_same(CountedPosition(1, {5}), CountedPosition(2, {5})));
        expect(eq(Counted::comparisons(), 0));
        expect(issame::is_same(CountedPosition(1, {5}), CountedPosition(1, {5})));
        expect(eq(Counted::comparisons(), 1));
        expect(issame::is_not_same(CountedPosition(1, {5}), CountedPosition(1, {6})));
        expect(eq(Counted::comparisons(), 2));
    };

    "std::tuple and std::pair short-circuit on the first differing element"_test = [] {
        Counted::comparisons() = 0;
        expect(issame::is_not_same(std::tuple{1, Counted{5}}, std::tuple{2, Counted{5}}));
        expect(issame::is_not_same(std::pair{1, Counted{5}}, std::pair{2, Counted{5}}));
        expect(eq(Counted::comparisons(), 0));
        expect(issame::is_same(std::tuple{1, Counted{5}}, std::tuple{1, Counted{5}}));
        expect(eq(Counted::comparisons(), 1));
        expect(issame::is_same(std::pair{1, Counted{5}}, std::pair{1, Counted{5}}));
        expect(eq(Counted::comparisons(), 2));
    };

    "unit record is always same"_test = [] {
        expect(issame::is_same(MyUnitStruct{}, MyUnitStruct{}));
        expect(!issame::is_not_same(MyUnitStruct{}, MyUnitStruct{}));
    };

    "record listing no fields inherits the state of its base"_test = [] {
        expect(shape_of<TunedSettings> == Shape::Named);
        expect(issame::is_same(TunedSettings{{1.0, {1.0}}}, TunedSettings{{1.0, {1.0}}}));
        expect(issame::is_not_same(TunedSettings{{1.0, {1.0}}}, TunedSettings{{1.0, {2.0}}}));
    };
};

const boost::ut::suite<"hand-written specializations"> handWrittenTests = [] {
    using namespace boost::ut;

    "same_members selects the identity"_test = [] {
        const Cache cache{"k", 1, 10};
        expect(issame::is_same(cache, Cache{"k", 1, 99}));
        expect(issame::is_not_same(cache, Cache{"k", 2, 10}));
        expect(issame::is_not_same(cache, Cache{"j", 1, 10}));
    };
};

const boost::ut::suite<"shape"> shapeTests = [] {
    using namespace boost::ut;

    "shape_of"_test = [] {
        expect(shape_of<MyCustomType> == Shape::Named);
        expect(shape_of<MyTupleStruct> == Shape::Positional);
        expect(shape_of<MyUnitStruct> == Shape::Unit);
        expect(shape_of<int> == Shape::Unsupported);
    };

    "formatting"_test = [] {
        expect(eq(fmt::format("{}", shape_of<MyCustomType>), "Named"s));
        expect(eq(fmt::format("{}", Shape::Positional), "Positional"s));
    };
};

static_assert(Comparable<MyCustomType>);
static_assert(Comparable<MyTupleStruct>);
static_assert(Comparable<MyUnitStruct>);
static_assert(Comparable<Tagged<std::vector<float>>>);
static_assert(!Comparable<Cache, MyCustomType>);
static_assert(shape_of<const FilterSettings&> == Shape::Named);
static_assert(refl::data_member_count<FilterSettings> == 4);
static_assert(issame::is_same(MyUnitStruct{}, MyUnitStruct{}));

} // namespace issame::test

int main() { /* tests are statically executed */ }
