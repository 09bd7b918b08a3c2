#ifndef ISSAME_MEMO_HPP
#define ISSAME_MEMO_HPP

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include <issame/IsSame.hpp>

namespace issame {

/**
 * @brief Remembers the last observed value and reports whether a new one differs from it.
 *
 * \code
 * issame::ChangeTracker<Settings> tracker;
 * if (tracker.update(settings)) {
 *     rebuildFilter(settings);
 * }
 * \endcode
 */
template<typename T>
requires Comparable<T>
class ChangeTracker {
    std::optional<T> _last{};
    std::size_t      _generation = 0UZ;

public:
    ChangeTracker() = default;

    explicit ChangeTracker(T initial) : _last(std::move(initial)) {}

    [[nodiscard]] bool changed(const T& value) const { return !_last.has_value() || is_not_same(*_last, value); }

    /// stores `value` and bumps the generation if it is not same as the stored one, returns whether it did
    bool update(const T& value) {
        if (!changed(value)) {
            return false;
        }
        _last = value;
        ++_generation;
        return true;
    }

    void reset() noexcept { _last.reset(); }

    [[nodiscard]] const std::optional<T>& last() const noexcept { return _last; }
    [[nodiscard]] std::size_t             generation() const noexcept { return _generation; }
};

// caches the result of the last computation, keyed on an input compared with is_same
template<typename Input, typename Output>
requires Comparable<Input>
class Memo {
    std::optional<Input>  _input{};
    std::optional<Output> _output{};
    std::size_t           _recomputations = 0UZ;

public:
    template<typename Fn>
    requires std::invocable<Fn&, const Input&> && std::convertible_to<std::invoke_result_t<Fn&, const Input&>, Output>
    const Output& get(const Input& input, Fn&& compute) {
        if (_output.has_value() && is_same(*_input, input)) {
            return *_output;
        }
        _output.reset();
        _input = input;
        _output.emplace(std::invoke(compute, *_input));
        ++_recomputations;
        return *_output;
    }

    void invalidate() noexcept {
        _input.reset();
        _output.reset();
    }

    [[nodiscard]] bool        cached() const noexcept { return _output.has_value(); }
    [[nodiscard]] std::size_t recomputations() const noexcept { return _recomputations; }
};

} // namespace issame

#endif // ISSAME_MEMO_HPP
