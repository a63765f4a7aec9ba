#pragma once

#include <type_traits>
#include <utility>

// Calls func when leaving the scope. func may not throw, as it runs during stack unwinding too.
template <class Func>
class Defer {
    static_assert(std::is_nothrow_invocable_v<Func&>, "the deferred function has to be noexcept");

    Func func_;

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Defer(Func func) noexcept(std::is_nothrow_move_constructible_v<Func>)
    : func_(std::move(func)) {}

    Defer(const Defer&) = delete;
    Defer(Defer&&) = delete;
    Defer& operator=(const Defer&) = delete;
    Defer& operator=(Defer&&) = delete;

    ~Defer() { func_(); }
};
