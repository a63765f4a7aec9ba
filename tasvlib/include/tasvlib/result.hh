#pragma once

#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>

namespace detail {

template <class T, class = void>
constexpr inline bool is_printable = false;
template <class T>
constexpr inline bool is_printable<
    T,
    std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>> = true;

} // namespace detail

template <class T>
struct Ok {
    T val;

    constexpr explicit Ok(T val) noexcept : val{std::move(val)} {}

    // Lets Ok{"str"} become Ok<std::string>
    template <class U, std::enable_if_t<std::is_constructible_v<T, U&&>, int> = 0>
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Ok(Ok<U>&& other) noexcept : val{std::move(other.val)} {}
};

template <>
struct Ok<void> {};

Ok() -> Ok<void>;

template <class E>
struct Err {
    E err;

    constexpr explicit Err(E err) noexcept : err{std::move(err)} {}

    template <class U, std::enable_if_t<std::is_constructible_v<E, U&&>, int> = 0>
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Err(Err<U>&& other) noexcept : err{std::move(other.err)} {}
};

// Outcome of an operation that fails in an expected way: a value of type T (may be void) or an
// error of type E
template <class T, class E>
class Result {
    std::variant<Ok<T>, Err<E>> var_;

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Result(Ok<T> ok) : var_{std::move(ok)} {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr Result(Err<E> err) : var_{std::move(err)} {}

    [[nodiscard]] constexpr bool is_ok() const noexcept { return var_.index() == 0; }

    [[nodiscard]] constexpr bool is_err() const noexcept { return var_.index() == 1; }

    // Requires is_ok()
    template <class U = T, std::enable_if_t<!std::is_void_v<U>, int> = 0>
    [[nodiscard]] constexpr const U& value() const& {
        return std::get<0>(var_).val;
    }

    // Requires is_err()
    [[nodiscard]] constexpr const E& error() const& { return std::get<1>(var_).err; }

    // Throws std::bad_variant_access if is_err()
    constexpr T unwrap() && {
        if constexpr (std::is_void_v<T>) {
            (void)std::get<0>(var_);
        } else {
            return std::get<0>(std::move(var_)).val;
        }
    }

    // Throws std::bad_variant_access if is_ok()
    constexpr E unwrap_err() && { return std::get<1>(std::move(var_)).err; }
};

// Prints Ok{value}, Ok{} or Err{error}, unprintable parts as <unprintable>
template <class T, class E>
std::ostream& operator<<(std::ostream& os, const Result<T, E>& res) {
    auto print = [&os](const auto& x) -> std::ostream& {
        if constexpr (detail::is_printable<std::decay_t<decltype(x)>>) {
            return os << x;
        } else {
            return os << "<unprintable>";
        }
    };
    if (res.is_err()) {
        os << "Err{";
        print(res.error());
    } else {
        os << "Ok{";
        if constexpr (!std::is_void_v<T>) {
            print(res.value());
        }
    }
    return os << '}';
}
