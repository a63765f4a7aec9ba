#pragma once

#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace detail {

template <class T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

template <class T, class = void>
constexpr inline bool has_to_str = false;
template <class T>
constexpr inline bool has_to_str<T, std::void_t<decltype(std::declval<const T&>().to_str())>> =
    true;

template <class T>
std::string integer_to_string(T x) {
    char buff[24];
    auto [ptr, ec] = std::to_chars(buff, buff + sizeof(buff), x);
    (void)ec; // buff is always big enough
    return std::string(buff, ptr);
}

} // namespace detail

// Converts @p x to something that std::string can be appended with
template <class T>
constexpr decltype(auto) stringify(T&& x) {
    using U = detail::remove_cvref_t<T>;
    if constexpr (std::is_same_v<U, bool>) {
        return std::string_view{x ? "true" : "false"};
    } else if constexpr (std::is_same_v<U, char>) {
        return std::string(1, x);
    } else if constexpr (std::is_integral_v<U>) {
        return detail::integer_to_string(x);
    } else if constexpr (std::is_floating_point_v<U>) {
        return std::to_string(x);
    } else if constexpr (detail::has_to_str<U>) {
        return std::string_view{x.to_str()};
    } else if constexpr (std::is_pointer_v<U> && !std::is_convertible_v<U, const char*>) {
        return stringify(reinterpret_cast<uintptr_t>(x));
    } else {
        return std::string_view{x};
    }
}

namespace detail {

template <class T, class = decltype(std::string_view{stringify(std::declval<T>())})>
constexpr auto is_string_argument(int) -> std::true_type;

template <class>
constexpr auto is_string_argument(...) -> std::false_type;

} // namespace detail

template <class T>
constexpr inline bool is_string_argument = decltype(detail::is_string_argument<T>(0))::value;

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string concat_tostr(Args&&... args) {
    return [](auto&&... str) {
        size_t total_length = (0 + ... + std::string_view{str}.size());
        std::string res;
        res.reserve(total_length);
        (void)(res += ... += std::string_view{str});
        return res;
    }(stringify(std::forward<Args>(args))...);
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string& back_insert(std::string& str, Args&&... args) {
    return [&str](auto&&... xx) -> std::string& {
        str.reserve(str.size() + (0 + ... + std::string_view{xx}.size()));
        return (str += ... += std::string_view{xx});
    }(stringify(std::forward<Args>(args))...);
}
