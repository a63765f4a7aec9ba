#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tasvlib/macros/enum_with_string_conversions.hh>
#include <type_traits>
#include <variant>

namespace tasv::db {

// Single cell of a row or a single statement parameter. BLOBs are kept as std::string.
using Value = std::variant<std::nullptr_t, int64_t, double, std::string>;

namespace detail {

template <class>
constexpr inline bool is_optional = false;
template <class T>
constexpr inline bool is_optional<std::optional<T>> = true;

} // namespace detail

template <class T>
Value to_value(const T& x) {
    using U = std::remove_cv_t<T>;
    if constexpr (std::is_same_v<U, std::nullptr_t> || std::is_same_v<U, std::nullopt_t>) {
        return nullptr;
    } else if constexpr (detail::is_optional<U>) {
        if (!x) {
            return nullptr;
        }
        return to_value(*x);
    } else if constexpr (is_enum_with_string_conversions<U>) {
        return static_cast<int64_t>(static_cast<typename U::UnderlyingType>(x));
    } else if constexpr (std::is_enum_v<U>) {
        return static_cast<int64_t>(static_cast<std::underlying_type_t<U>>(x));
    } else if constexpr (std::is_integral_v<U>) {
        return static_cast<int64_t>(x);
    } else if constexpr (std::is_floating_point_v<U>) {
        return static_cast<double>(x);
    } else if constexpr (std::is_same_v<U, Value>) {
        return x;
    } else {
        return std::string{std::string_view{x}};
    }
}

} // namespace tasv::db
