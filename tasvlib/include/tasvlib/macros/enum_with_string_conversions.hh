#pragma once

#include <cstdlib>
#include <optional>
#include <string_view>
#include <tasvlib/macros/stringify.hh>
#include <type_traits>

// Example usage: ENUM_WITH_STRING_CONVERSIONS(Color, uint8_t, (GREEN, 1, "green")(RED, 2,
// "red")(BLUE, 42, "blue"));
#define ENUM_WITH_STRING_CONVERSIONS(enum_name, underlying_type, seq)                  \
    struct enum_name {                                                                 \
        struct enum_with_string_conversions_marker {};                                 \
        using UnderlyingType = underlying_type;                                        \
        /* NOLINTNEXTLINE(bugprone-macro-parentheses) */                               \
        enum class Enum : underlying_type {                                            \
            REV_CAT(_END, IMPL_EWSC_VARIANTS_A seq)                                    \
        };                                                                             \
                                                                                       \
        REV_CAT(_END, IMPL_EWSC_STATIC_A seq)                                          \
                                                                                       \
        /* NOLINTNEXTLINE */                                                           \
        constexpr enum_name(Enum x = {})                                               \
        : val{x} {}                                                                    \
                                                                                       \
        constexpr explicit enum_name(UnderlyingType x)                                 \
        : val{x} {}                                                                    \
                                                                                       \
        constexpr operator Enum() const noexcept { return val; }                       \
                                                                                       \
        constexpr explicit operator underlying_type() const noexcept {                 \
            return static_cast<underlying_type>(val);                                  \
        }                                                                              \
                                                                                       \
        constexpr explicit operator bool() = delete;                                   \
                                                                                       \
        constexpr const char* to_str() const noexcept {                                \
            switch (val) {                                                             \
                REV_CAT(_END, IMPL_EWSC_TO_STR_A seq)                                  \
            }                                                                          \
            std::abort(); /* invalid enum variant */                                   \
        }                                                                              \
                                                                                       \
        friend constexpr const char* to_str(enum_name x) noexcept { return x.to_str(); } \
                                                                                       \
        static constexpr std::optional<enum_name> from_str(std::string_view str) noexcept { \
            REV_CAT(_END, IMPL_EWSC_FROM_STR_A seq)                                    \
            return std::nullopt;                                                       \
        }                                                                              \
                                                                                       \
    private:                                                                           \
        Enum val;                                                                      \
    }

// Every sequence element is consumed by alternating _A and _B macros, the last one left is
// glued with _END and expands to nothing
#define IMPL_EWSC_VARIANTS_A(name, val, str_val) name = (val), IMPL_EWSC_VARIANTS_B
#define IMPL_EWSC_VARIANTS_B(name, val, str_val) name = (val), IMPL_EWSC_VARIANTS_A
#define IMPL_EWSC_VARIANTS_A_END
#define IMPL_EWSC_VARIANTS_B_END

#define IMPL_EWSC_STATIC_A(name, val, str_val) \
    static constexpr Enum name = Enum::name; IMPL_EWSC_STATIC_B
#define IMPL_EWSC_STATIC_B(name, val, str_val) \
    static constexpr Enum name = Enum::name; IMPL_EWSC_STATIC_A
#define IMPL_EWSC_STATIC_A_END
#define IMPL_EWSC_STATIC_B_END

#define IMPL_EWSC_TO_STR_A(name, val, str_val) \
    case name: return str_val; IMPL_EWSC_TO_STR_B
#define IMPL_EWSC_TO_STR_B(name, val, str_val) \
    case name: return str_val; IMPL_EWSC_TO_STR_A
#define IMPL_EWSC_TO_STR_A_END
#define IMPL_EWSC_TO_STR_B_END

#define IMPL_EWSC_FROM_STR_A(name, val, str_val) \
    if (str == (str_val)) { return name; } IMPL_EWSC_FROM_STR_B
#define IMPL_EWSC_FROM_STR_B(name, val, str_val) \
    if (str == (str_val)) { return name; } IMPL_EWSC_FROM_STR_A
#define IMPL_EWSC_FROM_STR_A_END
#define IMPL_EWSC_FROM_STR_B_END

namespace detail {

template <class T, class = typename T::enum_with_string_conversions_marker>
constexpr auto has_enum_with_string_conversions_marker(int) -> std::true_type;
template <class>
constexpr auto has_enum_with_string_conversions_marker(...) -> std::false_type;

} // namespace detail

template <class T>
constexpr inline bool is_enum_with_string_conversions =
    decltype(detail::has_enum_with_string_conversions_marker<T>(0))::value;
