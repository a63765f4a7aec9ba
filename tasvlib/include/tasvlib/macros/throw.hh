#pragma once

#include <stdexcept>
#include <tasvlib/concat_tostr.hh>
#include <tasvlib/macros/stringify.hh>

// Throws std::runtime_error with the concatenated arguments followed by the throw location
#define THROW(...)                                                                     \
    throw std::runtime_error(                                                          \
        concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")") \
    )

// Like assert() but throws std::runtime_error and is never compiled out
#define throw_assert(expr)                                                             \
    ((expr) ? (void)0                                                                  \
            : throw std::runtime_error(concat_tostr(                                   \
                  "Assertion `" #expr "` failed in ",                                  \
                  __PRETTY_FUNCTION__,                                                 \
                  " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")"                  \
              )))
