#pragma once

#include <cerrno>
#include <cstring>
#include <string>
#include <tasvlib/concat_tostr.hh>

// Returns " - <errnum>: <strerror(errnum)>"
inline std::string errmsg(int errnum = errno) {
    char buff[256];
    // GNU strerror_r() may return a pointer to a static string instead of filling buff
    const char* str = strerror_r(errnum, buff, sizeof(buff));
    return concat_tostr(" - ", errnum, ": ", str);
}
