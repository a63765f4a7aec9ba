#pragma once

#include <ctime>
#include <string>
#include <string_view>

// Datetimes are stored as "YYYY-mm-dd HH:MM:SS" in UTC, the format MySQL and SQLite both sort
// and compare as text

std::string utc_mysql_datetime_from_time_t(time_t time);

// Current time shifted by @p offset seconds
std::string utc_mysql_datetime_with_offset(time_t offset);

inline std::string utc_mysql_datetime() { return utc_mysql_datetime_with_offset(0); }

// Whether @p str is a valid "YYYY-mm-dd HH:MM:SS" datetime
bool is_datetime(std::string_view str) noexcept;

// Inverse of utc_mysql_datetime_from_time_t(), throws if @p str is not a valid datetime
time_t time_t_from_utc_mysql_datetime(std::string_view str);

time_t current_time_t();
