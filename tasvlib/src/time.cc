#include <array>
#include <charconv>
#include <ctime>
#include <string>
#include <tasvlib/errmsg.hh>
#include <tasvlib/macros/throw.hh>
#include <tasvlib/time.hh>

using std::string;
using std::string_view;

namespace {

constexpr size_t DATETIME_LEN = 19; // YYYY-mm-dd HH:MM:SS

constexpr bool is_leap_year(int year) noexcept {
    return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

constexpr int days_in_month(int year, int month) noexcept {
    constexpr std::array<int, 12> days = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return month == 2 && is_leap_year(year) ? 29 : days[static_cast<size_t>(month - 1)];
}

// Parses the decimal field str[pos, pos + len)
bool parse_field(string_view str, size_t pos, size_t len, int& res) noexcept {
    auto field = str.substr(pos, len);
    for (char c : field) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), res);
    return ec == std::errc{} && ptr == field.data() + field.size();
}

bool parse_datetime(string_view str, struct tm& t) noexcept {
    if (str.size() != DATETIME_LEN || str[4] != '-' || str[7] != '-' || str[10] != ' ' ||
        str[13] != ':' || str[16] != ':')
    {
        return false;
    }
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!parse_field(str, 0, 4, year) || !parse_field(str, 5, 2, month) ||
        !parse_field(str, 8, 2, day) || !parse_field(str, 11, 2, hour) ||
        !parse_field(str, 14, 2, minute) || !parse_field(str, 17, 2, second))
    {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) || hour > 23 ||
        minute > 59 || second > 60)
    {
        return false;
    }
    t = {};
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_hour = hour;
    t.tm_min = minute;
    t.tm_sec = second;
    return true;
}

} // namespace

time_t current_time_t() {
    time_t now = time(nullptr);
    if (now == static_cast<time_t>(-1)) {
        THROW("time()", errmsg());
    }
    return now;
}

string utc_mysql_datetime_from_time_t(time_t time) {
    struct tm t = {};
    if (!gmtime_r(&time, &t)) {
        THROW("gmtime_r()", errmsg());
    }
    string res(DATETIME_LEN + 1, '\0');
    res.resize(strftime(res.data(), res.size(), "%Y-%m-%d %H:%M:%S", &t));
    return res;
}

string utc_mysql_datetime_with_offset(time_t offset) {
    return utc_mysql_datetime_from_time_t(current_time_t() + offset);
}

bool is_datetime(string_view str) noexcept {
    struct tm t = {};
    return parse_datetime(str, t);
}

time_t time_t_from_utc_mysql_datetime(string_view str) {
    struct tm t = {};
    if (!parse_datetime(str, t)) {
        THROW("invalid datetime: ", str);
    }
    time_t res = timegm(&t);
    if (res == static_cast<time_t>(-1)) {
        THROW("timegm()", errmsg());
    }
    return res;
}
