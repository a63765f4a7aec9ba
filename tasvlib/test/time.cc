#include <gtest/gtest.h>
#include <tasvlib/time.hh>

// NOLINTNEXTLINE
TEST(time, utc_mysql_datetime_from_time_t) {
    EXPECT_EQ(utc_mysql_datetime_from_time_t(0), "1970-01-01 00:00:00");
    EXPECT_EQ(utc_mysql_datetime_from_time_t(1'700'000'000), "2023-11-14 22:13:20");
}

// NOLINTNEXTLINE
TEST(time, time_t_from_utc_mysql_datetime) {
    EXPECT_EQ(time_t_from_utc_mysql_datetime("1970-01-01 00:00:00"), 0);
    EXPECT_EQ(time_t_from_utc_mysql_datetime("2023-11-14 22:13:20"), 1'700'000'000);
    EXPECT_THROW(time_t_from_utc_mysql_datetime("2023-11-14"), std::runtime_error);
    EXPECT_THROW(time_t_from_utc_mysql_datetime("2023-11-14 22:13:20x"), std::runtime_error);

    auto now = current_time_t();
    EXPECT_EQ(time_t_from_utc_mysql_datetime(utc_mysql_datetime_from_time_t(now)), now);
}

// NOLINTNEXTLINE
TEST(time, is_datetime) {
    EXPECT_TRUE(is_datetime("2024-02-29 23:59:59"));
    EXPECT_FALSE(is_datetime(""));
    EXPECT_FALSE(is_datetime("2024-02-29T23:59:59"));
    EXPECT_FALSE(is_datetime("2024-02-29 23:59:5"));
}

// NOLINTNEXTLINE
TEST(time, utc_mysql_datetime_with_offset) {
    auto now = current_time_t();
    auto later = time_t_from_utc_mysql_datetime(utc_mysql_datetime_with_offset(3600));
    EXPECT_GE(later, now + 3600);
    EXPECT_LE(later, now + 3602);
}

// NOLINTNEXTLINE
TEST(time, is_datetime_checks_the_calendar) {
    EXPECT_FALSE(is_datetime("2023-02-29 00:00:00"));
    EXPECT_FALSE(is_datetime("2024-13-01 00:00:00"));
    EXPECT_FALSE(is_datetime("2024-04-31 00:00:00"));
    EXPECT_FALSE(is_datetime("2024-01-01 24:00:00"));
    EXPECT_FALSE(is_datetime("2024-01-01 -1:00:00"));
    EXPECT_TRUE(is_datetime("2000-02-29 12:30:00"));
}
