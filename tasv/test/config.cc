#include <gtest/gtest.h>
#include <stdexcept>
#include <tasv/config.hh>

using tasv::Config;

// NOLINTNEXTLINE
TEST(Config, sqlite_with_defaults) {
    auto config = Config::load_from_string("db_backend: sqlite\nsqlite_path: /var/lib/tasv/db.sqlite\n");
    EXPECT_EQ(config.db_backend, Config::DbBackend::SQLITE);
    EXPECT_EQ(config.sqlite_path, "/var/lib/tasv/db.sqlite");
    EXPECT_EQ(config.minimum_hours_before_judgment, 72);
    EXPECT_EQ(config.max_decompressed_movie_size, 100 << 20);
    EXPECT_EQ(config.retry_policy.max_attempts, 3);
    EXPECT_EQ(config.retry_policy.initial_delay, std::chrono::milliseconds{50});
    EXPECT_EQ(config.retry_policy.max_delay, std::chrono::milliseconds{1000});
    EXPECT_EQ(config.job_server_notify_file, "tasv-job-server.notify");
    EXPECT_EQ(config.video_sync_command, "");
    EXPECT_EQ(config.stdlog_file, "");
}

// NOLINTNEXTLINE
TEST(Config, everything_set) {
    auto config = Config::load_from_string(R"(
db_backend: mysql
mysql_host: localhost
mysql_user: tasv
mysql_password: 'secret'
mysql_database: tasv
minimum_hours_before_judgment: 24
max_decompressed_movie_size: 1048576
retry_max_attempts: 5
retry_initial_delay_ms: 10
retry_max_delay_ms: 80
job_server_notify_file: /run/tasv/notify
job_server_poll_interval_ms: 250
video_sync_command: /usr/local/bin/tasv-sync-video
stdlog_file: /var/log/tasv/stdlog
errlog_file: /var/log/tasv/errlog
)");
    EXPECT_EQ(config.db_backend, Config::DbBackend::MYSQL);
    EXPECT_EQ(config.mysql_host, "localhost");
    EXPECT_EQ(config.mysql_password, "secret");
    EXPECT_EQ(config.minimum_hours_before_judgment, 24);
    EXPECT_EQ(config.max_decompressed_movie_size, 1048576);
    EXPECT_EQ(config.retry_policy.max_attempts, 5);
    EXPECT_EQ(config.retry_policy.initial_delay, std::chrono::milliseconds{10});
    EXPECT_EQ(config.retry_policy.max_delay, std::chrono::milliseconds{80});
    EXPECT_EQ(config.job_server_notify_file, "/run/tasv/notify");
    EXPECT_EQ(config.job_server_poll_interval_ms, 250);
    EXPECT_EQ(config.video_sync_command, "/usr/local/bin/tasv-sync-video");
    EXPECT_EQ(config.errlog_file, "/var/log/tasv/errlog");
}

// NOLINTNEXTLINE
TEST(Config, invalid) {
    EXPECT_THROW(Config::load_from_string(""), std::runtime_error);
    EXPECT_THROW(Config::load_from_string("db_backend: postgres\n"), std::runtime_error);
    EXPECT_THROW(Config::load_from_string("db_backend: sqlite\n"), std::runtime_error);
    EXPECT_THROW(Config::load_from_string("db_backend: mysql\nmysql_host: h\n"), std::runtime_error);
    EXPECT_THROW(
        Config::load_from_string("db_backend: sqlite\nsqlite_path: x\nretry_max_attempts: 0\n"),
        std::runtime_error
    );
    EXPECT_THROW(
        Config::load_from_string(
            "db_backend: sqlite\nsqlite_path: x\nminimum_hours_before_judgment: -3\n"
        ),
        std::runtime_error
    );
}
