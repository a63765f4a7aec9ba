#pragma once

#include <cstdint>
#include <string>
#include <tasv/db/repeat_if_conflicted.hh>
#include <tasvlib/macros/enum_with_string_conversions.hh>

namespace tasv {

struct Config {
    ENUM_WITH_STRING_CONVERSIONS(DbBackend, uint8_t,
        (SQLITE, 1, "sqlite")
        (MYSQL, 2, "mysql")
    );

    DbBackend db_backend = DbBackend::SQLITE;
    std::string sqlite_path;
    std::string mysql_host;
    std::string mysql_user;
    std::string mysql_password;
    std::string mysql_database;

    uint32_t minimum_hours_before_judgment = 72;
    uint64_t max_decompressed_movie_size = 100 << 20;
    db::RetryPolicy retry_policy;

    std::string job_server_notify_file = "tasv-job-server.notify";
    uint32_t job_server_poll_interval_ms = 5000;
    std::string video_sync_command;

    // Empty means stderr
    std::string stdlog_file;
    std::string errlog_file;

    // Throws std::runtime_error with a description of the first invalid variable
    static Config load(const std::string& path);

    static Config load_from_string(std::string_view contents);
};

} // namespace tasv
