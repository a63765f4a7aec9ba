#include <chrono>
#include <string_view>
#include <tasv/config.hh>
#include <tasvlib/config_file.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/macros/throw.hh>

using std::string;
using std::string_view;

namespace {

tasv::Config parse(const ConfigFile& cf) {
    STACK_UNWINDING_MARK;
    using tasv::Config;

    Config config;
    auto backend = Config::DbBackend::from_str(cf.required_string("db_backend"));
    if (!backend) {
        THROW("Config variable db_backend has to be one of: sqlite, mysql");
    }
    config.db_backend = *backend;
    switch (config.db_backend) {
    case Config::DbBackend::SQLITE: config.sqlite_path = cf.required_string("sqlite_path"); break;
    case Config::DbBackend::MYSQL:
        config.mysql_host = cf.required_string("mysql_host");
        config.mysql_user = cf.required_string("mysql_user");
        config.mysql_password = cf["mysql_password"].as_string();
        config.mysql_database = cf.required_string("mysql_database");
        break;
    }

    config.minimum_hours_before_judgment =
        cf.number_or("minimum_hours_before_judgment", config.minimum_hours_before_judgment);
    config.max_decompressed_movie_size =
        cf.number_or("max_decompressed_movie_size", config.max_decompressed_movie_size);

    config.retry_policy.max_attempts =
        cf.number_or("retry_max_attempts", config.retry_policy.max_attempts);
    if (config.retry_policy.max_attempts < 1) {
        THROW("Config variable retry_max_attempts has to be greater than 0");
    }
    config.retry_policy.initial_delay = std::chrono::milliseconds{
        cf.number_or("retry_initial_delay_ms", config.retry_policy.initial_delay.count())
    };
    config.retry_policy.max_delay = std::chrono::milliseconds{
        cf.number_or("retry_max_delay_ms", config.retry_policy.max_delay.count())
    };

    if (cf["job_server_notify_file"].is_set()) {
        config.job_server_notify_file = cf.required_string("job_server_notify_file");
    }
    config.job_server_poll_interval_ms =
        cf.number_or("job_server_poll_interval_ms", config.job_server_poll_interval_ms);
    config.video_sync_command = cf["video_sync_command"].as_string();
    config.stdlog_file = cf["stdlog_file"].as_string();
    config.errlog_file = cf["errlog_file"].as_string();
    return config;
}

ConfigFile declared_vars() {
    ConfigFile cf;
    cf.add_vars(
        "db_backend",
        "sqlite_path",
        "mysql_host",
        "mysql_user",
        "mysql_password",
        "mysql_database",
        "minimum_hours_before_judgment",
        "max_decompressed_movie_size",
        "retry_max_attempts",
        "retry_initial_delay_ms",
        "retry_max_delay_ms",
        "job_server_notify_file",
        "job_server_poll_interval_ms",
        "video_sync_command",
        "stdlog_file",
        "errlog_file"
    );
    return cf;
}

} // namespace

namespace tasv {

Config Config::load(const string& path) {
    STACK_UNWINDING_MARK;
    auto cf = declared_vars();
    cf.load_config_from_file(path);
    return parse(cf);
}

Config Config::load_from_string(string_view contents) {
    STACK_UNWINDING_MARK;
    auto cf = declared_vars();
    cf.load_config_from_string(contents);
    return parse(cf);
}

} // namespace tasv
