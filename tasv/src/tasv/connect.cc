#include <tasv/connect.hh>
#include <tasv/mysql/mysql.hh>
#include <tasv/sqlite/sqlite.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/macros/throw.hh>

namespace tasv {

std::unique_ptr<db::Connection> connect(const Config& config) {
    STACK_UNWINDING_MARK;
    switch (config.db_backend) {
    case Config::DbBackend::SQLITE:
        return std::make_unique<sqlite::Connection>(config.sqlite_path);
    case Config::DbBackend::MYSQL:
        return std::make_unique<mysql::Connection>(
            config.mysql_host, config.mysql_user, config.mysql_password, config.mysql_database
        );
    }
    THROW("Invalid db_backend");
}

} // namespace tasv
