#pragma once

#include <memory>
#include <mysql.h>
#include <string>
#include <tasv/db/connection.hh>

namespace tasv::mysql {

// Throws db::ConcurrencyConflict, db::DuplicateKey or std::runtime_error depending on @p errnum
[[noreturn]] void throw_mysql_error(unsigned errnum, std::string_view errstr);

class Connection final : public db::Connection {
    MYSQL* conn;
    std::string host, user, password, database;

    void connect();

public:
    Connection(std::string host_, std::string user_, std::string password_, std::string database_);

    ~Connection() override;

    Connection(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection& operator=(Connection&&) = delete;

    [[nodiscard]] db::Dialect dialect() const noexcept override { return db::Dialect::MYSQL; }

    void update(std::string_view sql) override;

protected:
    std::unique_ptr<db::StatementImpl>
    prepare_and_execute(const std::string& sql, const std::vector<db::Value>& params) override;

    void begin_transaction() override;
    void commit_transaction() override;
    void rollback_transaction() override;
};

} // namespace tasv::mysql
