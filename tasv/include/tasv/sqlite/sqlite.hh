#pragma once

#include <memory>
#include <sqlite3.h>
#include <string>
#include <tasv/db/connection.hh>

namespace tasv::sqlite {

// Throws db::ConcurrencyConflict, db::DuplicateKey or std::runtime_error depending on @p rc
[[noreturn]] void throw_sqlite_error(sqlite3* db, int rc, std::string_view what);

class Connection final : public db::Connection {
    sqlite3* db = nullptr;

public:
    // Opens (and creates if needed) the database file @p path
    explicit Connection(const std::string& path, int busy_timeout_ms = 10'000);

    ~Connection() override;

    Connection(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection& operator=(Connection&&) = delete;

    [[nodiscard]] db::Dialect dialect() const noexcept override { return db::Dialect::SQLITE; }

    void update(std::string_view sql) override;

protected:
    std::unique_ptr<db::StatementImpl>
    prepare_and_execute(const std::string& sql, const std::vector<db::Value>& params) override;

    void begin_transaction() override;
    void commit_transaction() override;
    void rollback_transaction() override;
};

} // namespace tasv::sqlite
