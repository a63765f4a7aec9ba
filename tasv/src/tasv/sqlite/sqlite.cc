#include <sqlite3.h>
#include <tasv/sqlite/sqlite.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/macros/throw.hh>

using std::string;
using std::string_view;
using std::vector;

#define THROW_SQLITE_ERROR(db, rc, ...) throw_sqlite_error(db, rc, concat_tostr(__VA_ARGS__))

namespace tasv::sqlite {

void throw_sqlite_error(sqlite3* db, int rc, string_view what) {
    auto msg = concat_tostr(what, " - ", rc, ": ", db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED: throw db::ConcurrencyConflict{msg};
    default: break;
    }
    if (rc == SQLITE_CONSTRAINT_UNIQUE or rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
        throw db::DuplicateKey{msg};
    }
    THROW(msg);
}

namespace {

class StatementImpl final : public db::StatementImpl {
    sqlite3* db;
    sqlite3_stmt* stmt = nullptr;
    bool has_pending_row = false;
    bool done = false;
    uint64_t changes = 0;
    uint64_t last_insert_id = 0;

    int step() {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW or rc == SQLITE_DONE) {
            return rc;
        }
        THROW_SQLITE_ERROR(db, sqlite3_extended_errcode(db), "sqlite3_step()");
    }

public:
    StatementImpl(sqlite3* db_, const string& sql, const vector<db::Value>& params) : db{db_} {
        STACK_UNWINDING_MARK;

        int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
        if (rc != SQLITE_OK) {
            THROW_SQLITE_ERROR(db, rc, "sqlite3_prepare_v2(", sql, ")");
        }
        try {
            bind_and_execute(params);
        } catch (...) {
            // The destructor does not run for a partially constructed object
            (void)sqlite3_finalize(stmt);
            throw;
        }
    }

private:
    void bind_and_execute(const vector<db::Value>& params) {
        int idx = 0;
        for (const auto& param : params) {
            ++idx;
            int rc = std::visit(
                [&](const auto& val) {
                    using T = std::decay_t<decltype(val)>;
                    if constexpr (std::is_same_v<T, std::nullptr_t>) {
                        return sqlite3_bind_null(stmt, idx);
                    } else if constexpr (std::is_same_v<T, int64_t>) {
                        return sqlite3_bind_int64(stmt, idx, val);
                    } else if constexpr (std::is_same_v<T, double>) {
                        return sqlite3_bind_double(stmt, idx, val);
                    } else {
                        return sqlite3_bind_text64(
                            stmt, idx, val.data(), val.size(), SQLITE_TRANSIENT, SQLITE_UTF8
                        );
                    }
                },
                param
            );
            if (rc != SQLITE_OK) {
                THROW_SQLITE_ERROR(db, rc, "sqlite3_bind(", idx, ")");
            }
        }

        // Execute so that writes happen even if no row is fetched
        has_pending_row = step() == SQLITE_ROW;
        done = !has_pending_row;
        changes = static_cast<uint64_t>(sqlite3_changes64(db));
        last_insert_id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    }

public:
    ~StatementImpl() override { (void)sqlite3_finalize(stmt); }

    StatementImpl(const StatementImpl&) = delete;
    StatementImpl(StatementImpl&&) = delete;
    StatementImpl& operator=(const StatementImpl&) = delete;
    StatementImpl& operator=(StatementImpl&&) = delete;

    bool fetch_row(vector<db::Value>& row) override {
        if (has_pending_row) {
            has_pending_row = false;
        } else if (done or step() == SQLITE_DONE) {
            done = true;
            return false;
        }

        int columns = sqlite3_column_count(stmt);
        row.resize(static_cast<size_t>(columns));
        for (int i = 0; i < columns; ++i) {
            auto& cell = row[static_cast<size_t>(i)];
            switch (sqlite3_column_type(stmt, i)) {
            case SQLITE_NULL: cell = nullptr; break;
            case SQLITE_INTEGER: cell = static_cast<int64_t>(sqlite3_column_int64(stmt, i)); break;
            case SQLITE_FLOAT: cell = sqlite3_column_double(stmt, i); break;
            case SQLITE_BLOB: {
                const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, i));
                cell = string(data ? data : "", static_cast<size_t>(sqlite3_column_bytes(stmt, i)));
                break;
            }
            default: {
                const auto* data = reinterpret_cast<const char*>(sqlite3_column_text(stmt, i));
                cell = string(data ? data : "", static_cast<size_t>(sqlite3_column_bytes(stmt, i)));
                break;
            }
            }
        }
        return true;
    }

    uint64_t affected_rows() override { return changes; }

    uint64_t insert_id() override { return last_insert_id; }
};

} // namespace

Connection::Connection(const string& path, int busy_timeout_ms) {
    STACK_UNWINDING_MARK;

    int rc = sqlite3_open_v2(
        path.c_str(),
        &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK) {
        string msg = concat_tostr(
            "sqlite3_open_v2(", path, ") - ", rc, ": ", db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)
        );
        (void)sqlite3_close(db);
        THROW(msg);
    }
    (void)sqlite3_extended_result_codes(db, 1);
    (void)sqlite3_busy_timeout(db, busy_timeout_ms);
    try {
        update("PRAGMA journal_mode=WAL");
        update("PRAGMA foreign_keys=ON");
    } catch (...) {
        (void)sqlite3_close(db);
        throw;
    }
}

Connection::~Connection() {
    // Finalizes nothing, every statement is owned by a Statement that cannot outlive us
    (void)sqlite3_close(db);
}

void Connection::update(string_view sql) {
    STACK_UNWINDING_MARK;

    string sql_str{sql};
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db, sql_str.c_str(), nullptr, nullptr, &errmsg);
    sqlite3_free(errmsg);
    if (rc != SQLITE_OK) {
        THROW_SQLITE_ERROR(db, sqlite3_extended_errcode(db), "sqlite3_exec(", sql, ")");
    }
}

std::unique_ptr<db::StatementImpl>
Connection::prepare_and_execute(const string& sql, const vector<db::Value>& params) {
    return std::make_unique<StatementImpl>(db, sql, params);
}

// IMMEDIATE takes the write lock at the start, so reads inside see the most recently committed
// state and two writers never upgrade their locks concurrently
void Connection::begin_transaction() { update("BEGIN IMMEDIATE"); }

void Connection::commit_transaction() { update("COMMIT"); }

void Connection::rollback_transaction() {
    if (!sqlite3_get_autocommit(db)) {
        update("ROLLBACK");
    }
}

} // namespace tasv::sqlite
