#include <charconv>
#include <cstring>
#include <errmsg.h>
#include <fcntl.h>
#include <mutex>
#include <mysql.h>
#include <tasv/mysql/mysql.hh>
#include <tasvlib/errmsg.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/macros/throw.hh>

using std::string;
using std::string_view;
using std::vector;

namespace {

constexpr unsigned ER_LOCK_WAIT_TIMEOUT_ERRNO = 1205;
constexpr unsigned ER_LOCK_DEADLOCK_ERRNO = 1213;
constexpr unsigned ER_DUP_ENTRY_ERRNO = 1062;

MYSQL* new_mysql() {
    STACK_UNWINDING_MARK;
    // Some documentations say that invoking mysql_init() is unsafe in a multi-thread environment
    static std::mutex mysql_init_mutex;
    MYSQL* conn = [] {
        auto guard = std::lock_guard{mysql_init_mutex};
        return mysql_init(nullptr);
    }();
    if (!conn) {
        THROW("mysql_init() failed");
    }
    return conn;
}

bool is_integer_field(enum_field_types type) noexcept {
    switch (type) {
    case MYSQL_TYPE_TINY:
    case MYSQL_TYPE_SHORT:
    case MYSQL_TYPE_LONG:
    case MYSQL_TYPE_INT24:
    case MYSQL_TYPE_LONGLONG:
    case MYSQL_TYPE_YEAR: return true;
    default: return false;
    }
}

bool is_floating_field(enum_field_types type) noexcept {
    switch (type) {
    case MYSQL_TYPE_FLOAT:
    case MYSQL_TYPE_DOUBLE:
    case MYSQL_TYPE_DECIMAL:
    case MYSQL_TYPE_NEWDECIMAL: return true;
    default: return false;
    }
}

} // namespace

namespace tasv::mysql {

void throw_mysql_error(unsigned errnum, string_view errstr) {
    auto msg = concat_tostr("MySQL error ", errnum, ": ", errstr);
    switch (errnum) {
    case ER_LOCK_DEADLOCK_ERRNO:
    case ER_LOCK_WAIT_TIMEOUT_ERRNO: throw db::ConcurrencyConflict{msg};
    case ER_DUP_ENTRY_ERRNO: throw db::DuplicateKey{msg};
    default: THROW(msg);
    }
}

namespace {

class StatementImpl final : public db::StatementImpl {
    MYSQL_STMT* stmt;
    struct Column {
        enum_field_types type;
        bool is_unsigned;
        string buff;
        unsigned long length = 0; // NOLINT(google-runtime-int)
        my_bool is_null = 0;
        my_bool error = 0;
    };
    vector<Column> columns;
    std::unique_ptr<MYSQL_BIND[]> res_binds;

    [[noreturn]] void throw_stmt_error() {
        throw_mysql_error(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
    }

    void bind_params(const vector<db::Value>& params) {
        throw_assert(params.size() == mysql_stmt_param_count(stmt));
        if (params.empty()) {
            return;
        }
        auto binds = std::make_unique<MYSQL_BIND[]>(params.size());
        std::memset(binds.get(), 0, sizeof(MYSQL_BIND) * params.size());
        for (size_t i = 0; i < params.size(); ++i) {
            auto& bind = binds[i];
            std::visit(
                [&](const auto& val) {
                    using T = std::decay_t<decltype(val)>;
                    if constexpr (std::is_same_v<T, std::nullptr_t>) {
                        bind.buffer_type = MYSQL_TYPE_NULL;
                    } else if constexpr (std::is_same_v<T, int64_t>) {
                        bind.buffer_type = MYSQL_TYPE_LONGLONG;
                        bind.buffer = const_cast<int64_t*>(&val); // NOLINT
                    } else if constexpr (std::is_same_v<T, double>) {
                        bind.buffer_type = MYSQL_TYPE_DOUBLE;
                        bind.buffer = const_cast<double*>(&val); // NOLINT
                    } else {
                        bind.buffer_type = MYSQL_TYPE_BLOB;
                        bind.buffer = const_cast<char*>(val.data()); // NOLINT
                        bind.buffer_length = val.size();
                    }
                },
                params[i]
            );
        }
        if (mysql_stmt_bind_param(stmt, binds.get())) {
            throw_stmt_error();
        }
    }

    void bind_results() {
        MYSQL_RES* meta = mysql_stmt_result_metadata(stmt);
        if (!meta) {
            return; // statement without result set
        }
        unsigned field_count = mysql_num_fields(meta);
        MYSQL_FIELD* fields = mysql_fetch_fields(meta);
        columns.resize(field_count);
        for (unsigned i = 0; i < field_count; ++i) {
            columns[i].type = fields[i].type;
            columns[i].is_unsigned = fields[i].flags & UNSIGNED_FLAG;
            columns[i].buff.resize(64);
        }
        mysql_free_result(meta);

        res_binds = std::make_unique<MYSQL_BIND[]>(field_count);
        std::memset(res_binds.get(), 0, sizeof(MYSQL_BIND) * field_count);
        for (unsigned i = 0; i < field_count; ++i) {
            auto& bind = res_binds[i];
            auto& col = columns[i];
            bind.buffer_type = MYSQL_TYPE_BLOB;
            bind.buffer = col.buff.data();
            bind.buffer_length = col.buff.size();
            bind.length = &col.length;
            bind.is_null = &col.is_null;
            bind.error = &col.error;
        }
        if (mysql_stmt_bind_result(stmt, res_binds.get())) {
            throw_stmt_error();
        }
        if (mysql_stmt_store_result(stmt)) {
            throw_stmt_error();
        }
    }

public:
    StatementImpl(MYSQL* conn, const string& sql, const vector<db::Value>& params)
    : stmt{mysql_stmt_init(conn)} {
        STACK_UNWINDING_MARK;

        if (!stmt) {
            THROW(mysql_error(conn));
        }
        try {
            if (mysql_stmt_prepare(stmt, sql.data(), sql.size())) {
                throw_stmt_error();
            }
            bind_params(params);
            if (mysql_stmt_execute(stmt)) {
                throw_stmt_error();
            }
            bind_results();
        } catch (...) {
            (void)mysql_stmt_close(stmt);
            throw;
        }
    }

    ~StatementImpl() override { (void)mysql_stmt_close(stmt); }

    StatementImpl(const StatementImpl&) = delete;
    StatementImpl(StatementImpl&&) = delete;
    StatementImpl& operator=(const StatementImpl&) = delete;
    StatementImpl& operator=(StatementImpl&&) = delete;

    bool fetch_row(vector<db::Value>& row) override {
        if (columns.empty()) {
            return false;
        }
        int rc = mysql_stmt_fetch(stmt);
        if (rc == MYSQL_NO_DATA) {
            return false;
        }
        if (rc == 1) {
            throw_stmt_error();
        }

        row.resize(columns.size());
        for (size_t i = 0; i < columns.size(); ++i) {
            auto& col = columns[i];
            if (col.is_null) {
                row[i] = nullptr;
                continue;
            }

            string value;
            if (col.length > col.buff.size()) {
                // Truncated, fetch the whole value
                value.resize(col.length);
                MYSQL_BIND bind;
                std::memset(&bind, 0, sizeof(bind));
                bind.buffer_type = MYSQL_TYPE_BLOB;
                bind.buffer = value.data();
                bind.buffer_length = value.size();
                if (mysql_stmt_fetch_column(stmt, &bind, static_cast<unsigned>(i), 0)) {
                    throw_stmt_error();
                }
            } else {
                value.assign(col.buff.data(), col.length);
            }

            if (is_integer_field(col.type)) {
                int64_t x = 0;
                std::from_chars_result res{};
                if (col.is_unsigned) {
                    uint64_t u = 0;
                    res = std::from_chars(value.data(), value.data() + value.size(), u);
                    x = static_cast<int64_t>(u);
                } else {
                    res = std::from_chars(value.data(), value.data() + value.size(), x);
                }
                if (res.ec != std::errc{}) {
                    THROW("invalid integer in column ", i, ": ", value);
                }
                row[i] = x;
            } else if (is_floating_field(col.type)) {
                row[i] = std::stod(value);
            } else {
                row[i] = std::move(value);
            }
        }
        return true;
    }

    uint64_t affected_rows() override { return mysql_stmt_affected_rows(stmt); }

    uint64_t insert_id() override { return mysql_stmt_insert_id(stmt); }
};

} // namespace

Connection::Connection(string host_, string user_, string password_, string database_)
: conn{new_mysql()}
, host{std::move(host_)}
, user{std::move(user_)}
, password{std::move(password_)}
, database{std::move(database_)} {
    try {
        connect();
    } catch (...) {
        mysql_close(conn);
        throw;
    }
}

void Connection::connect() {
    STACK_UNWINDING_MARK;

    my_bool true_val = 1;
    if (mysql_optionsv(conn, MYSQL_REPORT_DATA_TRUNCATION, &true_val)) {
        THROW(mysql_error(conn));
    }
    if (!mysql_real_connect(
            conn, host.c_str(), user.c_str(), password.c_str(), database.c_str(), 0, nullptr, 0
        ))
    {
        THROW(mysql_error(conn));
    }
    // Set CLOEXEC flag on the mysql connection socket
    int mysql_socket = mysql_get_socket(conn);
    int flags = fcntl(mysql_socket, F_GETFD);
    if (flags == -1) {
        THROW("fnctl()", errmsg());
    }
    if (fcntl(mysql_socket, F_SETFD, flags | FD_CLOEXEC)) {
        THROW("fnctl()", errmsg());
    }
}

Connection::~Connection() { mysql_close(conn); }

void Connection::update(string_view sql) {
    STACK_UNWINDING_MARK;

    bool retrying = false;
    for (;;) {
        if (mysql_real_query(conn, sql.data(), sql.size())) {
            if (!retrying && mysql_errno(conn) == CR_SERVER_GONE_ERROR && !in_transaction()) {
                // mysql_real_connect() may be called only once on a connection, a new one must be
                // created
                mysql_close(std::exchange(conn, new_mysql()));
                connect();
                retrying = true;
                continue;
            }
            throw_mysql_error(mysql_errno(conn), mysql_error(conn));
        }
        break;
    }
}

std::unique_ptr<db::StatementImpl>
Connection::prepare_and_execute(const string& sql, const vector<db::Value>& params) {
    return std::make_unique<StatementImpl>(conn, sql, params);
}

void Connection::begin_transaction() {
    update("SET TRANSACTION ISOLATION LEVEL REPEATABLE READ");
    update("START TRANSACTION");
}

void Connection::commit_transaction() {
    STACK_UNWINDING_MARK;
    if (mysql_commit(conn)) {
        throw_mysql_error(mysql_errno(conn), mysql_error(conn));
    }
}

void Connection::rollback_transaction() {
    STACK_UNWINDING_MARK;
    if (mysql_rollback(conn)) {
        throw_mysql_error(mysql_errno(conn), mysql_error(conn));
    }
}

} // namespace tasv::mysql
