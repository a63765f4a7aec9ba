#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tasv/db/value.hh>
#include <tasv/sql/sql.hh>
#include <tasvlib/concat_tostr.hh>
#include <tasvlib/macros/enum_with_string_conversions.hh>
#include <tasvlib/macros/throw.hh>
#include <type_traits>
#include <utility>
#include <vector>

namespace tasv::db {

// The write could not be applied because of a concurrent writer (deadlock, lock wait timeout,
// busy database). Safe to retry as a whole.
class ConcurrencyConflict : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unique or primary key constraint violation
class DuplicateKey : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class Dialect : uint8_t { SQLITE, MYSQL };

// Backend side of a prepared and executed statement
class StatementImpl {
public:
    StatementImpl() = default;
    StatementImpl(const StatementImpl&) = delete;
    StatementImpl(StatementImpl&&) = delete;
    StatementImpl& operator=(const StatementImpl&) = delete;
    StatementImpl& operator=(StatementImpl&&) = delete;
    virtual ~StatementImpl() = default;

    // Fetches the next row into @p row, returns false if there are no more rows
    virtual bool fetch_row(std::vector<Value>& row) = 0;

    [[nodiscard]] virtual uint64_t affected_rows() = 0;

    [[nodiscard]] virtual uint64_t insert_id() = 0;
};

// Cannot outlive the Connection and has to be used single-threadly with the Connection
class Statement {
    std::unique_ptr<StatementImpl> impl;
    std::vector<Value> row;
    std::vector<std::function<void(const Value&)>> res_binds;

public:
    explicit Statement(std::unique_ptr<StatementImpl> impl_) noexcept : impl{std::move(impl_)} {}

    template <class... Refs>
    void res_bind(Refs&... refs) {
        res_binds.clear();
        (res_binds.emplace_back(make_binder(refs)), ...);
    }

    // Fetches the next row into the variables bound with res_bind()
    bool next();

    [[nodiscard]] uint64_t affected_rows() { return impl->affected_rows(); }

    [[nodiscard]] uint64_t insert_id() { return impl->insert_id(); }

private:
    template <class T>
    static void assign(T& dest, const Value& val);

    template <class T>
    static std::function<void(const Value&)> make_binder(T& dest) {
        return [&dest](const Value& val) { assign(dest, val); };
    }
};

class Connection;

// Rolls back on destruction unless commit() was called
class Transaction {
    Connection* conn;

public:
    explicit Transaction(Connection& conn_) noexcept : conn{&conn_} {}

    Transaction(const Transaction&) = delete;
    Transaction(Transaction&& other) noexcept : conn{std::exchange(other.conn, nullptr)} {}
    Transaction& operator=(const Transaction&) = delete;
    Transaction& operator=(Transaction&&) = delete;

    ~Transaction();

    void commit();

    void rollback();
};

class Connection {
public:
    Connection() = default;
    Connection(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection& operator=(Connection&&) = delete;
    virtual ~Connection() = default;

    [[nodiscard]] virtual Dialect dialect() const noexcept = 0;

    // Executes a statement without parameters and results, e.g. DDL
    virtual void update(std::string_view sql) = 0;

    Statement execute(sql::SqlWithParams&& sql) {
        auto sql_str = std::move(sql).get_sql();
        auto params = std::move(sql).get_params();
        return Statement{prepare_and_execute(sql_str, params)};
    }

    // Starts a write transaction with isolation that guarantees re-reading the most recently
    // committed rows inside it
    Transaction start_transaction() {
        throw_assert(!transaction_active && "nested transactions are not supported");
        begin_transaction();
        transaction_active = true;
        return Transaction{*this};
    }

    [[nodiscard]] bool in_transaction() const noexcept { return transaction_active; }

protected:
    bool transaction_active = false;

    virtual std::unique_ptr<StatementImpl>
    prepare_and_execute(const std::string& sql, const std::vector<Value>& params) = 0;

    virtual void begin_transaction() = 0;
    virtual void commit_transaction() = 0;
    virtual void rollback_transaction() = 0;

    friend class Transaction;
};

/***************************************** IMPLEMENTATION *****************************************/

namespace detail {

[[noreturn]] void throw_unexpected_null();
[[noreturn]] void throw_type_mismatch(std::string_view expected, const Value& val);

} // namespace detail

template <class T>
void Statement::assign(T& dest, const Value& val) {
    if constexpr (db::detail::is_optional<T>) {
        if (std::holds_alternative<std::nullptr_t>(val)) {
            dest = std::nullopt;
        } else {
            typename T::value_type x{};
            assign(x, val);
            dest = std::move(x);
        }
    } else {
        if (std::holds_alternative<std::nullptr_t>(val)) {
            detail::throw_unexpected_null();
        }
        if constexpr (is_enum_with_string_conversions<T>) {
            typename T::UnderlyingType x{};
            assign(x, val);
            dest = T{x};
        } else if constexpr (std::is_same_v<T, bool>) {
            const auto* x = std::get_if<int64_t>(&val);
            if (!x) {
                detail::throw_type_mismatch("bool", val);
            }
            dest = *x != 0;
        } else if constexpr (std::is_integral_v<T>) {
            const auto* x = std::get_if<int64_t>(&val);
            if (!x) {
                detail::throw_type_mismatch("integer", val);
            }
            dest = static_cast<T>(*x);
        } else if constexpr (std::is_floating_point_v<T>) {
            if (const auto* x = std::get_if<double>(&val)) {
                dest = static_cast<T>(*x);
            } else if (const auto* i = std::get_if<int64_t>(&val)) {
                dest = static_cast<T>(*i);
            } else {
                detail::throw_type_mismatch("floating point", val);
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (const auto* x = std::get_if<std::string>(&val)) {
                dest = *x;
            } else if (const auto* i = std::get_if<int64_t>(&val)) {
                dest = concat_tostr(*i);
            } else {
                detail::throw_type_mismatch("string", val);
            }
        } else {
            static_assert(std::is_same_v<T, void>, "Unsupported result type");
        }
    }
}

} // namespace tasv::db
