#include <tasv/db/connection.hh>
#include <tasvlib/logger.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/macros/throw.hh>

namespace tasv::db {

namespace detail {

void throw_unexpected_null() { THROW("unexpected NULL in a non-optional result column"); }

void throw_type_mismatch(std::string_view expected, const Value& val) {
    static constexpr const char* names[] = {"NULL", "integer", "floating point", "string"};
    THROW("result column type mismatch: expected ", expected, ", got ", names[val.index()]);
}

} // namespace detail

bool Statement::next() {
    STACK_UNWINDING_MARK;

    if (!impl->fetch_row(row)) {
        return false;
    }
    if (row.size() < res_binds.size()) {
        THROW("bound ", res_binds.size(), " result variables but a row has ", row.size(), " columns");
    }
    for (size_t i = 0; i < res_binds.size(); ++i) {
        res_binds[i](row[i]);
    }
    return true;
}

Transaction::~Transaction() {
    if (conn && conn->transaction_active) {
        try {
            rollback();
        } catch (const std::exception& e) {
            ERRLOG_CATCH(e);
        }
    }
}

void Transaction::commit() {
    throw_assert(conn && conn->transaction_active);
    conn->commit_transaction();
    conn->transaction_active = false;
}

void Transaction::rollback() {
    throw_assert(conn && conn->transaction_active);
    conn->transaction_active = false;
    conn->rollback_transaction();
}

} // namespace tasv::db
