#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tasv/db/connection.hh>
#include <tasvlib/concat_tostr.hh>
#include <tasvlib/macros/enum_with_string_conversions.hh>
#include <tasvlib/result.hh>
#include <utility>

namespace tasv {

ENUM_WITH_STRING_CONVERSIONS(ErrorKind, uint8_t,
    // Referenced submission or publication is absent
    (NOT_FOUND, 1, "not_found")
    // Operation is illegal in the current state (status, claim, duplicate filename, lost race)
    (PRECONDITION_FAILED, 2, "precondition_failed")
    // Input is malformed (unparseable movie, unknown system)
    (VALIDATION_FAILED, 3, "validation_failed")
    (CONCURRENCY_CONFLICT, 4, "concurrency_conflict")
    // Collaborator failed before the commit point, nothing was committed
    (DEPENDENCY_FAILURE, 5, "dependency_failure")
    // Fault that is not a business failure, details are in the error log
    (UNEXPECTED, 6, "unexpected")
);

struct OperationError {
    ErrorKind kind;
    std::string message;

    friend bool operator==(const OperationError& a, const OperationError& b) noexcept {
        return a.kind == b.kind && a.message == b.message;
    }

    friend std::ostream& operator<<(std::ostream& os, const OperationError& err) {
        return os << err.kind.to_str() << ": " << err.message;
    }
};

template <class T>
using OperationResult = Result<T, OperationError>;

template <class... Args>
Err<OperationError> operation_error(ErrorKind kind, Args&&... message) {
    return Err{OperationError{kind, concat_tostr(std::forward<Args>(message)...)}};
}

// Failure of a collaborator (wiki, forum, movie parser) inside an operation
class DependencyFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Runs @p func and reports its failure as DependencyFailure, store conflicts are rethrown as they
// are so that the caller can still tell a lost race
template <class Func>
decltype(auto) call_dependency(std::string_view name, Func&& func) {
    try {
        return std::forward<Func>(func)();
    } catch (const db::ConcurrencyConflict&) {
        throw;
    } catch (const std::exception& e) {
        throw DependencyFailure{concat_tostr(name, " failed: ", e.what())};
    }
}

} // namespace tasv
