#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <span>
#include <tasvlib/logger.hh>
#include <tasvlib/macros/stringify.hh>

namespace stack_unwinding {

struct Mark {
    const char* function;
    const char* file;
    unsigned line;
    uint64_t stamp;
};

// Marks left by the functions an exception unwound through, per thread. Marks hold only string
// literals, so recording never allocates.
class Trace {
    std::array<Mark, 64> marks_{};
    size_t size_ = 0;
    uint64_t last_stamp_ = 0;

    Trace() noexcept = default;

public:
    Trace(const Trace&) = delete;
    Trace(Trace&&) = delete;
    Trace& operator=(const Trace&) = delete;
    Trace& operator=(Trace&&) = delete;
    ~Trace() = default;

    static Trace& of_this_thread() noexcept {
        thread_local Trace trace;
        return trace;
    }

    uint64_t next_stamp() noexcept { return ++last_stamp_; }

    void record(const Mark& mark) noexcept {
        // Marks recorded before the marked scope began belong to an exception caught earlier
        if (size_ > 0 && marks_[size_ - 1].stamp < mark.stamp) {
            size_ = 0;
        }
        if (size_ < marks_.size()) {
            marks_[size_++] = mark;
        }
    }

    [[nodiscard]] std::span<const Mark> marks() const noexcept { return {marks_.data(), size_}; }

    void clear() noexcept { size_ = 0; }
};

// Records its scope in the Trace if an exception leaves the scope
class StackGuard {
    Mark mark_;
    int uncaught_at_creation_ = std::uncaught_exceptions();
    bool inside_catch_ = static_cast<bool>(std::current_exception());

public:
    StackGuard(const char* file, unsigned line, const char* function) noexcept
    : mark_{function, file, line, Trace::of_this_thread().next_stamp()} {}

    StackGuard(const StackGuard&) = delete;
    StackGuard(StackGuard&&) = delete;
    StackGuard& operator=(const StackGuard&) = delete;
    StackGuard& operator=(StackGuard&&) = delete;

    ~StackGuard() {
        if (std::uncaught_exceptions() == 1 && uncaught_at_creation_ == 0 && !inside_catch_) {
            Trace::of_this_thread().record(mark_);
        }
    }
};

// Logs the exception with the collected marks to errlog and clears them
inline void log_caught_exception(const char* origin, const char* what = nullptr) {
    auto log = errlog(origin, ": Caught exception");
    if (what) {
        log(" -> ", what);
    }
    log("\nStack unwinding marks:");
    auto& trace = Trace::of_this_thread();
    size_t i = 0;
    for (const auto& mark : trace.marks()) {
        log("\n[", i++, "] ", mark.function, " at ", mark.file, ':', mark.line);
    }
    trace.clear();
}

inline void log_caught_exception(const char* origin, const std::exception& e) {
    log_caught_exception(origin, e.what());
}

} // namespace stack_unwinding

#define STACK_UNWINDING_MARK_CONCAT_IMPL(x, y) x##y
#define STACK_UNWINDING_MARK_CONCAT(x, y) STACK_UNWINDING_MARK_CONCAT_IMPL(x, y)

#define STACK_UNWINDING_MARK                                          \
    const ::stack_unwinding::StackGuard                               \
    STACK_UNWINDING_MARK_CONCAT(stack_unwinding_mark_, __COUNTER__) { \
        __FILE__, __LINE__, __PRETTY_FUNCTION__                       \
    }

// Use inside a catch block: ERRLOG_CATCH(e) or ERRLOG_CATCH()
#define ERRLOG_CATCH(...)                    \
    ::stack_unwinding::log_caught_exception( \
        __FILE__ ":" STRINGIFY(__LINE__) __VA_OPT__(, ) __VA_ARGS__ \
    )
