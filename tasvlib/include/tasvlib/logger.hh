#pragma once

#include <atomic>
#include <cstdio>
#include <string>
#include <tasvlib/concat_tostr.hh>
#include <utility>

// Line oriented log. A line is collected by an Appender and written at once when the Appender
// dies, so lines from different threads never interleave.
class Logger {
    FILE* f_;
    bool owns_stream_ = false;
    std::atomic<bool> label_{true};

    void close() noexcept {
        if (owns_stream_) {
            owns_stream_ = false;
            (void)fclose(f_);
        }
    }

public:
    // Opens @p filename in append mode, throws std::runtime_error on failure
    explicit Logger(const std::string& filename);

    // Does not take ownership of @p stream, nullptr makes the logger discard everything
    explicit Logger(FILE* stream) noexcept : f_(stream) {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    ~Logger() { close(); }

    // Switches to @p filename opened in append mode. On failure throws std::runtime_error and
    // keeps the current stream.
    void open(const std::string& filename);

    // Switches to @p stream without taking ownership of it
    void use(FILE* stream) noexcept {
        close();
        f_ = stream;
    }

    // Switches to @p stream and returns the previous one, ownership is not transferred
    FILE* exchange_log_stream(FILE* stream) noexcept { return std::exchange(f_, stream); }

    // Whether lines begin with the "[ date ] " label
    [[nodiscard]] bool label() const noexcept { return label_.load(std::memory_order_relaxed); }

    // Returns the previous setting
    bool label(bool add_label) noexcept { return label_.exchange(add_label); }

    class Appender {
        friend class Logger;

        Logger& logger_;
        bool label_;
        bool pending_ = false;
        std::string buff_;

        explicit Appender(Logger& logger) : logger_(logger), label_(logger.label()) {}

        void flush() noexcept;

    public:
        Appender(const Appender&) = delete;

        Appender(Appender&& other) noexcept
        : logger_(other.logger_)
        , label_(other.label_)
        , pending_(std::exchange(other.pending_, false))
        , buff_(std::move(other.buff_)) {}

        Appender& operator=(const Appender&) = delete;
        Appender& operator=(Appender&&) = delete;

        ~Appender() { flush(); }

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        Appender& operator()(Args&&... args) {
            back_insert(buff_, std::forward<Args>(args)...);
            pending_ = true;
            return *this;
        }

        template <class T>
        Appender& operator<<(T&& x) {
            return operator()(std::forward<T>(x));
        }
    };

    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    Appender operator()(Args&&... args) {
        Appender app(*this);
        app(std::forward<Args>(args)...);
        return app;
    }
};

// Both write to stderr until the executable redirects them
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
inline Logger stdlog(stderr);
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
inline Logger errlog(stderr);

// Writes the same line to a Logger and appends it to a string
class DoubleAppender {
    Logger::Appender app_;
    std::string& str_;

public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    DoubleAppender(Logger& logger, std::string& str, Args&&... args)
    : app_(logger(args...))
    , str_(str) {
        back_insert(str_, std::forward<Args>(args)...);
        str_.reserve(str_.size() + 1); // for the '\n' appended in the destructor
    }

    DoubleAppender(const DoubleAppender&) = delete;
    DoubleAppender(DoubleAppender&&) = delete;
    DoubleAppender& operator=(const DoubleAppender&) = delete;
    DoubleAppender& operator=(DoubleAppender&&) = delete;

    ~DoubleAppender() { str_.push_back('\n'); }

    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    DoubleAppender& operator()(Args&&... args) {
        back_insert(str_, args...);
        str_.reserve(str_.size() + 1);
        app_(std::forward<Args>(args)...);
        return *this;
    }
};
