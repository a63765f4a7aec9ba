#include <ctime>
#include <tasvlib/errmsg.hh>
#include <tasvlib/logger.hh>
#include <tasvlib/macros/throw.hh>

namespace {

FILE* open_log_file(const std::string& filename) {
    FILE* f = fopen(filename.c_str(), "ae");
    if (f == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
    return f;
}

// Writes "[ YYYY-mm-dd HH:MM:SS ] " with the local time
void write_label(FILE* f) noexcept {
    time_t now = time(nullptr);
    struct tm t = {};
    char buff[32];
    if (now != static_cast<time_t>(-1) && localtime_r(&now, &t) &&
        strftime(buff, sizeof(buff), "%Y-%m-%d %H:%M:%S", &t) > 0)
    {
        (void)fprintf(f, "[ %s ] ", buff);
    } else {
        (void)fputs("[ unknown time ] ", f);
    }
}

} // namespace

Logger::Logger(const std::string& filename) : f_(open_log_file(filename)), owns_stream_(true) {}

void Logger::open(const std::string& filename) {
    FILE* f = open_log_file(filename);
    close();
    f_ = f;
    owns_stream_ = true;
}

void Logger::Appender::flush() noexcept {
    if (!pending_) {
        return;
    }
    pending_ = false;

    FILE* f = logger_.f_;
    if (f == nullptr) {
        return;
    }
    flockfile(f);
    if (label_) {
        write_label(f);
    }
    (void)fwrite(buff_.data(), 1, buff_.size(), f);
    (void)fputc('\n', f);
    (void)fflush(f);
    funlockfile(f);
}
