#pragma once

#include <string>
#include <tasv/db/connection.hh>
#include <tasv/jobs/job.hh>
#include <tasvlib/concat_tostr.hh>
#include <tasvlib/logger.hh>
#include <type_traits>
#include <utility>

namespace job_server::job_handlers {

// Log of a single job, each line is also written to stdlog
class JobLog {
    std::string text_;

public:
    JobLog() = default;
    JobLog(const JobLog&) = delete;
    JobLog(JobLog&&) = delete;
    JobLog& operator=(const JobLog&) = delete;
    JobLog& operator=(JobLog&&) = delete;
    ~JobLog() = default;

    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    void operator()(Args&&... args) {
        DoubleAppender{stdlog, text_, std::forward<Args>(args)...};
    }

    [[nodiscard]] const std::string& text() const noexcept { return text_; }
};

// Stores the final @p status of the job together with its log
void finish_job(
    tasv::db::Connection& conn,
    const JobLog& log,
    decltype(tasv::jobs::Job::id) job_id,
    decltype(tasv::jobs::Job::status) status
);

} // namespace job_server::job_handlers
