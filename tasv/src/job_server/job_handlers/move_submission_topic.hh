#pragma once

#include "common.hh"

#include <cstdint>
#include <tasv/db/connection.hh>
#include <tasv/jobs/job.hh>
#include <tasv/submissions/submission.hh>

namespace job_server::job_handlers {

void move_submission_topic(
    tasv::db::Connection& conn,
    JobLog& logger,
    decltype(tasv::jobs::Job::id) job_id,
    decltype(tasv::submissions::Submission::id) submission_id,
    uint64_t forum_id
);

} // namespace job_server::job_handlers
