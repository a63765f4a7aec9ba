#pragma once

#include "common.hh"

#include <tasv/db/connection.hh>
#include <tasv/forum/automation_agent.hh>
#include <tasv/jobs/job.hh>
#include <tasv/submissions/submission.hh>

namespace job_server::job_handlers {

void reject_submission_topic(
    tasv::db::Connection& conn,
    JobLog& logger,
    decltype(tasv::jobs::Job::id) job_id,
    tasv::forum::AutomationAgent& automation_agent,
    decltype(tasv::submissions::Submission::id) submission_id
);

} // namespace job_server::job_handlers
