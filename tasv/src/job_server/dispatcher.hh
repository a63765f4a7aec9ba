#pragma once

#include <cstddef>
#include <tasv/db/connection.hh>
#include <tasv/db/repeat_if_conflicted.hh>
#include <tasv/forum/automation_agent.hh>
#include <tasv/roles/role_grantor.hh>
#include <tasv/video_sync/video_sync.hh>
#include <tasv/wiki/wiki_pages.hh>

namespace job_server {

struct JobCollaborators {
    tasv::video_sync::VideoSync& video_sync;
    tasv::roles::RoleGrantor& role_grantor;
    tasv::forum::AutomationAgent& automation_agent;
    tasv::wiki::WikiPages& wiki_pages;
};

// Processes pending jobs in the order of priority until there are none left. A job is taken with
// a conditional PENDING -> IN_PROGRESS update, so a job taken by another worker is skipped. A
// failing job is marked FAILED and does not stop the others. Returns the number of processed jobs.
size_t drain_pending_jobs(
    tasv::db::Connection& conn,
    const tasv::db::RetryPolicy& retry_policy,
    const JobCollaborators& collaborators
);

// Marks jobs left IN_PROGRESS by a previous run as PENDING
void reset_in_progress_jobs(tasv::db::Connection& conn);

} // namespace job_server
