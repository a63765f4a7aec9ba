#include "notify_published.hh"

#include <tasvlib/macros/stack_unwinding.hh>

namespace job_server::job_handlers {

void notify_published(
    tasv::db::Connection& conn,
    JobLog& logger,
    decltype(tasv::jobs::Job::id) job_id,
    tasv::forum::AutomationAgent& automation_agent,
    decltype(tasv::submissions::Submission::id) submission_id,
    decltype(tasv::publications::Publication::id) publication_id
) {
    STACK_UNWINDING_MARK;
    logger("Submission id: ", submission_id, " publication id: ", publication_id);

    auto transaction = conn.start_transaction();
    automation_agent.post_submission_published(submission_id, publication_id);
    finish_job(conn, logger, job_id, tasv::jobs::Job::Status::DONE);
    transaction.commit();
}

} // namespace job_server::job_handlers
