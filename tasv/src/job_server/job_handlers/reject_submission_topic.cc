#include "reject_submission_topic.hh"

#include <optional>
#include <tasv/sql/sql.hh>
#include <tasvlib/macros/stack_unwinding.hh>

using tasv::jobs::Job;
using tasv::sql::Select;
using tasv::submissions::Submission;

namespace job_server::job_handlers {

void reject_submission_topic(
    tasv::db::Connection& conn,
    JobLog& logger,
    decltype(tasv::jobs::Job::id) job_id,
    tasv::forum::AutomationAgent& automation_agent,
    decltype(tasv::submissions::Submission::id) submission_id
) {
    STACK_UNWINDING_MARK;
    logger("Submission id: ", submission_id);

    auto transaction = conn.start_transaction();
    std::optional<Submission::Status> status;
    {
        Submission::Status row_status;
        auto stmt =
            conn.execute(Select("status").from("submissions").where("id=?", submission_id));
        stmt.res_bind(row_status);
        if (stmt.next()) {
            status = row_status;
        }
    }
    if (!status) {
        logger("The submission does not exist");
        finish_job(conn, logger, job_id, Job::Status::CANCELLED);
        transaction.commit();
        return;
    }
    // The submission may have been reopened before the job ran
    if (!tasv::submissions::is_grue_food(*status)) {
        logger("The submission is ", status->to_str(), " now, leaving the topic in place");
        finish_job(conn, logger, job_id, Job::Status::CANCELLED);
        transaction.commit();
        return;
    }

    automation_agent.reject_and_move(submission_id);
    finish_job(conn, logger, job_id, Job::Status::DONE);
    transaction.commit();
}

} // namespace job_server::job_handlers
