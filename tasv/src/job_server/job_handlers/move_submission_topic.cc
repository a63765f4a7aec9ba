#include "move_submission_topic.hh"

#include <optional>
#include <tasv/forum/automation_agent.hh>
#include <tasv/sql/sql.hh>
#include <tasvlib/macros/stack_unwinding.hh>

using tasv::jobs::Job;
using tasv::sql::Select;

namespace job_server::job_handlers {

void move_submission_topic(
    tasv::db::Connection& conn,
    JobLog& logger,
    decltype(tasv::jobs::Job::id) job_id,
    decltype(tasv::submissions::Submission::id) submission_id,
    uint64_t forum_id
) {
    STACK_UNWINDING_MARK;
    logger("Submission id: ", submission_id, " forum id: ", forum_id);

    auto transaction = conn.start_transaction();
    std::optional<uint64_t> topic_id;
    {
        auto stmt =
            conn.execute(Select("topic_id").from("submissions").where("id=?", submission_id));
        stmt.res_bind(topic_id);
        if (!stmt.next()) {
            topic_id = std::nullopt;
        }
    }
    if (!topic_id) {
        logger("The submission has no discussion topic");
        finish_job(conn, logger, job_id, Job::Status::CANCELLED);
        transaction.commit();
        return;
    }

    tasv::forum::move_topic(conn, *topic_id, forum_id);
    logger("Moved topic ", *topic_id);
    finish_job(conn, logger, job_id, Job::Status::DONE);
    transaction.commit();
}

} // namespace job_server::job_handlers
