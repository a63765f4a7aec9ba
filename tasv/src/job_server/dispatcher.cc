#include "dispatcher.hh"
#include "job_handlers/common.hh"
#include "job_handlers/grant_author_roles.hh"
#include "job_handlers/move_submission_topic.hh"
#include "job_handlers/notify_published.hh"
#include "job_handlers/reject_submission_topic.hh"
#include "job_handlers/sync_video.hh"

#include <optional>
#include <tasv/jobs/job.hh>
#include <tasv/sql/sql.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/macros/throw.hh>

using tasv::jobs::Job;
using tasv::sql::Select;
using tasv::sql::Update;

namespace {

struct Task {
    decltype(Job::id) job_id;
    decltype(Job::type) job_type;
    decltype(Job::aux_id) job_aux_id;
    decltype(Job::aux_id_2) job_aux_id_2;
    decltype(Job::info) job_info;
};

std::optional<Task> next_pending_job(tasv::db::Connection& conn) {
    Task task;
    auto stmt = conn.execute(Select("id, type, aux_id, aux_id_2, info")
                                 .from("jobs")
                                 .where("status=?", Job::Status::PENDING)
                                 .order_by("priority DESC, id")
                                 .limit("1"));
    stmt.res_bind(task.job_id, task.job_type, task.job_aux_id, task.job_aux_id_2, task.job_info);
    if (!stmt.next()) {
        return std::nullopt;
    }
    return task;
}

void process_task(
    tasv::db::Connection& conn,
    const tasv::db::RetryPolicy& retry_policy,
    const job_server::JobCollaborators& collaborators,
    const Task& task
) {
    stdlog("Processing job ", task.job_id, " (", task.job_type.to_str(), ')');
    job_server::job_handlers::JobLog logger;
    try {
        // NOLINTNEXTLINE(bugprone-switch-missing-default-case)
        switch (task.job_type) {
        case Job::Type::SYNC_VIDEO:
            job_server::job_handlers::sync_video(
                conn,
                logger,
                task.job_id,
                collaborators.video_sync,
                collaborators.wiki_pages,
                task.job_aux_id.value(),
                task.job_info
            );
            return;

        case Job::Type::GRANT_AUTHOR_ROLES:
            job_server::job_handlers::grant_author_roles(
                conn, logger, task.job_id, collaborators.role_grantor, task.job_aux_id.value()
            );
            return;

        case Job::Type::NOTIFY_PUBLISHED:
            job_server::job_handlers::notify_published(
                conn,
                logger,
                task.job_id,
                collaborators.automation_agent,
                task.job_aux_id.value(),
                task.job_aux_id_2.value()
            );
            return;

        case Job::Type::MOVE_SUBMISSION_TOPIC:
            job_server::job_handlers::move_submission_topic(
                conn, logger, task.job_id, task.job_aux_id.value(), task.job_aux_id_2.value()
            );
            return;

        case Job::Type::REJECT_SUBMISSION_TOPIC:
            job_server::job_handlers::reject_submission_topic(
                conn, logger, task.job_id, collaborators.automation_agent, task.job_aux_id.value()
            );
            return;
        }
        THROW("invalid task.job_type");
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        logger("Caught exception: ", e.what());
        tasv::db::repeat_if_conflicted(retry_policy, [&] {
            job_server::job_handlers::finish_job(conn, logger, task.job_id, Job::Status::FAILED);
        });
    }
}

} // namespace

namespace job_server {

size_t drain_pending_jobs(
    tasv::db::Connection& conn,
    const tasv::db::RetryPolicy& retry_policy,
    const JobCollaborators& collaborators
) {
    STACK_UNWINDING_MARK;
    size_t processed = 0;
    for (;;) {
        auto task = next_pending_job(conn);
        if (!task) {
            return processed;
        }
        auto taken = tasv::db::repeat_if_conflicted(retry_policy, [&] {
            return conn
                       .execute(Update("jobs")
                                    .set("status=?", Job::Status::IN_PROGRESS)
                                    .where("id=? AND status=?", task->job_id, Job::Status::PENDING)
                       )
                       .affected_rows() == 1;
        });
        if (!taken) {
            continue; // Another worker took it first
        }
        process_task(conn, retry_policy, collaborators, *task);
        ++processed;
    }
}

void reset_in_progress_jobs(tasv::db::Connection& conn) {
    STACK_UNWINDING_MARK;
    conn.execute(Update("jobs")
                     .set("status=?", Job::Status::PENDING)
                     .where("status=?", Job::Status::IN_PROGRESS));
}

} // namespace job_server
