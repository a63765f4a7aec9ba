#include "common.hh"

#include <tasv/sql/sql.hh>
#include <tasvlib/macros/throw.hh>

using tasv::jobs::Job;

namespace job_server::job_handlers {

void finish_job(
    tasv::db::Connection& conn,
    const JobLog& log,
    decltype(Job::id) job_id,
    decltype(Job::status) status
) {
    throw_assert(
        status == Job::Status::DONE || status == Job::Status::FAILED ||
        status == Job::Status::CANCELLED
    );
    conn.execute(
        tasv::sql::Update("jobs").set("status=?, log=?", status, log.text()).where("id=?", job_id)
    );
}

} // namespace job_server::job_handlers
