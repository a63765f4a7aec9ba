#pragma once

#include "common.hh"

#include <tasv/db/connection.hh>
#include <tasv/jobs/job.hh>
#include <tasv/publications/publication.hh>
#include <tasv/roles/role_grantor.hh>

namespace job_server::job_handlers {

void grant_author_roles(
    tasv::db::Connection& conn,
    JobLog& logger,
    decltype(tasv::jobs::Job::id) job_id,
    tasv::roles::RoleGrantor& role_grantor,
    decltype(tasv::publications::Publication::id) publication_id
);

} // namespace job_server::job_handlers
