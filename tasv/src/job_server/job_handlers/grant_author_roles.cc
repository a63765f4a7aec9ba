#include "grant_author_roles.hh"

#include <string>
#include <tasv/sql/sql.hh>
#include <tasv/users/user.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <vector>

using tasv::jobs::Job;
using tasv::publications::Publication;
using tasv::sql::Select;
using tasv::users::User;

namespace job_server::job_handlers {

void grant_author_roles(
    tasv::db::Connection& conn,
    JobLog& logger,
    decltype(Job::id) job_id,
    tasv::roles::RoleGrantor& role_grantor,
    decltype(Publication::id) publication_id
) {
    STACK_UNWINDING_MARK;
    logger("Publication id: ", publication_id);

    auto transaction = conn.start_transaction();
    std::string title;
    {
        auto stmt = conn.execute(Select("title").from("publications").where("id=?", publication_id));
        stmt.res_bind(title);
        if (!stmt.next()) {
            logger("The publication does not exist");
            finish_job(conn, logger, job_id, Job::Status::CANCELLED);
            transaction.commit();
            return;
        }
    }

    std::vector<decltype(User::id)> author_ids;
    {
        decltype(User::id) user_id = 0;
        auto stmt = conn.execute(Select("user_id")
                                     .from("publication_authors")
                                     .where("publication_id=?", publication_id)
                                     .order_by("ordinal"));
        stmt.res_bind(user_id);
        while (stmt.next()) {
            author_ids.emplace_back(user_id);
        }
    }
    logger("Authors: ", author_ids.size());

    role_grantor.assign_auto_assignable_roles_by_publication(author_ids, title);
    finish_job(conn, logger, job_id, Job::Status::DONE);
    transaction.commit();
}

} // namespace job_server::job_handlers
