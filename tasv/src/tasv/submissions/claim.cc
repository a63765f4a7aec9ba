#include <string_view>
#include <tasv/sql/sql.hh>
#include <tasv/submissions/claim.hh>
#include <tasv/submissions/queries.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/time.hh>

using std::string;
using std::string_view;
using tasv::sql::Update;
using tasv::users::Actor;
using tasv::users::PermissionTo;

namespace {

using tasv::submissions::Submission;

struct ClaimKind {
    Submission::Status required_status;
    Submission::Status target_status;
    PermissionTo required_permission;
    bool assign_to_judge;
    string_view wiki_message;
    string_view revision_message;
    bool watch_topic;
};

constexpr ClaimKind for_judging = {
    .required_status = Submission::Status::NEW,
    .target_status = Submission::Status::JUDGING_UNDERWAY,
    .required_permission = PermissionTo::JUDGE_SUBMISSIONS,
    .assign_to_judge = true,
    .wiki_message = "Claiming for judging.",
    .revision_message = "Claimed for judging",
    .watch_topic = true,
};

constexpr ClaimKind for_publishing = {
    .required_status = Submission::Status::ACCEPTED,
    .target_status = Submission::Status::PUBLICATION_UNDERWAY,
    .required_permission = PermissionTo::PUBLISH_MOVIES,
    .assign_to_judge = false,
    .wiki_message = "Processing...",
    .revision_message = "Claimed for publication",
    .watch_topic = false,
};

tasv::OperationResult<string> claim(
    tasv::db::Connection& conn,
    const tasv::submissions::ClaimCollaborators& collaborators,
    const Actor& actor,
    decltype(Submission::id) submission_id,
    const ClaimKind& kind
) {
    STACK_UNWINDING_MARK;
    using tasv::ErrorKind;
    using tasv::operation_error;

    if (!actor.can(kind.required_permission)) {
        return operation_error(
            ErrorKind::PRECONDITION_FAILED,
            "Missing permission: ",
            kind.required_permission.to_str()
        );
    }

    try {
        auto transaction = conn.start_transaction();
        // The status is checked against the row as most recently committed, so that a claim that
        // lost the race fails here instead of overwriting the winner
        auto submission = tasv::submissions::find_submission(conn, submission_id, true);
        if (!submission) {
            return operation_error(ErrorKind::NOT_FOUND, "Submission not found");
        }
        if (submission->status != kind.required_status) {
            return operation_error(ErrorKind::PRECONDITION_FAILED, "Submission can not be claimed");
        }

        tasv::submissions::add_status_history(
            conn, submission_id, submission->status, kind.target_status, actor.id
        );

        auto affected_rows =
            conn.execute(Update("submissions")
                             .set(
                                 kind.assign_to_judge
                                     ? "status=?, judge_id=?, updated_at=?, version=version+1"
                                     : "status=?, publisher_id=?, updated_at=?, version=version+1",
                                 kind.target_status,
                                 actor.id,
                                 utc_mysql_datetime()
                             )
                             .where(
                                 "id=? AND version=? AND status=?",
                                 submission_id,
                                 submission->version,
                                 kind.required_status
                             ))
                .affected_rows();
        if (affected_rows != 1) {
            return operation_error(ErrorKind::PRECONDITION_FAILED, "Unable to claim");
        }

        auto page_name = tasv::wiki::submission_page_name(submission_id);
        tasv::call_dependency("Wiki", [&] {
            auto page = collaborators.wiki_pages.page(page_name);
            return collaborators.wiki_pages.add({
                .page_name = page_name,
                .markup = concat_tostr(
                    page ? page->markup : string{},
                    "\n----\n[user:",
                    actor.username,
                    "]: ",
                    kind.wiki_message
                ),
                .author_id = actor.id,
                .revision_message = string{kind.revision_message},
            });
        });

        if (kind.watch_topic && submission->topic_id) {
            tasv::call_dependency("Forum", [&] {
                collaborators.topic_watcher.watch_topic(*submission->topic_id, actor.id, true);
            });
        }

        transaction.commit();
        return Ok{std::move(submission->title)};
    } catch (const tasv::db::ConcurrencyConflict& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::PRECONDITION_FAILED, "Unable to claim");
    } catch (const tasv::DependencyFailure& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::DEPENDENCY_FAILURE, "Unable to claim: ", e.what());
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::UNEXPECTED, "Unable to claim: ", e.what());
    }
}

} // namespace

namespace tasv::submissions {

OperationResult<string> claim_for_judging(
    db::Connection& conn,
    const ClaimCollaborators& collaborators,
    const Actor& actor,
    decltype(Submission::id) submission_id
) {
    return claim(conn, collaborators, actor, submission_id, for_judging);
}

OperationResult<string> claim_for_publishing(
    db::Connection& conn,
    const ClaimCollaborators& collaborators,
    const Actor& actor,
    decltype(Submission::id) submission_id
) {
    return claim(conn, collaborators, actor, submission_id, for_publishing);
}

} // namespace tasv::submissions
