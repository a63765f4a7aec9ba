#include <algorithm>
#include <tasv/db/repeat_if_conflicted.hh>
#include <tasv/forum/automation_agent.hh>
#include <tasv/forum/forums.hh>
#include <tasv/job_server/notify.hh>
#include <tasv/jobs/utils.hh>
#include <tasv/sql/sql.hh>
#include <tasv/submissions/authorization.hh>
#include <tasv/submissions/queries.hh>
#include <tasv/submissions/submit.hh>
#include <tasv/submissions/title.hh>
#include <tasv/submissions/update.hh>
#include <tasv/video_sync/video_sync.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/time.hh>

using std::optional;
using std::string;
using std::vector;
using tasv::sql::Select;
using tasv::sql::Update;
using tasv::submissions::Submission;
using tasv::users::Actor;
using tasv::users::User;
using Status = tasv::submissions::Submission::Status;

namespace {

bool judge_is_claiming(Status previous, Status next) noexcept {
    return previous != Status::JUDGING_UNDERWAY && next == Status::JUDGING_UNDERWAY;
}

bool judge_is_unclaiming(Status next) noexcept { return next == Status::NEW; }

bool publisher_is_claiming(Status previous, Status next) noexcept {
    return previous != Status::PUBLICATION_UNDERWAY && next == Status::PUBLICATION_UNDERWAY;
}

bool publisher_is_unclaiming(Status previous, Status next) noexcept {
    return previous == Status::PUBLICATION_UNDERWAY && next == Status::ACCEPTED;
}

optional<string> system_code(tasv::db::Connection& conn, optional<uint64_t> system_id) {
    if (!system_id) {
        return std::nullopt;
    }
    string code;
    auto stmt = conn.execute(Select("code").from("game_systems").where("id=?", *system_id));
    stmt.res_bind(code);
    if (!stmt.next()) {
        return std::nullopt;
    }
    return code;
}

optional<double> frame_rate(tasv::db::Connection& conn, optional<uint64_t> frame_rate_id) {
    if (!frame_rate_id) {
        return std::nullopt;
    }
    double rate = 0;
    auto stmt = conn.execute(
        Select("frame_rate").from("game_system_frame_rates").where("id=?", *frame_rate_id)
    );
    stmt.res_bind(rate);
    if (!stmt.next()) {
        return std::nullopt;
    }
    return rate;
}

// Returns an error message if the catalog references are inconsistent
optional<string> check_catalog(
    tasv::db::Connection& conn,
    optional<uint64_t> game_id,
    optional<uint64_t> game_version_id,
    optional<uint64_t> game_goal_id
) {
    auto belongs_to_game = [&](const char* table, uint64_t id) {
        auto stmt = conn.execute(Select("1").from(table).where("id=? AND game_id=?", id, *game_id));
        return stmt.next();
    };
    if (game_id) {
        auto stmt = conn.execute(Select("1").from("games").where("id=?", *game_id));
        if (!stmt.next()) {
            return concat_tostr("Game ", *game_id, " does not exist");
        }
    } else if (game_version_id || game_goal_id) {
        return "A game version or a goal requires a game";
    }
    if (game_version_id && !belongs_to_game("game_versions", *game_version_id)) {
        return concat_tostr("Game version ", *game_version_id, " does not belong to the game");
    }
    if (game_goal_id && !belongs_to_game("game_goals", *game_goal_id)) {
        return concat_tostr("Goal ", *game_goal_id, " does not belong to the game");
    }
    return std::nullopt;
}

// Returns the current authors of the submission if @p actor may edit it
tasv::OperationResult<vector<User>> authorize_edit(
    tasv::db::Connection& conn, const Actor& actor, const optional<Submission>& submission
) {
    using tasv::ErrorKind;
    using tasv::operation_error;

    if (!submission) {
        return operation_error(ErrorKind::NOT_FOUND, "Submission not found");
    }
    if (submission->status == Status::PUBLISHED) {
        return operation_error(
            ErrorKind::PRECONDITION_FAILED, "Published submissions can not be edited"
        );
    }
    auto authors = tasv::submissions::submission_authors(conn, submission->id);
    if (!tasv::submissions::may_edit_submission(actor, submission->submitter_id, authors)) {
        return operation_error(
            ErrorKind::PRECONDITION_FAILED, "Missing permission to edit the submission"
        );
    }
    return Ok{std::move(authors)};
}

optional<uint64_t> topic_forum(tasv::db::Connection& conn, uint64_t topic_id) {
    uint64_t forum_id;
    auto stmt = conn.execute(Select("forum_id").from("forum_topics").where("id=?", topic_id));
    stmt.res_bind(forum_id);
    if (!stmt.next()) {
        return std::nullopt;
    }
    return forum_id;
}

// Enqueues the forum housekeeping that follows a status change: reopened or playground
// submissions get their topic moved back, rejected and cancelled ones get the grue treatment
bool add_topic_jobs(tasv::db::Connection& conn, const Submission& submission, Status new_status) {
    using tasv::jobs::Job;

    if (!submission.topic_id) {
        return false;
    }
    if (tasv::submissions::is_grue_food(new_status)) {
        tasv::jobs::add_job(
            conn, Job::Type::REJECT_SUBMISSION_TOPIC, submission.id, std::nullopt, ""
        );
        return true;
    }
    auto current_forum = topic_forum(conn, *submission.topic_id);
    optional<uint64_t> destination;
    if (new_status == Status::PLAYGROUND) {
        destination = tasv::forum::PLAYGROUND_FORUM_ID;
    } else if (tasv::submissions::is_work_in_progress(new_status)) {
        destination = tasv::forum::WORKBENCH_FORUM_ID;
    }
    if (!destination || current_forum == destination) {
        return false;
    }
    tasv::jobs::add_job(conn, Job::Type::MOVE_SUBMISSION_TOPIC, submission.id, destination, "");
    return true;
}

} // namespace

namespace tasv::submissions {

OperationResult<UpdateSubmissionResult> update_submission(
    db::Connection& conn,
    const Config& config,
    const UpdateCollaborators& collaborators,
    const Actor& actor,
    const UpdateSubmissionRequest& request,
    time_t now
) {
    STACK_UNWINDING_MARK;
    optional<decltype(Submission::topic_id)::value_type> topic_id;
    UpdateSubmissionResult result;
    bool topic_jobs_added = false;
    try {
        // Checked up front so that an unauthorized request does not get to parse its movie
        if (auto authorized =
                authorize_edit(conn, actor, find_submission(conn, request.submission_id));
            authorized.is_err())
        {
            return Err{authorized.error()};
        }

        optional<PreparedMovie> movie;
        if (request.replacement_movie_file) {
            auto prepared = prepare_movie(
                conn,
                config,
                collaborators.parser,
                *request.replacement_movie_file,
                request.replacement_movie_filename
            );
            if (prepared.is_err()) {
                return Err{prepared.error()};
            }
            movie = std::move(prepared).unwrap();
        }
        auto authors_res = resolve_authors(conn, request.authors);
        if (authors_res.is_err()) {
            return Err{authors_res.error()};
        }
        const auto& authors = authors_res.value();
        if (auto err = check_catalog(
                conn, request.game_id, request.game_version_id, request.game_goal_id
            ))
        {
            return operation_error(ErrorKind::VALIDATION_FAILED, *err);
        }

        auto transaction = conn.start_transaction();
        auto submission = find_submission(conn, request.submission_id, true);
        auto current_authors = authorize_edit(conn, actor, submission);
        if (current_authors.is_err()) {
            return Err{current_authors.error()};
        }
        if (request.expected_version && *request.expected_version != submission->version) {
            return operation_error(
                ErrorKind::PRECONDITION_FAILED, "Submission was modified by someone else"
            );
        }

        auto previous_status = submission->status;
        bool status_changed = previous_status != request.status;
        if (status_changed) {
            const auto& authors_now = current_authors.value();
            bool is_author = actor.id == submission->submitter_id ||
                std::any_of(authors_now.begin(), authors_now.end(), [&](const User& u) {
                    return u.id == actor.id;
                });
            auto available = available_statuses({
                .current_status = previous_status,
                .permissions = actor.permissions,
                .submitted_at = time_t_from_utc_mysql_datetime(submission->created_at),
                .now = now,
                .minimum_hours_before_judgment = config.minimum_hours_before_judgment,
                .is_author_or_submitter = is_author,
                .is_judge = submission->judge_id == actor.id,
                .is_publisher = submission->publisher_id == actor.id,
            });
            if (!available.contains(request.status)) {
                return operation_error(
                    ErrorKind::PRECONDITION_FAILED,
                    "Status can not be changed from ",
                    previous_status.to_str(),
                    " to ",
                    request.status.to_str()
                );
            }
        }

        auto judge_id = submission->judge_id;
        if (judge_is_claiming(previous_status, request.status)) {
            judge_id = actor.id;
        } else if (judge_is_unclaiming(request.status)) {
            judge_id = std::nullopt;
        }
        auto publisher_id = submission->publisher_id;
        if (publisher_is_claiming(previous_status, request.status)) {
            publisher_id = actor.id;
        } else if (publisher_is_unclaiming(previous_status, request.status)) {
            publisher_id = std::nullopt;
        }

        if (movie) {
            const auto& mapped = movie->mapped;
            conn.execute(
                Update("submissions")
                    .set(
                        "system_id=?, system_frame_rate_id=?, frames=?, rerecord_count=?, "
                        "movie_extension=?, movie_file=?, hash=?, hash_type=?, annotations=?, "
                        "warnings=?",
                        mapped.system.id,
                        mapped.frame_rate ? optional{mapped.frame_rate->id} : std::nullopt,
                        mapped.frames,
                        mapped.rerecord_count,
                        mapped.movie_extension,
                        movie->ingested.movie_file,
                        mapped.hash,
                        mapped.hash_type,
                        mapped.annotations,
                        mapped.warnings
                    )
                    .where("id=?", submission->id)
            );
            submission->system_id = mapped.system.id;
            submission->system_frame_rate_id =
                mapped.frame_rate ? optional{mapped.frame_rate->id} : std::nullopt;
            submission->frames = mapped.frames;
        }

        if (status_changed) {
            add_status_history(conn, submission->id, previous_status, request.status, actor.id);
            topic_jobs_added = add_topic_jobs(conn, *submission, request.status);
        }

        auto additional_authors = normalize_csv(request.external_authors);
        vector<decltype(User::id)> author_ids;
        vector<string> author_names;
        for (const auto& author : authors) {
            author_ids.emplace_back(author.id);
            author_names.emplace_back(author.username);
        }
        set_submission_authors(conn, submission->id, author_ids);

        auto title = submission_title(
            submission->id,
            {
                .system_code = system_code(conn, submission->system_id).value_or(""),
                .game_name = request.game_name,
                .goal = request.goal,
                .authors = all_authors(author_names, additional_authors),
                .frames = submission->frames,
                .frame_rate = frame_rate(conn, submission->system_frame_rate_id),
            }
        );

        auto affected_rows =
            conn.execute(
                    Update("submissions")
                        .set(
                            "status=?, judge_id=?, publisher_id=?, rejection_reason_id=?, "
                            "intended_class_id=?, game_id=?, game_version_id=?, game_goal_id=?, "
                            "game_name=?, game_version=?, branch=?, rom_name=?, "
                            "emulator_version=?, encode_embed_link=?, additional_authors=?, "
                            "title=?, updated_at=?, version=version+1",
                            request.status,
                            judge_id,
                            publisher_id,
                            request.status == Status::REJECTED ? request.rejection_reason_id
                                                               : std::nullopt,
                            request.intended_class_id,
                            request.game_id,
                            request.game_version_id,
                            request.game_goal_id,
                            request.game_name,
                            request.game_version,
                            request.goal,
                            request.rom_name,
                            request.emulator_version,
                            video_sync::to_embed_link(request.encode_embed_link),
                            additional_authors,
                            title,
                            utc_mysql_datetime()
                        )
                        .where("id=? AND version=?", submission->id, submission->version)
            )
                .affected_rows();
        if (affected_rows != 1) {
            return operation_error(
                ErrorKind::PRECONDITION_FAILED, "Submission was modified by someone else"
            );
        }

        if (request.markup) {
            call_dependency("Wiki", [&] {
                return collaborators.wiki_pages.add({
                    .page_name = wiki::submission_page_name(submission->id),
                    .markup = *request.markup,
                    .author_id = actor.id,
                    .revision_message = request.revision_message,
                    .minor_edit = request.minor_edit,
                });
            });
        }

        transaction.commit();
        topic_id = submission->topic_id;
        result = {.previous_status = previous_status, .title = std::move(title)};
    } catch (const db::ConcurrencyConflict& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::CONCURRENCY_CONFLICT, "Submission update conflicted");
    } catch (const DependencyFailure& e) {
        ERRLOG_CATCH(e);
        return operation_error(
            ErrorKind::DEPENDENCY_FAILURE, "Submission update failed: ", e.what()
        );
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::UNEXPECTED, "Submission update failed: ", e.what());
    }

    if (topic_jobs_added) {
        job_server::notify_job_server(config.job_server_notify_file);
    }
    if (topic_id) {
        try {
            db::repeat_if_conflicted(config.retry_policy, [&] {
                forum::set_topic_title(conn, *topic_id, result.title);
            });
        } catch (const std::exception& e) {
            // The update is already committed, a stale topic title is only logged
            ERRLOG_CATCH(e);
        }
    }
    return Ok{std::move(result)};
}

} // namespace tasv::submissions
