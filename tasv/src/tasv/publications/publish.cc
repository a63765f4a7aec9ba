#include <algorithm>
#include <tasv/job_server/notify.hh>
#include <tasv/jobs/utils.hh>
#include <tasv/publications/obsolescence.hh>
#include <tasv/publications/publish.hh>
#include <tasv/sql/sql.hh>
#include <tasv/submissions/queries.hh>
#include <tasv/submissions/title.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/time.hh>

using std::optional;
using std::string;
using std::vector;
using tasv::sql::InsertInto;
using tasv::sql::Select;
using tasv::sql::Update;
using tasv::submissions::Submission;
using tasv::users::PermissionTo;

namespace {

// Everything a publishable submission has to have
bool can_publish(const Submission& s) noexcept {
    return s.status == Submission::Status::PUBLICATION_UNDERWAY && s.intended_class_id &&
        s.system_id && s.system_frame_rate_id && s.game_id && s.game_version_id && s.game_goal_id;
}

bool movie_file_name_taken(tasv::db::Connection& conn, const string& movie_file_name) {
    auto stmt =
        conn.execute(Select("1").from("publications").where("movie_file_name=?", movie_file_name));
    return stmt.next();
}

tasv::submissions::TitleParts
title_parts(tasv::db::Connection& conn, const Submission& s, vector<string> authors) {
    tasv::submissions::TitleParts parts{
        .authors = std::move(authors),
        .frames = s.frames,
    };
    {
        auto stmt = conn.execute(Select("code").from("game_systems").where("id=?", *s.system_id));
        stmt.res_bind(parts.system_code);
        throw_assert(stmt.next());
    }
    {
        double frame_rate = 0;
        auto stmt = conn.execute(Select("frame_rate")
                                     .from("game_system_frame_rates")
                                     .where("id=?", *s.system_frame_rate_id));
        stmt.res_bind(frame_rate);
        throw_assert(stmt.next());
        parts.frame_rate = frame_rate;
    }
    {
        auto stmt =
            conn.execute(Select("display_name").from("games").where("id=?", *s.game_id));
        stmt.res_bind(parts.game_name);
        throw_assert(stmt.next());
    }
    {
        auto stmt =
            conn.execute(Select("display_name").from("game_goals").where("id=?", *s.game_goal_id));
        stmt.res_bind(parts.goal);
        throw_assert(stmt.next());
    }
    return parts;
}

void add_url(
    tasv::db::Connection& conn,
    uint64_t publication_id,
    const string& url,
    optional<string> display_name,
    tasv::publications::PublicationUrl::Type type
) {
    conn.execute(InsertInto("publication_urls (publication_id, url, display_name, type)")
                     .values("?, ?, ?, ?", publication_id, url, display_name, type));
}

} // namespace

namespace tasv::publications {

OperationResult<PublishResult> publish(
    db::Connection& conn,
    const Config& config,
    const PublishCollaborators& collaborators,
    const users::Actor& publisher,
    const PublishRequest& request
) {
    STACK_UNWINDING_MARK;
    if (!publisher.can(PermissionTo::PUBLISH_MOVIES)) {
        return operation_error(
            ErrorKind::PRECONDITION_FAILED, "Missing permission: publish_movies"
        );
    }
    if (request.online_watching_url.empty()) {
        return operation_error(ErrorKind::VALIDATION_FAILED, "Online watching url is required");
    }

    PublishResult result;
    try {
        auto transaction = conn.start_transaction();
        // Preconditions are checked against the most recently committed rows before any write
        auto submission = submissions::find_submission(conn, request.submission_id, true);
        if (!submission) {
            return operation_error(ErrorKind::NOT_FOUND, "Submission not found");
        }
        if (!can_publish(*submission)) {
            return operation_error(
                ErrorKind::PRECONDITION_FAILED, "Submission can not be published"
            );
        }

        auto movie_file_name = concat_tostr(request.movie_filename, '.', submission->movie_extension);
        if (movie_file_name_taken(conn, movie_file_name)) {
            return operation_error(
                ErrorKind::PRECONDITION_FAILED, "Movie filename ", movie_file_name, " already exists"
            );
        }

        if (request.movie_to_obsolete) {
            uint64_t game_id = 0;
            auto stmt = conn.execute(
                Select("game_id").from("publications").where("id=?", *request.movie_to_obsolete)
            );
            stmt.res_bind(game_id);
            if (!stmt.next()) {
                return operation_error(
                    ErrorKind::NOT_FOUND, "Publication to obsolete does not exist"
                );
            }
            if (game_id != *submission->game_id) {
                return operation_error(
                    ErrorKind::PRECONDITION_FAILED,
                    "Publication to obsolete belongs to a different game"
                );
            }
        }

        auto now = utc_mysql_datetime();
        auto publication_id =
            conn.execute(
                    InsertInto(
                        "publications (created_at, submission_id, publication_class_id, "
                        "system_id, system_frame_rate_id, game_id, game_version_id, game_goal_id, "
                        "emulator_version, frames, rerecord_count, movie_file_name, "
                        "additional_authors, title)"
                    )
                        .values(
                            "?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ''",
                            now,
                            submission->id,
                            *submission->intended_class_id,
                            *submission->system_id,
                            *submission->system_frame_rate_id,
                            *submission->game_id,
                            *submission->game_version_id,
                            *submission->game_goal_id,
                            submission->emulator_version,
                            submission->frames,
                            submission->rerecord_count,
                            movie_file_name,
                            submission->additional_authors
                        )
            )
                .insert_id();

        // The submission keeps its copy of the movie for the audit trail
        conn.execute(InsertInto("movie_files (publication_id, file_name, contents, created_at)")
                         .select(Select("?, ?, movie_file, ?", publication_id, movie_file_name, now)
                                     .from("submissions")
                                     .where("id=?", submission->id)));

        add_url(
            conn,
            publication_id,
            request.online_watching_url,
            std::nullopt,
            PublicationUrl::Type::STREAMING
        );
        if (!request.mirror_site_url.empty()) {
            add_url(
                conn,
                publication_id,
                request.mirror_site_url,
                std::nullopt,
                PublicationUrl::Type::MIRROR
            );
        }
        if (!request.alternate_online_watching_url.empty()) {
            add_url(
                conn,
                publication_id,
                request.alternate_online_watching_url,
                request.alternate_online_watching_url_name,
                PublicationUrl::Type::STREAMING
            );
        }

        auto authors = submissions::submission_authors(conn, submission->id);
        vector<string> author_names;
        for (size_t i = 0; i < authors.size(); ++i) {
            conn.execute(InsertInto("publication_authors (publication_id, user_id, ordinal)")
                             .values("?, ?, ?", publication_id, authors[i].id, i));
            author_names.emplace_back(authors[i].username);
        }
        for (auto flag_id : request.flag_ids) {
            conn.execute(InsertInto("publication_flags (publication_id, flag_id)")
                             .values("?, ?", publication_id, flag_id));
        }
        for (auto tag_id : request.tag_ids) {
            conn.execute(InsertInto("publication_tags (publication_id, tag_id)")
                             .values("?, ?", publication_id, tag_id));
        }

        // Title needs the publication to exist
        auto title = submissions::publication_title(title_parts(
            conn,
            *submission,
            submissions::all_authors(author_names, submission->additional_authors)
        ));
        conn.execute(
            Update("publications").set("title=?", title).where("id=?", publication_id)
        );

        call_dependency("Wiki", [&] {
            return collaborators.wiki_pages.add({
                .page_name = wiki::publication_page_name(publication_id),
                .markup = request.movie_description,
                .author_id = publisher.id,
                .revision_message = concat_tostr("Auto-generated from Movie #", publication_id),
            });
        });

        submissions::add_status_history(
            conn,
            submission->id,
            submission->status,
            Submission::Status::PUBLISHED,
            publisher.id
        );
        auto affected_rows = conn.execute(Update("submissions")
                                              .set(
                                                  "status=?, updated_at=?, version=version+1",
                                                  Submission::Status::PUBLISHED,
                                                  now
                                              )
                                              .where(
                                                  "id=? AND version=? AND status=?",
                                                  submission->id,
                                                  submission->version,
                                                  submission->status
                                              ))
                                 .affected_rows();
        if (affected_rows != 1) {
            return operation_error(
                ErrorKind::PRECONDITION_FAILED, "Submission was modified by someone else"
            );
        }

        if (request.movie_to_obsolete) {
            auto obsoleted = obsolete_with(
                conn, config, collaborators.video_sync, *request.movie_to_obsolete, publication_id
            );
            if (obsoleted.is_err()) {
                return Err{obsoleted.error()};
            }
        }

        jobs::add_job(
            conn, jobs::Job::Type::GRANT_AUTHOR_ROLES, publication_id, std::nullopt, ""
        );
        jobs::add_job(
            conn, jobs::Job::Type::NOTIFY_PUBLISHED, submission->id, publication_id, ""
        );
        jobs::add_sync_video_jobs(conn, collaborators.video_sync, publication_id);

        transaction.commit();
        stdlog(
            "Submission ", submission->id, " published as ", publication_id, " by ",
            publisher.username, ": ", title
        );
        result = {.publication_id = publication_id, .title = std::move(title)};
    } catch (const db::DuplicateKey& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::PRECONDITION_FAILED, "Publication already exists");
    } catch (const db::ConcurrencyConflict& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::PRECONDITION_FAILED, "Unable to publish");
    } catch (const DependencyFailure& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::DEPENDENCY_FAILURE, "Publication failed: ", e.what());
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::UNEXPECTED, "Publication failed: ", e.what());
    }

    job_server::notify_job_server(config.job_server_notify_file);
    return Ok{std::move(result)};
}

} // namespace tasv::publications
