#include <tasv/sql/sql.hh>
#include <tasv/submissions/queries.hh>
#include <tasv/submissions/submit.hh>
#include <tasv/submissions/title.hh>
#include <tasv/video_sync/video_sync.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/time.hh>

using std::string;
using std::string_view;
using std::vector;
using tasv::sql::InsertInto;
using tasv::sql::Update;
using tasv::users::Actor;
using tasv::users::PermissionTo;
using tasv::users::User;

namespace {

string trim_quotes(string_view str) {
    while (!str.empty() && str.front() == '"') {
        str.remove_prefix(1);
    }
    while (!str.empty() && str.back() == '"') {
        str.remove_suffix(1);
    }
    return string{str};
}

} // namespace

namespace tasv::submissions {

OperationResult<PreparedMovie> prepare_movie(
    db::Connection& conn,
    const Config& config,
    movie_files::MovieParser& parser,
    string_view upload,
    string_view filename
) {
    STACK_UNWINDING_MARK;
    auto ingested = movie_files::ingest_movie(
        parser, upload, filename, config.max_decompressed_movie_size
    );
    if (ingested.is_err()) {
        return Err{ingested.error()};
    }
    const auto& parse_result = ingested.value().parse_result;
    if (is_deprecated_movie_format(conn, parse_result.file_extension)) {
        return operation_error(
            ErrorKind::VALIDATION_FAILED,
            '.',
            parse_result.file_extension,
            " is no longer submittable"
        );
    }

    auto mapped = game_systems::map_parse_result(conn, config.retry_policy, parse_result);
    if (mapped.is_err()) {
        return Err{mapped.error()};
    }
    return Ok{PreparedMovie{
        .ingested = std::move(ingested).unwrap(),
        .mapped = std::move(mapped).unwrap(),
    }};
}

OperationResult<vector<User>>
resolve_authors(db::Connection& conn, const vector<string>& usernames) {
    STACK_UNWINDING_MARK;
    vector<User> res;
    for (const auto& username : usernames) {
        auto user = find_user_by_username(conn, username);
        if (!user) {
            return operation_error(ErrorKind::VALIDATION_FAILED, "Unknown author: ", username);
        }
        res.emplace_back(std::move(*user));
    }
    return Ok{std::move(res)};
}

OperationResult<SubmitResult> submit(
    db::Connection& conn,
    const Config& config,
    const SubmitCollaborators& collaborators,
    const Actor& submitter,
    const SubmitRequest& request
) {
    STACK_UNWINDING_MARK;
    if (!submitter.can(PermissionTo::SUBMIT_MOVIES)) {
        return operation_error(ErrorKind::PRECONDITION_FAILED, "Missing permission: submit_movies");
    }

    try {
        auto movie = prepare_movie(
            conn, config, collaborators.parser, request.movie_file, request.movie_filename
        );
        if (movie.is_err()) {
            return Err{movie.error()};
        }
        const auto& mapped = movie.value().mapped;
        auto authors = resolve_authors(conn, request.authors);
        if (authors.is_err()) {
            return Err{authors.error()};
        }
        if (authors.value().empty() && normalize_csv(request.external_authors).empty()) {
            return operation_error(ErrorKind::VALIDATION_FAILED, "A submission needs an author");
        }

        auto transaction = conn.start_transaction();
        auto now = utc_mysql_datetime();
        auto additional_authors = normalize_csv(request.external_authors);
        auto goal = trim_quotes(request.goal);
        auto submission_id =
            conn.execute(
                    InsertInto(
                        "submissions (version, status, created_at, updated_at, submitter_id, "
                        "system_id, system_frame_rate_id, game_name, game_version, branch, "
                        "rom_name, emulator_version, encode_embed_link, additional_authors, frames, "
                        "rerecord_count, movie_extension, movie_file, hash, hash_type, annotations, "
                        "warnings, title)"
                    )
                        .values(
                            "0, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ''",
                            Submission::Status::NEW,
                            now,
                            now,
                            submitter.id,
                            mapped.system.id,
                            mapped.frame_rate ? std::optional{mapped.frame_rate->id} : std::nullopt,
                            request.game_name,
                            request.game_version,
                            goal,
                            request.rom_name,
                            request.emulator_version,
                            video_sync::to_embed_link(request.encode_embed_link),
                            additional_authors,
                            mapped.frames,
                            mapped.rerecord_count,
                            mapped.movie_extension,
                            movie.value().ingested.movie_file,
                            mapped.hash,
                            mapped.hash_type,
                            mapped.annotations,
                            mapped.warnings
                        )
            )
                .insert_id();

        vector<decltype(User::id)> author_ids;
        vector<string> author_names;
        for (const auto& author : authors.value()) {
            author_ids.emplace_back(author.id);
            author_names.emplace_back(author.username);
        }
        set_submission_authors(conn, submission_id, author_ids);

        call_dependency("Wiki", [&] {
            return collaborators.wiki_pages.add({
                .page_name = wiki::submission_page_name(submission_id),
                .markup = request.markup,
                .author_id = submitter.id,
                .revision_message = concat_tostr("Auto-generated from Submission #", submission_id),
            });
        });

        auto title = submission_title(
            submission_id,
            {
                .system_code = mapped.system.code,
                .game_name = request.game_name,
                .goal = goal,
                .authors = all_authors(author_names, additional_authors),
                .frames = mapped.frames,
                .frame_rate = mapped.frame_rate
                    ? std::optional{mapped.frame_rate->frame_rate}
                    : std::nullopt,
            }
        );
        auto topic_id = call_dependency("Forum", [&] {
            return collaborators.automation_agent.post_submission_topic(submission_id, title);
        });
        conn.execute(Update("submissions")
                         .set("title=?, topic_id=?", title, topic_id)
                         .where("id=?", submission_id));

        transaction.commit();
        stdlog("Submission ", submission_id, " created by ", submitter.username, ": ", title);
        return Ok{SubmitResult{.submission_id = submission_id, .title = std::move(title)}};
    } catch (const DependencyFailure& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::DEPENDENCY_FAILURE, "Submission failed: ", e.what());
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::UNEXPECTED, "Submission failed: ", e.what());
    }
}

} // namespace tasv::submissions
