#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <tasv/config.hh>
#include <tasv/db/connection.hh>
#include <tasv/movie_files/movie_parser.hh>
#include <tasv/operation_error.hh>
#include <tasv/submissions/submission.hh>
#include <tasv/users/user.hh>
#include <tasv/wiki/wiki_pages.hh>
#include <vector>

namespace tasv::submissions {

struct UpdateCollaborators {
    movie_files::MovieParser& parser;
    wiki::WikiPages& wiki_pages;
};

struct UpdateSubmissionRequest {
    decltype(Submission::id) submission_id;
    // If set, the update fails unless the submission is still at this version
    std::optional<decltype(Submission::version)> expected_version;
    Submission::Status status;

    std::optional<std::string> replacement_movie_file;
    std::string replacement_movie_filename;

    std::optional<uint64_t> intended_class_id;
    std::optional<uint64_t> rejection_reason_id;
    std::optional<uint64_t> game_id;
    std::optional<uint64_t> game_version_id;
    std::optional<uint64_t> game_goal_id;

    std::string game_name;
    std::string game_version;
    std::string goal;
    std::string rom_name;
    std::string emulator_version;
    std::string encode_embed_link;
    std::vector<std::string> authors; // usernames
    std::string external_authors; // comma-separated

    // Set only if the markup was changed
    std::optional<std::string> markup;
    bool minor_edit = false;
    std::string revision_message;
};

struct UpdateSubmissionResult {
    Submission::Status previous_status;
    std::string title;
};

OperationResult<UpdateSubmissionResult> update_submission(
    db::Connection& conn,
    const Config& config,
    const UpdateCollaborators& collaborators,
    const users::Actor& actor,
    const UpdateSubmissionRequest& request,
    time_t now
);

} // namespace tasv::submissions
