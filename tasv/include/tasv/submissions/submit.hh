#pragma once

#include <cstdint>
#include <string>
#include <tasv/config.hh>
#include <tasv/db/connection.hh>
#include <tasv/forum/automation_agent.hh>
#include <tasv/game_systems/mapping.hh>
#include <tasv/movie_files/ingest.hh>
#include <tasv/movie_files/movie_parser.hh>
#include <tasv/operation_error.hh>
#include <tasv/submissions/submission.hh>
#include <tasv/users/user.hh>
#include <tasv/wiki/wiki_pages.hh>
#include <vector>

namespace tasv::submissions {

struct PreparedMovie {
    movie_files::IngestedMovie ingested;
    game_systems::MappedMovie mapped;
};

// Ingests the uploaded movie, refuses deprecated formats and maps the parse result onto the stored
// systems. Runs outside of any transaction.
OperationResult<PreparedMovie> prepare_movie(
    db::Connection& conn,
    const Config& config,
    movie_files::MovieParser& parser,
    std::string_view upload,
    std::string_view filename
);

// Returns VALIDATION_FAILED naming the first unknown username
OperationResult<std::vector<users::User>>
resolve_authors(db::Connection& conn, const std::vector<std::string>& usernames);

struct SubmitCollaborators {
    movie_files::MovieParser& parser;
    wiki::WikiPages& wiki_pages;
    forum::AutomationAgent& automation_agent;
};

struct SubmitRequest {
    std::string movie_file;
    std::string movie_filename;
    std::string game_name;
    std::string game_version;
    std::string goal;
    std::string rom_name;
    std::string emulator_version;
    std::string encode_embed_link;
    std::vector<std::string> authors; // usernames
    std::string external_authors; // comma-separated
    std::string markup;
};

struct SubmitResult {
    decltype(Submission::id) submission_id;
    std::string title;
};

OperationResult<SubmitResult> submit(
    db::Connection& conn,
    const Config& config,
    const SubmitCollaborators& collaborators,
    const users::Actor& submitter,
    const SubmitRequest& request
);

} // namespace tasv::submissions
