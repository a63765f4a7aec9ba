#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tasv/db/connection.hh>
#include <tasv/submissions/submission.hh>
#include <tasv/users/user.hh>
#include <vector>

namespace tasv::submissions {

// @p for_update locks the row on backends with row locks, requires an active transaction
std::optional<Submission>
find_submission(db::Connection& conn, decltype(Submission::id) submission_id, bool for_update = false);

uint64_t submission_count(db::Connection& conn, decltype(users::User::id) submitter_id);

// In the order of insertion
std::vector<StatusHistoryEntry>
status_history(db::Connection& conn, decltype(Submission::id) submission_id);

void add_status_history(
    db::Connection& conn,
    decltype(Submission::id) submission_id,
    Submission::Status previous_status,
    Submission::Status status,
    std::optional<decltype(users::User::id)> actor_id
);

// Ordered by ordinal
std::vector<users::User>
submission_authors(db::Connection& conn, decltype(Submission::id) submission_id);

// Replaces the authors of the submission with @p author_ids, the ordinal is the position in the
// vector
void set_submission_authors(
    db::Connection& conn,
    decltype(Submission::id) submission_id,
    const std::vector<decltype(users::User::id)>& author_ids
);

std::optional<users::User> find_user_by_username(db::Connection& conn, std::string_view username);

// Returns whether files with extension @p ext (without the leading '.') may not be submitted
bool is_deprecated_movie_format(db::Connection& conn, std::string_view ext);

// Returns the comma-separated @p csv with items trimmed and empty items removed
std::string normalize_csv(std::string_view csv);

} // namespace tasv::submissions
