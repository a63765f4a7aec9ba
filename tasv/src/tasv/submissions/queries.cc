#include <algorithm>
#include <tasv/sql/sql.hh>
#include <tasv/submissions/queries.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/macros/throw.hh>
#include <tasvlib/time.hh>

using std::optional;
using std::string;
using std::string_view;
using tasv::sql::DeleteFrom;
using tasv::sql::InsertInto;
using tasv::sql::Select;
using tasv::users::User;

namespace tasv::submissions {

optional<Submission>
find_submission(db::Connection& conn, decltype(Submission::id) submission_id, bool for_update) {
    STACK_UNWINDING_MARK;
    Submission s;
    auto stmt = conn.execute(
        Select("id, version, status, created_at, updated_at, submitter_id, judge_id, "
               "publisher_id, intended_class_id, rejection_reason_id, topic_id, game_id, "
               "game_version_id, game_goal_id, system_id, system_frame_rate_id, game_name, "
               "game_version, branch, rom_name, emulator_version, encode_embed_link, "
               "additional_authors, frames, rerecord_count, movie_extension, hash, hash_type, "
               "annotations, warnings, title")
            .from("submissions")
            .where("id=?", submission_id)
            .for_update(for_update && conn.dialect() == db::Dialect::MYSQL)
    );
    stmt.res_bind(
        s.id,
        s.version,
        s.status,
        s.created_at,
        s.updated_at,
        s.submitter_id,
        s.judge_id,
        s.publisher_id,
        s.intended_class_id,
        s.rejection_reason_id,
        s.topic_id,
        s.game_id,
        s.game_version_id,
        s.game_goal_id,
        s.system_id,
        s.system_frame_rate_id,
        s.game_name,
        s.game_version,
        s.branch,
        s.rom_name,
        s.emulator_version,
        s.encode_embed_link,
        s.additional_authors,
        s.frames,
        s.rerecord_count,
        s.movie_extension,
        s.hash,
        s.hash_type,
        s.annotations,
        s.warnings,
        s.title
    );
    if (!stmt.next()) {
        return std::nullopt;
    }
    return s;
}

uint64_t submission_count(db::Connection& conn, decltype(User::id) submitter_id) {
    STACK_UNWINDING_MARK;
    uint64_t count = 0;
    auto stmt =
        conn.execute(Select("COUNT(*)").from("submissions").where("submitter_id=?", submitter_id));
    stmt.res_bind(count);
    throw_assert(stmt.next());
    return count;
}

std::vector<StatusHistoryEntry>
status_history(db::Connection& conn, decltype(Submission::id) submission_id) {
    STACK_UNWINDING_MARK;
    std::vector<StatusHistoryEntry> res;
    StatusHistoryEntry entry;
    auto stmt = conn.execute(Select("id, submission_id, previous_status, status, actor_id, "
                                    "created_at")
                                 .from("submission_status_history")
                                 .where("submission_id=?", submission_id)
                                 .order_by("id"));
    stmt.res_bind(
        entry.id,
        entry.submission_id,
        entry.previous_status,
        entry.status,
        entry.actor_id,
        entry.created_at
    );
    while (stmt.next()) {
        res.emplace_back(entry);
    }
    return res;
}

void add_status_history(
    db::Connection& conn,
    decltype(Submission::id) submission_id,
    Submission::Status previous_status,
    Submission::Status status,
    optional<decltype(User::id)> actor_id
) {
    STACK_UNWINDING_MARK;
    conn.execute(InsertInto("submission_status_history (submission_id, previous_status, status, "
                            "actor_id, created_at)")
                     .values(
                         "?, ?, ?, ?, ?",
                         submission_id,
                         previous_status,
                         status,
                         actor_id,
                         utc_mysql_datetime()
                     ));
}

std::vector<User> submission_authors(db::Connection& conn, decltype(Submission::id) submission_id) {
    STACK_UNWINDING_MARK;
    std::vector<User> res;
    User user;
    auto stmt = conn.execute(Select("u.id, u.username, u.created_at")
                                 .from("submission_authors sa")
                                 .inner_join("users u")
                                 .on("u.id=sa.user_id")
                                 .where("sa.submission_id=?", submission_id)
                                 .order_by("sa.ordinal"));
    stmt.res_bind(user.id, user.username, user.created_at);
    while (stmt.next()) {
        res.emplace_back(user);
    }
    return res;
}

void set_submission_authors(
    db::Connection& conn,
    decltype(Submission::id) submission_id,
    const std::vector<decltype(User::id)>& author_ids
) {
    STACK_UNWINDING_MARK;
    conn.execute(DeleteFrom("submission_authors").where("submission_id=?", submission_id));
    uint32_t ordinal = 0;
    for (auto user_id : author_ids) {
        conn.execute(InsertInto("submission_authors (submission_id, user_id, ordinal)")
                         .values("?, ?, ?", submission_id, user_id, ordinal++));
    }
}

optional<User> find_user_by_username(db::Connection& conn, string_view username) {
    STACK_UNWINDING_MARK;
    User user;
    auto stmt = conn.execute(
        Select("id, username, created_at").from("users").where("username=?", username)
    );
    stmt.res_bind(user.id, user.username, user.created_at);
    if (!stmt.next()) {
        return std::nullopt;
    }
    return user;
}

bool is_deprecated_movie_format(db::Connection& conn, string_view ext) {
    STACK_UNWINDING_MARK;
    bool deprecated = false;
    auto stmt = conn.execute(Select("deprecated")
                                 .from("deprecated_movie_formats")
                                 .where("file_extension=?", concat_tostr('.', ext)));
    stmt.res_bind(deprecated);
    return stmt.next() && deprecated;
}

string normalize_csv(string_view csv) {
    string res;
    while (!csv.empty()) {
        auto item = csv.substr(0, csv.find(','));
        csv.remove_prefix(std::min(csv.size(), item.size() + 1));
        while (!item.empty() && item.front() == ' ') {
            item.remove_prefix(1);
        }
        while (!item.empty() && item.back() == ' ') {
            item.remove_suffix(1);
        }
        if (item.empty()) {
            continue;
        }
        if (!res.empty()) {
            res += ", ";
        }
        res += item;
    }
    return res;
}

} // namespace tasv::submissions
