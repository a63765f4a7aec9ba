#pragma once

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <tasv/db/schema.hh>
#include <tasv/sql/sql.hh>
#include <tasv/sqlite/sqlite.hh>
#include <tasv/submissions/submission.hh>
#include <tasvlib/concat_tostr.hh>
#include <tasvlib/macros/throw.hh>
#include <unistd.h>
#include <vector>

// Fixture ids
namespace fixture {

constexpr uint64_t ALICE = 1; // submitter
constexpr uint64_t BOB = 2; // judge
constexpr uint64_t CAROL = 3; // publisher
constexpr uint64_t DAVE = 4; // co-author
constexpr uint64_t ERIN = 5; // second judge

constexpr uint64_t NES = 1;
constexpr uint64_t NES_NTSC = 1;
constexpr uint64_t NES_PAL = 2;
constexpr uint64_t SNES = 2;

constexpr uint64_t SMB = 1;
constexpr uint64_t SMB_USA = 1;
constexpr uint64_t SMB_BASELINE = 1;
constexpr uint64_t SMB_WARPLESS = 2;
constexpr uint64_t ZELDA = 2;
constexpr uint64_t ZELDA_USA = 2;
constexpr uint64_t ZELDA_BASELINE = 3;

constexpr uint64_t STANDARD_CLASS = 1;
constexpr uint64_t AUTHOR_ROLE = 1;
constexpr uint64_t JUDGE_ROLE = 2;
constexpr uint64_t FLAG = 1;
constexpr uint64_t TAG = 1;
constexpr uint64_t OTHER_TAG = 2;

} // namespace fixture

// Fresh SQLite database file with the full schema and the fixture rows, removed on destruction
class TestDb {
    std::string path_;
    std::unique_ptr<tasv::sqlite::Connection> conn_;

public:
    TestDb() {
        std::string tmpl = "/tmp/tasv-test-XXXXXX";
        int fd = mkstemp(tmpl.data());
        throw_assert(fd >= 0);
        (void)close(fd);
        path_ = tmpl;
        conn_ = std::make_unique<tasv::sqlite::Connection>(path_);
        tasv::db::create_schema(*conn_);
        seed();
    }

    TestDb(const TestDb&) = delete;
    TestDb(TestDb&&) = delete;
    TestDb& operator=(const TestDb&) = delete;
    TestDb& operator=(TestDb&&) = delete;

    ~TestDb() {
        conn_.reset();
        for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
            (void)unlink(concat_tostr(path_, suffix).c_str());
        }
    }

    tasv::sqlite::Connection& conn() noexcept { return *conn_; }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // Another connection to the same database, e.g. for other threads
    [[nodiscard]] std::unique_ptr<tasv::sqlite::Connection> open_another() const {
        return std::make_unique<tasv::sqlite::Connection>(path_);
    }

    struct SubmissionRow {
        tasv::submissions::Submission::Status status = tasv::submissions::Submission::Status::NEW;
        uint64_t submitter_id = fixture::ALICE;
        std::optional<uint64_t> judge_id;
        std::optional<uint64_t> publisher_id;
        std::string created_at = "2024-01-01 00:00:00";
        std::optional<uint64_t> intended_class_id = fixture::STANDARD_CLASS;
        std::optional<uint64_t> game_id = fixture::SMB;
        std::optional<uint64_t> game_version_id = fixture::SMB_USA;
        std::optional<uint64_t> game_goal_id = fixture::SMB_BASELINE;
        std::optional<uint64_t> topic_id;
        std::vector<uint64_t> author_ids = {fixture::ALICE};
        std::string title = "#0: alice's NES Super Mario Bros. in 04:57.310";
    };

    uint64_t add_submission(const SubmissionRow& row) {
        using tasv::sql::InsertInto;
        auto id =
            conn_
                ->execute(InsertInto(
                              "submissions (version, status, created_at, updated_at, "
                              "submitter_id, judge_id, publisher_id, intended_class_id, topic_id, "
                              "game_id, game_version_id, game_goal_id, system_id, "
                              "system_frame_rate_id, game_name, frames, rerecord_count, "
                              "movie_extension, movie_file, annotations, title)"
                )
                              .values(
                                  "0, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 'Super Mario "
                                  "Bros.', 17868, 2222, 'fm2', 'PK-zipped-movie', '', ?",
                                  row.status,
                                  row.created_at,
                                  row.created_at,
                                  row.submitter_id,
                                  row.judge_id,
                                  row.publisher_id,
                                  row.intended_class_id,
                                  row.topic_id,
                                  row.game_id,
                                  row.game_version_id,
                                  row.game_goal_id,
                                  fixture::NES,
                                  fixture::NES_NTSC,
                                  row.title
                              ))
                .insert_id();
        for (size_t i = 0; i < row.author_ids.size(); ++i) {
            conn_->execute(InsertInto("submission_authors (submission_id, user_id, ordinal)")
                               .values("?, ?, ?", id, row.author_ids[i], i));
        }
        return id;
    }

    struct PublicationRow {
        uint64_t game_id = fixture::SMB;
        uint64_t game_goal_id = fixture::SMB_BASELINE;
        std::optional<uint64_t> obsoleted_by_id;
        std::string title = "NES Super Mario Bros. by alice in 04:57.310";
        std::vector<std::string> streaming_urls;
        std::vector<uint64_t> author_ids = {fixture::ALICE};
    };

    uint64_t add_publication(const PublicationRow& row) {
        using tasv::sql::InsertInto;
        auto submission_id = add_submission({
            .status = tasv::submissions::Submission::Status::PUBLISHED,
            .game_id = row.game_id,
            .game_version_id = row.game_id == fixture::SMB ? fixture::SMB_USA : fixture::ZELDA_USA,
            .game_goal_id = row.game_goal_id,
            .author_ids = row.author_ids,
        });
        auto id = conn_
                      ->execute(InsertInto(
                                    "publications (created_at, submission_id, "
                                    "publication_class_id, system_id, system_frame_rate_id, "
                                    "game_id, game_version_id, game_goal_id, frames, "
                                    "rerecord_count, movie_file_name, title, obsoleted_by_id)"
                      )
                                    .values(
                                        "'2024-02-01 00:00:00', ?, ?, ?, ?, ?, ?, ?, 17868, 2222, "
                                        "?, ?, ?",
                                        submission_id,
                                        fixture::STANDARD_CLASS,
                                        fixture::NES,
                                        fixture::NES_NTSC,
                                        row.game_id,
                                        row.game_id == fixture::SMB ? fixture::SMB_USA
                                                                    : fixture::ZELDA_USA,
                                        row.game_goal_id,
                                        concat_tostr("movie-of-submission-", submission_id, ".fm2"),
                                        row.title,
                                        row.obsoleted_by_id
                                    ))
                      .insert_id();
        for (const auto& url : row.streaming_urls) {
            conn_->execute(InsertInto("publication_urls (publication_id, url, type)")
                               .values("?, ?, 1", id, url));
        }
        for (size_t i = 0; i < row.author_ids.size(); ++i) {
            conn_->execute(InsertInto("publication_authors (publication_id, user_id, ordinal)")
                               .values("?, ?, ?", id, row.author_ids[i], i));
        }
        return id;
    }

    // Returns the single value of the query
    template <class T = uint64_t>
    T query_value(tasv::sql::SqlWithParams&& sql) {
        T res{};
        auto stmt = conn_->execute(std::move(sql));
        stmt.res_bind(res);
        throw_assert(stmt.next());
        return res;
    }

    uint64_t count(std::string_view table) {
        return query_value(tasv::sql::Select("COUNT(*)").from(table));
    }

private:
    void seed() {
        for (const char* stmt : {
                 "INSERT INTO users (id, username, created_at) VALUES "
                 "(1, 'alice', '2020-01-01 00:00:00'), (2, 'bob', '2020-01-01 00:00:00'), "
                 "(3, 'carol', '2020-01-01 00:00:00'), (4, 'dave', '2020-01-01 00:00:00'), "
                 "(5, 'erin', '2020-01-01 00:00:00')",
                 "INSERT INTO game_systems (id, code, display_name) VALUES "
                 "(1, 'NES', 'Nintendo Entertainment System'), (2, 'SNES', 'Super NES')",
                 "INSERT INTO game_system_frame_rates (id, system_id, frame_rate, region, "
                 "is_default) VALUES (1, 1, 60.0988138974405, 'NTSC', 1), "
                 "(2, 1, 50.0069789081886, 'PAL', 1), (3, 1, 60.0, 'NTSC', 0)",
                 "INSERT INTO games (id, display_name) VALUES "
                 "(1, 'Super Mario Bros.'), (2, 'The Legend of Zelda')",
                 "INSERT INTO game_versions (id, game_id, system_id, name, region) VALUES "
                 "(1, 1, 1, 'USA', 'NTSC'), (2, 2, 1, 'USA', 'NTSC')",
                 "INSERT INTO game_goals (id, game_id, display_name) VALUES "
                 "(1, 1, 'baseline'), (2, 1, 'warpless'), (3, 2, 'baseline')",
                 "INSERT INTO publication_classes (id, name) VALUES (1, 'Standard')",
                 "INSERT INTO submission_rejection_reasons (id, display_name) VALUES "
                 "(1, 'Suboptimal')",
                 "INSERT INTO deprecated_movie_formats (file_extension, deprecated) VALUES "
                 "('.smv', 1), ('.vbm', 0)",
                 "INSERT INTO flags (id, token, name) VALUES (1, 'commentary', 'Commentary')",
                 "INSERT INTO tags (id, code, display_name) VALUES "
                 "(1, 'speed', 'Speed'), (2, 'glitch', 'Heavy glitch abuse')",
                 "INSERT INTO roles (id, name, auto_assign_publications) VALUES "
                 "(1, 'Published Author', 1), (2, 'Judge', 0)",
             })
        {
            conn_->update(stmt);
        }
    }
};
