#include "mocks.hh"
#include "test_db.hh"

#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <sys/stat.h>
#include <tasv/config.hh>
#include <tasv/publications/history.hh>
#include <tasv/publications/obsolescence.hh>
#include <tasv/wiki/wiki_pages.hh>
#include <utime.h>

using tasv::Config;
using tasv::ErrorKind;
using tasv::OperationError;
using tasv::publications::link_obsoletion_forest;
using tasv::publications::obsolete_publication_info;
using tasv::publications::obsolete_with;
using tasv::publications::PublicationHistory;
using tasv::publications::PublicationHistoryNode;
using tasv::sql::Select;
using testing::_;
using testing::NiceMock;
using testing::Return;
using testing::Throw;

namespace {

std::optional<uint64_t> obsoleted_by(TestDb& db, uint64_t publication_id) {
    return db.query_value<std::optional<uint64_t>>(
        Select("obsoleted_by_id").from("publications").where("id=?", publication_id)
    );
}

// Creates the notify file with a modification time far in the past
Config config_with_stale_notify_file(const TestDb& db) {
    Config config;
    config.job_server_notify_file = concat_tostr(db.path(), ".notify");
    std::ofstream{config.job_server_notify_file};
    utimbuf times{.actime = 0, .modtime = 0};
    throw_assert(utime(config.job_server_notify_file.c_str(), &times) == 0);
    return config;
}

time_t mtime_of(const std::string& path) {
    struct stat st = {};
    throw_assert(stat(path.c_str(), &st) == 0);
    return st.st_mtime;
}

} // namespace

// NOLINTNEXTLINE
TEST(ObsoleteWith, schedules_syncs_of_recognized_urls) {
    TestDb db;
    auto old_id = db.add_publication({
        .streaming_urls =
            {"https://www.youtube.com/watch?v=aaaaaaaaaaa",
             "https://vimeo.com/42",
             "https://youtu.be/bbbbbbbbbbb"},
    });
    auto new_id = db.add_publication({.game_goal_id = fixture::SMB_WARPLESS});
    NiceMock<MockVideoSync> video_sync;
    ON_CALL(video_sync, is_recognized_url(_)).WillByDefault(Return(true));
    EXPECT_CALL(video_sync, is_recognized_url(_)).Times(testing::AnyNumber());
    EXPECT_CALL(video_sync, is_recognized_url("https://vimeo.com/42")).WillOnce(Return(false));

    auto res = obsolete_with(db.conn(), Config{}, video_sync, old_id, new_id);
    ASSERT_TRUE(res.is_ok()) << res.error();
    EXPECT_EQ(res.value(), 2);
    EXPECT_EQ(obsoleted_by(db, old_id), new_id);
    EXPECT_EQ(obsoleted_by(db, new_id), std::nullopt);
    EXPECT_EQ(db.count("jobs"), 2);
    EXPECT_FALSE(db.conn().in_transaction());
}

// NOLINTNEXTLINE
TEST(ObsoleteWith, wakes_the_job_server_after_its_own_commit) {
    TestDb db;
    auto old_id = db.add_publication({});
    auto new_id = db.add_publication({});
    auto config = config_with_stale_notify_file(db);
    NiceMock<MockVideoSync> video_sync;

    ASSERT_TRUE(obsolete_with(db.conn(), config, video_sync, old_id, new_id).is_ok());
    EXPECT_GT(mtime_of(config.job_server_notify_file), 0);
}

// NOLINTNEXTLINE
TEST(ObsoleteWith, joins_the_callers_transaction) {
    TestDb db;
    auto old_id = db.add_publication({});
    auto new_id = db.add_publication({});
    auto config = config_with_stale_notify_file(db);
    NiceMock<MockVideoSync> video_sync;
    {
        auto transaction = db.conn().start_transaction();
        ASSERT_TRUE(obsolete_with(db.conn(), config, video_sync, old_id, new_id).is_ok());
        EXPECT_TRUE(db.conn().in_transaction());
        // Rolled back on destruction
    }
    EXPECT_EQ(obsoleted_by(db, old_id), std::nullopt);
    EXPECT_EQ(mtime_of(config.job_server_notify_file), 0);
}

// NOLINTNEXTLINE
TEST(ObsoleteWith, itself) {
    TestDb db;
    auto id = db.add_publication({});
    NiceMock<MockVideoSync> video_sync;
    auto res = obsolete_with(db.conn(), Config{}, video_sync, id, id);
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(res.error().kind, ErrorKind::PRECONDITION_FAILED);
    EXPECT_EQ(obsoleted_by(db, id), std::nullopt);
}

// NOLINTNEXTLINE
TEST(ObsoleteWith, missing_publication) {
    TestDb db;
    auto id = db.add_publication({});
    NiceMock<MockVideoSync> video_sync;
    auto res = obsolete_with(db.conn(), Config{}, video_sync, id, 77);
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(res.error(), (tasv::OperationError{ErrorKind::NOT_FOUND, "Publication 77 does not exist"}));
}

// NOLINTNEXTLINE
TEST(ObsoleteWith, different_games) {
    TestDb db;
    auto smb = db.add_publication({});
    auto zelda = db.add_publication({.game_id = fixture::ZELDA, .game_goal_id = fixture::ZELDA_BASELINE});
    NiceMock<MockVideoSync> video_sync;
    auto res = obsolete_with(db.conn(), Config{}, video_sync, smb, zelda);
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(res.error().kind, ErrorKind::PRECONDITION_FAILED);
    EXPECT_EQ(obsoleted_by(db, smb), std::nullopt);
}

// NOLINTNEXTLINE
TEST(ObsoleteWith, cycle) {
    TestDb db;
    auto a = db.add_publication({});
    auto b = db.add_publication({});
    auto c = db.add_publication({});
    NiceMock<MockVideoSync> video_sync;
    ASSERT_TRUE(obsolete_with(db.conn(), Config{}, video_sync, a, b).is_ok());
    ASSERT_TRUE(obsolete_with(db.conn(), Config{}, video_sync, b, c).is_ok());

    auto res = obsolete_with(db.conn(), Config{}, video_sync, c, a);
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(res.error().kind, ErrorKind::PRECONDITION_FAILED);
    EXPECT_EQ(obsoleted_by(db, c), std::nullopt);
}

// NOLINTNEXTLINE
TEST(ObsoleteWith, stored_cycle_does_not_hang_the_walk) {
    TestDb db;
    auto a = db.add_publication({});
    auto b = db.add_publication({});
    auto c = db.add_publication({});
    db.conn().execute(tasv::sql::Update("publications").set("obsoleted_by_id=?", b).where("id=?", a));
    db.conn().execute(tasv::sql::Update("publications").set("obsoleted_by_id=?", a).where("id=?", b));
    NiceMock<MockVideoSync> video_sync;

    auto res = obsolete_with(db.conn(), Config{}, video_sync, c, a);
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(
        res.error(),
        (OperationError{
            ErrorKind::PRECONDITION_FAILED,
            concat_tostr("Obsoletion chain of publication ", a, " already contains a cycle"),
        })
    );
    EXPECT_EQ(obsoleted_by(db, c), std::nullopt);
}

// NOLINTNEXTLINE
TEST(ObsoletePublicationInfo, basic) {
    TestDb db;
    auto id = db.add_publication({.title = "NES Super Mario Bros. by alice in 04:57.310"});
    db.conn().execute(tasv::sql::InsertInto("publication_tags (publication_id, tag_id)")
                          .values("?, ?", id, fixture::OTHER_TAG));
    db.conn().execute(tasv::sql::InsertInto("publication_tags (publication_id, tag_id)")
                          .values("?, ?", id, fixture::TAG));
    tasv::wiki::DbWikiPages wiki_pages{db.conn()};
    wiki_pages.add({.page_name = tasv::wiki::publication_page_name(id), .markup = "Old description"});

    auto info = obsolete_publication_info(db.conn(), wiki_pages, id);
    ASSERT_TRUE(info.is_ok()) << info.error();
    EXPECT_EQ(info.value().title, "NES Super Mario Bros. by alice in 04:57.310");
    EXPECT_EQ(info.value().tag_ids, (std::vector<uint64_t>{fixture::TAG, fixture::OTHER_TAG}));
    EXPECT_EQ(info.value().markup, "Old description");

    auto missing = obsolete_publication_info(db.conn(), wiki_pages, id + 1);
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(
        missing.error(),
        (OperationError{ErrorKind::NOT_FOUND, concat_tostr("Publication ", id + 1, " does not exist")})
    );
}

// NOLINTNEXTLINE
TEST(ObsoletePublicationInfo, wiki_failure) {
    TestDb db;
    auto id = db.add_publication({});
    MockWikiPages wiki_pages;
    EXPECT_CALL(wiki_pages, page(_)).WillOnce(Throw(std::runtime_error("wiki is down")));

    auto info = obsolete_publication_info(db.conn(), wiki_pages, id);
    ASSERT_TRUE(info.is_err());
    EXPECT_EQ(info.error().kind, ErrorKind::DEPENDENCY_FAILURE);
}

// NOLINTNEXTLINE
TEST(ObsoletePublicationInfo, store_failure) {
    TestDb db;
    auto id = db.add_publication({});
    tasv::wiki::DbWikiPages wiki_pages{db.conn()};
    db.conn().update("DROP TABLE publication_tags");

    auto info = obsolete_publication_info(db.conn(), wiki_pages, id);
    ASSERT_TRUE(info.is_err());
    EXPECT_EQ(info.error().kind, ErrorKind::UNEXPECTED);
}

// NOLINTNEXTLINE
TEST(PublicationHistory, game_forest) {
    TestDb db;
    auto a = db.add_publication({.title = "a"});
    auto b = db.add_publication({.title = "b"});
    auto warpless = db.add_publication({.game_goal_id = fixture::SMB_WARPLESS, .title = "w"});
    auto c = db.add_publication({.title = "c"});
    (void)db.add_publication({.game_id = fixture::ZELDA, .game_goal_id = fixture::ZELDA_BASELINE});
    NiceMock<MockVideoSync> video_sync;
    ASSERT_TRUE(obsolete_with(db.conn(), Config{}, video_sync, a, c).is_ok());
    ASSERT_TRUE(obsolete_with(db.conn(), Config{}, video_sync, b, c).is_ok());

    auto res = tasv::publications::publication_history_for_game_by_publication(db.conn(), b);
    ASSERT_TRUE(res.is_ok()) << res.error();
    const auto& history = res.value();
    EXPECT_EQ(history.game_id, fixture::SMB);
    EXPECT_EQ(history.game_display_name, "Super Mario Bros.");
    ASSERT_EQ(history.publications.size(), 4);
    EXPECT_EQ(history.publications[2].id, warpless);
    EXPECT_EQ(history.publications[2].goal, "warpless");
    EXPECT_EQ(history.publications[2].class_name, "Standard");
    EXPECT_EQ(history.roots, (std::vector<size_t>{2, 3}));
    EXPECT_EQ(history.publications[3].obsoletes, (std::vector<size_t>{0, 1}));
    EXPECT_TRUE(history.publications[0].obsoletes.empty());

    auto no_game = tasv::publications::publication_history_for_game(db.conn(), 42);
    ASSERT_TRUE(no_game.is_err());
    EXPECT_EQ(no_game.error(), (OperationError{ErrorKind::NOT_FOUND, "Game 42 does not exist"}));
    auto no_publication =
        tasv::publications::publication_history_for_game_by_publication(db.conn(), 42);
    ASSERT_TRUE(no_publication.is_err());
    EXPECT_EQ(
        no_publication.error(),
        (OperationError{ErrorKind::NOT_FOUND, "Publication 42 does not exist"})
    );
}

// NOLINTNEXTLINE
TEST(PublicationHistory, nodes_carry_flags) {
    TestDb db;
    auto flagged = db.add_publication({});
    auto plain = db.add_publication({});
    db.conn().execute(tasv::sql::InsertInto("publication_flags (publication_id, flag_id)")
                          .values("?, ?", flagged, fixture::FLAG));

    auto res = tasv::publications::publication_history_for_game(db.conn(), fixture::SMB);
    ASSERT_TRUE(res.is_ok()) << res.error();
    const auto& nodes = res.value().publications;
    ASSERT_EQ(nodes.size(), 2);
    EXPECT_EQ(nodes[0].id, flagged);
    ASSERT_EQ(nodes[0].flags.size(), 1);
    EXPECT_EQ(nodes[0].flags[0].token, "commentary");
    EXPECT_EQ(nodes[0].flags[0].name, "Commentary");
    EXPECT_EQ(nodes[1].id, plain);
    EXPECT_TRUE(nodes[1].flags.empty());
}

// NOLINTNEXTLINE
TEST(PublicationHistory, store_failure) {
    TestDb db;
    auto id = db.add_publication({});
    db.conn().update("DROP TABLE publication_flags");

    auto res = tasv::publications::publication_history_for_game_by_publication(db.conn(), id);
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(res.error().kind, ErrorKind::UNEXPECTED);
    EXPECT_THAT(res.error().message, testing::StartsWith("Loading publication history failed: "));
}

// NOLINTNEXTLINE
TEST(PublicationHistory, game_without_publications) {
    TestDb db;
    auto history = tasv::publications::publication_history_for_game(db.conn(), fixture::ZELDA);
    ASSERT_TRUE(history.is_ok()) << history.error();
    EXPECT_EQ(history.value().game_display_name, "The Legend of Zelda");
    EXPECT_TRUE(history.value().publications.empty());
    EXPECT_TRUE(history.value().roots.empty());
}

// NOLINTNEXTLINE
TEST(LinkObsoletionForest, long_chain) {
    constexpr size_t len = 200'000;
    PublicationHistory history{.game_id = 1};
    history.publications.reserve(len);
    for (size_t i = 0; i < len; ++i) {
        history.publications.push_back(PublicationHistoryNode{
            .id = i + 1,
            .obsoleted_by_id = i + 1 < len ? std::optional<uint64_t>{i + 2} : std::nullopt,
        });
    }
    link_obsoletion_forest(history);
    EXPECT_EQ(history.roots, (std::vector<size_t>{len - 1}));
    for (size_t i = 1; i < len; ++i) {
        ASSERT_EQ(history.publications[i].obsoletes, (std::vector<size_t>{i - 1}));
    }
    EXPECT_TRUE(history.publications[0].obsoletes.empty());
}

// NOLINTNEXTLINE
TEST(LinkObsoletionForest, parent_outside_of_the_game_is_a_root) {
    PublicationHistory history{.game_id = 1};
    history.publications.push_back({.id = 5, .obsoleted_by_id = 9});
    history.publications.push_back({.id = 6});
    link_obsoletion_forest(history);
    EXPECT_EQ(history.roots, (std::vector<size_t>{0, 1}));
}
