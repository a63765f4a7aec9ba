#include "test_db.hh"

#include <gtest/gtest.h>
#include <stdexcept>
#include <tasv/db/repeat_if_conflicted.hh>
#include <tasv/forum/topic_watcher.hh>
#include <tasv/sql/sql.hh>
#include <tasv/wiki/wiki_pages.hh>

using tasv::db::ConcurrencyConflict;
using tasv::db::DuplicateKey;
using tasv::db::repeat_if_conflicted;
using tasv::db::RetryPolicy;
using tasv::sql::Condition;
using tasv::sql::DeleteFrom;
using tasv::sql::InsertInto;
using tasv::sql::Select;
using tasv::sql::SqlWithParams;
using tasv::sql::Update;

namespace {

std::string sql_of(SqlWithParams&& sql) { return std::move(sql).get_sql(); }

} // namespace

// NOLINTNEXTLINE
TEST(Sql, select) {
    EXPECT_EQ(sql_of(Select("a, b").from("t")), "SELECT a, b FROM t");
    EXPECT_EQ(
        sql_of(Select("p.id")
                   .from("publications p")
                   .inner_join("games g")
                   .on("g.id=p.game_id")
                   .left_join("game_goals gg")
                   .on("gg.id=p.game_goal_id")
                   .where("p.id=?", 1)
                   .order_by("p.id")
                   .limit("?", 5)),
        "SELECT p.id FROM publications p INNER JOIN games g ON g.id=p.game_id LEFT JOIN game_goals "
        "gg ON gg.id=p.game_goal_id WHERE p.id=? ORDER BY p.id LIMIT ?"
    );
    EXPECT_EQ(sql_of(Select("1").from("t").where("id=?", 1).for_update(true)), "SELECT 1 FROM t WHERE id=? FOR UPDATE");
    EXPECT_EQ(sql_of(Select("1").from("t").where("id=?", 1).for_update(false)), "SELECT 1 FROM t WHERE id=?");
}

// NOLINTNEXTLINE
TEST(Sql, conditions) {
    SqlWithParams sql =
        Select("1").from("t").where(Condition("a=?", 1) && (Condition("b=?", 2) || Condition("c IS NULL")));
    EXPECT_EQ(sql.get_sql(), "SELECT 1 FROM t WHERE (a=?) AND ((b=?) OR (c IS NULL))");
    EXPECT_EQ(sql.get_params(), (std::vector<tasv::db::Value>{int64_t{1}, int64_t{2}}));
}

// NOLINTNEXTLINE
TEST(Sql, modifications) {
    EXPECT_EQ(sql_of(InsertInto("t (a, b)").values("?, ?", 1, "x")), "INSERT INTO t (a, b) VALUES(?, ?)");
    EXPECT_EQ(
        sql_of(InsertInto("t (a)").select(Select("b").from("u").where("c=?", 3))),
        "INSERT INTO t (a) SELECT b FROM u WHERE c=?"
    );
    EXPECT_EQ(sql_of(Update("t").set("a=?", 1).where("b=?", 2)), "UPDATE t SET a=? WHERE b=?");
    EXPECT_EQ(sql_of(DeleteFrom("t").where("a=?", 1)), "DELETE FROM t WHERE a=?");
}

// NOLINTNEXTLINE
TEST(Sql, params) {
    std::optional<uint64_t> none;
    SqlWithParams sql = Update("t").set("a=?, b=?, c=?, d=?", none, 2.5, std::string_view{"s"}, true).where("e=?", 7u);
    EXPECT_EQ(
        sql.get_params(),
        (std::vector<tasv::db::Value>{nullptr, 2.5, std::string{"s"}, int64_t{1}, int64_t{7}})
    );
    EXPECT_THROW(SqlWithParams("SELECT ?"), std::runtime_error);
    EXPECT_THROW(SqlWithParams("SELECT 1", 1), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(Sqlite, values_round_trip) {
    TestDb db;
    auto& conn = db.conn();
    conn.update("CREATE TABLE t (i INTEGER, d REAL, s TEXT, n INTEGER NULL, b BLOB)");
    std::string blob{"a\0b", 3};
    conn.execute(InsertInto("t (i, d, s, n, b)").values("?, ?, ?, ?, ?", -5, 0.25, "text", std::nullopt, blob));

    int i = 0;
    double d = 0;
    std::string s;
    std::optional<int> n = 3;
    std::string b;
    auto stmt = conn.execute(Select("i, d, s, n, b").from("t"));
    stmt.res_bind(i, d, s, n, b);
    ASSERT_TRUE(stmt.next());
    EXPECT_EQ(i, -5);
    EXPECT_EQ(d, 0.25);
    EXPECT_EQ(s, "text");
    EXPECT_EQ(n, std::nullopt);
    EXPECT_EQ(b, blob);
    EXPECT_FALSE(stmt.next());
}

// NOLINTNEXTLINE
TEST(Sqlite, null_into_non_optional) {
    TestDb db;
    uint64_t x = 0;
    auto stmt = db.conn().execute(Select("NULL").from("users").limit("1"));
    stmt.res_bind(x);
    EXPECT_THROW(stmt.next(), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(Sqlite, duplicate_key) {
    TestDb db;
    EXPECT_THROW(
        db.conn().execute(InsertInto("users (id, username, created_at)")
                              .values("1, 'alice2', '2020-01-01 00:00:00'")),
        DuplicateKey
    );
    EXPECT_THROW(
        db.conn().execute(InsertInto("users (username, created_at)")
                              .values("'alice', '2020-01-01 00:00:00'")),
        DuplicateKey
    );
}

// NOLINTNEXTLINE
TEST(Sqlite, affected_rows_and_insert_id) {
    TestDb db;
    auto id = db.conn().execute(InsertInto("users (username, created_at)").values("'frank', '2020-01-01 00:00:00'")).insert_id();
    EXPECT_EQ(id, 6);
    EXPECT_EQ(db.conn().execute(Update("users").set("created_at=created_at").where("id<=?", 3)).affected_rows(), 3);
}

// NOLINTNEXTLINE
TEST(Transaction, rolls_back_unless_committed) {
    TestDb db;
    auto& conn = db.conn();
    {
        auto transaction = conn.start_transaction();
        EXPECT_TRUE(conn.in_transaction());
        conn.execute(DeleteFrom("flags").where("id=?", fixture::FLAG));
    }
    EXPECT_FALSE(conn.in_transaction());
    EXPECT_EQ(db.count("flags"), 1);
    {
        auto transaction = conn.start_transaction();
        conn.execute(DeleteFrom("flags").where("id=?", fixture::FLAG));
        transaction.commit();
    }
    EXPECT_EQ(db.count("flags"), 0);
}

// NOLINTNEXTLINE
TEST(Transaction, explicit_rollback) {
    TestDb db;
    auto& conn = db.conn();
    auto transaction = conn.start_transaction();
    conn.execute(DeleteFrom("tags").where("1=1"));
    transaction.rollback();
    EXPECT_FALSE(conn.in_transaction());
    EXPECT_EQ(db.count("tags"), 2);
}

// NOLINTNEXTLINE
TEST(Transaction, competing_writer_conflicts) {
    TestDb db;
    auto transaction = db.conn().start_transaction();
    tasv::sqlite::Connection other{db.path(), 0};
    EXPECT_THROW((void)other.start_transaction(), ConcurrencyConflict);
    EXPECT_FALSE(other.in_transaction());
    transaction.commit();
    EXPECT_NO_THROW(other.start_transaction().commit());
}

// NOLINTNEXTLINE
TEST(RepeatIfConflicted, succeeds_after_conflicts) {
    RetryPolicy policy{.max_attempts = 3, .initial_delay = std::chrono::milliseconds{1}};
    int calls = 0;
    auto res = repeat_if_conflicted(policy, [&] {
        if (++calls < 3) {
            throw ConcurrencyConflict{"busy"};
        }
        return 42;
    });
    EXPECT_EQ(res, 42);
    EXPECT_EQ(calls, 3);
}

// NOLINTNEXTLINE
TEST(RepeatIfConflicted, gives_up) {
    RetryPolicy policy{.max_attempts = 2, .initial_delay = std::chrono::milliseconds{1}};
    int calls = 0;
    EXPECT_THROW(
        repeat_if_conflicted(policy, [&] {
            ++calls;
            throw ConcurrencyConflict{"busy"};
        }),
        ConcurrencyConflict
    );
    EXPECT_EQ(calls, 2);
}

// NOLINTNEXTLINE
TEST(RepeatIfConflicted, other_errors_are_not_retried) {
    RetryPolicy policy{.initial_delay = std::chrono::milliseconds{1}};
    int calls = 0;
    EXPECT_THROW(
        repeat_if_conflicted(policy, [&] {
            ++calls;
            throw std::runtime_error("broken");
        }),
        std::runtime_error
    );
    EXPECT_EQ(calls, 1);
}

// NOLINTNEXTLINE
TEST(DbWikiPages, revisions) {
    TestDb db;
    tasv::wiki::DbWikiPages wiki_pages{db.conn()};
    auto name = tasv::wiki::submission_page_name(3);
    EXPECT_EQ(name, "InternalSystem/SubmissionContent/S3");
    EXPECT_EQ(tasv::wiki::publication_page_name(4), "InternalSystem/PublicationContent/M4");
    EXPECT_FALSE(wiki_pages.page(name));

    EXPECT_EQ(wiki_pages.add({.page_name = name, .markup = "v1", .author_id = fixture::ALICE}).revision, 1);
    auto second = wiki_pages.add({.page_name = name, .markup = "v2", .minor_edit = true});
    EXPECT_EQ(second.revision, 2);

    auto page = wiki_pages.page(name);
    ASSERT_TRUE(page);
    EXPECT_EQ(page->id, second.id);
    EXPECT_EQ(page->markup, "v2");
    EXPECT_EQ(page->author_id, std::nullopt);
    EXPECT_TRUE(page->minor_edit);
    EXPECT_THROW(wiki_pages.add({.markup = "nameless"}), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(DbTopicWatcher, watch_and_unwatch) {
    TestDb db;
    auto topic_id = db.conn()
                        .execute(InsertInto("forum_topics (title, created_at)")
                                     .values("'t', '2024-01-01 00:00:00'"))
                        .insert_id();
    tasv::forum::DbTopicWatcher watcher{db.conn()};
    watcher.watch_topic(topic_id, fixture::BOB, true);
    watcher.watch_topic(topic_id, fixture::BOB, true);
    EXPECT_EQ(db.count("forum_topic_watches"), 1);
    watcher.watch_topic(topic_id, fixture::BOB, false);
    EXPECT_EQ(db.count("forum_topic_watches"), 0);
}
