#include "mocks.hh"
#include "test_db.hh"

#include <gtest/gtest.h>
#include <job_server/dispatcher.hh>
#include <stdexcept>
#include <tasv/forum/automation_agent.hh>
#include <tasv/forum/forums.hh>
#include <tasv/jobs/job.hh>
#include <tasv/jobs/utils.hh>
#include <tasv/roles/role_grantor.hh>
#include <tasv/wiki/wiki_pages.hh>

using job_server::drain_pending_jobs;
using job_server::reset_in_progress_jobs;
using tasv::jobs::add_job;
using tasv::jobs::Job;
using tasv::sql::Select;
using tasv::video_sync::VideoDescriptor;
using testing::_;
using testing::AllOf;
using testing::ElementsAre;
using testing::Field;
using testing::HasSubstr;
using testing::InSequence;
using testing::NiceMock;
using testing::Optional;
using testing::Throw;

namespace {

constexpr tasv::db::RetryPolicy retry_policy = {
    .max_attempts = 3,
    .initial_delay = std::chrono::milliseconds{1},
    .max_delay = std::chrono::milliseconds{5},
};

struct JobServerFixture {
    TestDb db;
    NiceMock<MockVideoSync> video_sync;
    MockRoleGrantor role_grantor;
    MockAutomationAgent automation_agent;
    tasv::wiki::DbWikiPages wiki_pages{db.conn()};

    size_t drain() {
        return drain_pending_jobs(
            db.conn(), retry_policy, {video_sync, role_grantor, automation_agent, wiki_pages}
        );
    }

    Job::Status status_of(uint64_t job_id) {
        return Job::Status{static_cast<uint8_t>(
            db.query_value(Select("status").from("jobs").where("id=?", job_id))
        )};
    }

    std::string log_of(uint64_t job_id) {
        return db.query_value<std::string>(Select("log").from("jobs").where("id=?", job_id));
    }
};

uint64_t add_topic_with_post(TestDb& db, uint64_t forum_id) {
    auto topic_id = db.conn()
                        .execute(tasv::sql::InsertInto("forum_topics (forum_id, title, created_at)")
                                     .values("?, 'Discussion', '2024-01-01 00:00:00'", forum_id))
                        .insert_id();
    db.conn().execute(tasv::sql::InsertInto("forum_posts (topic_id, forum_id, text, created_at)")
                          .values("?, ?, 'first', '2024-01-01 00:00:00'", topic_id, forum_id));
    return topic_id;
}

} // namespace

// NOLINTNEXTLINE
TEST(DrainPendingJobs, nothing_to_do) {
    JobServerFixture f;
    EXPECT_EQ(f.drain(), 0);
}

// NOLINTNEXTLINE
TEST(DrainPendingJobs, processes_in_the_order_of_priority) {
    JobServerFixture f;
    auto url = "https://www.youtube.com/watch?v=abcdefghijk";
    auto pub = f.db.add_publication({.streaming_urls = {url}, .author_ids = {fixture::ALICE, fixture::DAVE}});
    auto sub = f.db.query_value(Select("submission_id").from("publications").where("id=?", pub));

    auto sync_job = add_job(f.db.conn(), Job::Type::SYNC_VIDEO, pub, std::nullopt, url);
    auto grant_job = add_job(f.db.conn(), Job::Type::GRANT_AUTHOR_ROLES, pub, std::nullopt, "");
    auto notify_job = add_job(f.db.conn(), Job::Type::NOTIFY_PUBLISHED, sub, pub, "");
    {
        InSequence seq;
        EXPECT_CALL(f.automation_agent, post_submission_published(sub, pub));
        EXPECT_CALL(
            f.role_grantor,
            assign_auto_assignable_roles_by_publication(
                std::vector<uint64_t>{fixture::ALICE, fixture::DAVE},
                "NES Super Mario Bros. by alice in 04:57.310"
            )
        );
        EXPECT_CALL(
            f.video_sync,
            sync(AllOf(
                Field(&VideoDescriptor::publication_id, pub),
                Field(&VideoDescriptor::url, url),
                Field(&VideoDescriptor::system_code, "NES"),
                Field(&VideoDescriptor::authors, ElementsAre("alice", "dave")),
                Field(&VideoDescriptor::obsoleted_by_id, std::nullopt)
            ))
        );
    }

    EXPECT_EQ(f.drain(), 3);
    EXPECT_EQ(f.status_of(sync_job), Job::Status::DONE);
    EXPECT_EQ(f.status_of(grant_job), Job::Status::DONE);
    EXPECT_EQ(f.status_of(notify_job), Job::Status::DONE);
    EXPECT_THAT(f.log_of(sync_job), HasSubstr("Synced"));
    EXPECT_EQ(f.drain(), 0);
}

// NOLINTNEXTLINE
TEST(DrainPendingJobs, failing_job_does_not_stop_the_others) {
    JobServerFixture f;
    auto pub = f.db.add_publication({});
    auto sub = f.db.query_value(Select("submission_id").from("publications").where("id=?", pub));
    auto grant_job = add_job(f.db.conn(), Job::Type::GRANT_AUTHOR_ROLES, pub, std::nullopt, "");
    auto notify_job = add_job(f.db.conn(), Job::Type::NOTIFY_PUBLISHED, sub, pub, "");
    EXPECT_CALL(f.role_grantor, assign_auto_assignable_roles_by_publication(_, _))
        .WillOnce(Throw(std::runtime_error("role service is down")));
    EXPECT_CALL(f.automation_agent, post_submission_published(sub, pub));

    EXPECT_EQ(f.drain(), 2);
    EXPECT_EQ(f.status_of(grant_job), Job::Status::FAILED);
    EXPECT_THAT(f.log_of(grant_job), HasSubstr("role service is down"));
    EXPECT_EQ(f.status_of(notify_job), Job::Status::DONE);
}

// NOLINTNEXTLINE
TEST(DrainPendingJobs, cancels_sync_of_missing_publication) {
    JobServerFixture f;
    auto job = add_job(f.db.conn(), Job::Type::SYNC_VIDEO, 404, std::nullopt, "https://youtu.be/x");
    EXPECT_CALL(f.video_sync, sync(_)).Times(0);
    EXPECT_EQ(f.drain(), 1);
    EXPECT_EQ(f.status_of(job), Job::Status::CANCELLED);
}

// NOLINTNEXTLINE
TEST(DrainPendingJobs, cancels_sync_of_removed_url) {
    JobServerFixture f;
    auto pub = f.db.add_publication({.streaming_urls = {"https://youtu.be/kept"}});
    auto job = add_job(f.db.conn(), Job::Type::SYNC_VIDEO, pub, std::nullopt, "https://youtu.be/gone");
    EXPECT_CALL(f.video_sync, sync(_)).Times(0);
    EXPECT_EQ(f.drain(), 1);
    EXPECT_EQ(f.status_of(job), Job::Status::CANCELLED);
}

// NOLINTNEXTLINE
TEST(DrainPendingJobs, sync_of_obsoleted_publication) {
    JobServerFixture f;
    auto newer = f.db.add_publication({});
    auto older = f.db.add_publication({.obsoleted_by_id = newer, .streaming_urls = {"https://youtu.be/old"}});
    f.wiki_pages.add({.page_name = tasv::wiki::publication_page_name(older), .markup = "Old run"});
    add_job(f.db.conn(), Job::Type::SYNC_VIDEO, older, std::nullopt, "https://youtu.be/old");
    EXPECT_CALL(
        f.video_sync,
        sync(AllOf(
            Field(&VideoDescriptor::obsoleted_by_id, Optional(newer)),
            Field(&VideoDescriptor::markup, "Old run")
        ))
    );
    EXPECT_EQ(f.drain(), 1);
}

// NOLINTNEXTLINE
TEST(DrainPendingJobs, grant_with_the_database_grantor) {
    TestDb db;
    auto pub = db.add_publication({.author_ids = {fixture::ALICE, fixture::DAVE}});
    db.conn().execute(tasv::sql::InsertInto("user_roles (user_id, role_id)")
                          .values("?, ?", fixture::ALICE, fixture::AUTHOR_ROLE));
    auto job = add_job(db.conn(), Job::Type::GRANT_AUTHOR_ROLES, pub, std::nullopt, "");
    NiceMock<MockVideoSync> video_sync;
    tasv::roles::DbRoleGrantor role_grantor{db.conn()};
    tasv::forum::DbAutomationAgent automation_agent{db.conn()};
    tasv::wiki::DbWikiPages wiki_pages{db.conn()};

    EXPECT_EQ(
        drain_pending_jobs(
            db.conn(), retry_policy, {video_sync, role_grantor, automation_agent, wiki_pages}
        ),
        1
    );
    EXPECT_EQ(
        db.query_value(Select("status").from("jobs").where("id=?", job)),
        static_cast<uint8_t>(Job::Status::DONE)
    );
    EXPECT_EQ(db.count("user_roles"), 2);
    EXPECT_EQ(
        db.query_value(Select("COUNT(*)")
                           .from("user_roles")
                           .where("user_id=? AND role_id=?", fixture::DAVE, fixture::AUTHOR_ROLE)),
        1
    );
}

// NOLINTNEXTLINE
TEST(DrainPendingJobs, notice_with_the_database_agent) {
    TestDb db;
    auto topic_id = db.conn()
                        .execute(tasv::sql::InsertInto("forum_topics (title, created_at)")
                                     .values("'Discussion', '2024-01-01 00:00:00'"))
                        .insert_id();
    auto sub = db.add_submission({.status = tasv::submissions::Submission::Status::PUBLISHED, .topic_id = topic_id});
    auto job = add_job(db.conn(), Job::Type::NOTIFY_PUBLISHED, sub, 17, "");
    NiceMock<MockVideoSync> video_sync;
    MockRoleGrantor role_grantor;
    tasv::forum::DbAutomationAgent automation_agent{db.conn()};
    tasv::wiki::DbWikiPages wiki_pages{db.conn()};

    EXPECT_EQ(
        drain_pending_jobs(
            db.conn(), retry_policy, {video_sync, role_grantor, automation_agent, wiki_pages}
        ),
        1
    );
    EXPECT_EQ(
        db.query_value(Select("status").from("jobs").where("id=?", job)),
        static_cast<uint8_t>(Job::Status::DONE)
    );
    EXPECT_THAT(
        db.query_value<std::string>(Select("text").from("forum_posts").where("topic_id=?", topic_id)),
        HasSubstr("[17M]")
    );
}

// NOLINTNEXTLINE
TEST(DrainPendingJobs, topic_is_moved_with_its_posts) {
    JobServerFixture f;
    auto topic_id = add_topic_with_post(f.db, tasv::forum::WORKBENCH_FORUM_ID);
    auto sub = f.db.add_submission({.topic_id = topic_id});
    auto job = add_job(
        f.db.conn(), Job::Type::MOVE_SUBMISSION_TOPIC, sub, tasv::forum::PLAYGROUND_FORUM_ID, ""
    );

    EXPECT_EQ(f.drain(), 1);
    EXPECT_EQ(f.status_of(job), Job::Status::DONE);
    EXPECT_EQ(
        f.db.query_value(Select("forum_id").from("forum_topics").where("id=?", topic_id)),
        tasv::forum::PLAYGROUND_FORUM_ID
    );
    EXPECT_EQ(
        f.db.query_value(Select("forum_id").from("forum_posts").where("topic_id=?", topic_id)),
        tasv::forum::PLAYGROUND_FORUM_ID
    );
}

// NOLINTNEXTLINE
TEST(DrainPendingJobs, topic_move_without_a_topic_is_cancelled) {
    JobServerFixture f;
    auto sub = f.db.add_submission({});
    auto job = add_job(
        f.db.conn(), Job::Type::MOVE_SUBMISSION_TOPIC, sub, tasv::forum::PLAYGROUND_FORUM_ID, ""
    );

    EXPECT_EQ(f.drain(), 1);
    EXPECT_EQ(f.status_of(job), Job::Status::CANCELLED);
    EXPECT_THAT(f.log_of(job), HasSubstr("no discussion topic"));
}

// NOLINTNEXTLINE
TEST(DrainPendingJobs, rejected_topic_goes_to_the_agent) {
    JobServerFixture f;
    auto sub = f.db.add_submission({.status = tasv::submissions::Submission::Status::REJECTED});
    auto job = add_job(f.db.conn(), Job::Type::REJECT_SUBMISSION_TOPIC, sub, std::nullopt, "");
    EXPECT_CALL(f.automation_agent, reject_and_move(sub));

    EXPECT_EQ(f.drain(), 1);
    EXPECT_EQ(f.status_of(job), Job::Status::DONE);
}

// NOLINTNEXTLINE
TEST(DrainPendingJobs, reopened_submission_keeps_its_topic) {
    JobServerFixture f;
    auto sub = f.db.add_submission({});
    auto job = add_job(f.db.conn(), Job::Type::REJECT_SUBMISSION_TOPIC, sub, std::nullopt, "");
    EXPECT_CALL(f.automation_agent, reject_and_move(_)).Times(0);

    EXPECT_EQ(f.drain(), 1);
    EXPECT_EQ(f.status_of(job), Job::Status::CANCELLED);
    EXPECT_THAT(f.log_of(job), HasSubstr("is new now"));
}

// NOLINTNEXTLINE
TEST(DrainPendingJobs, cancellation_notice_with_the_database_agent) {
    TestDb db;
    auto topic_id = add_topic_with_post(db, tasv::forum::WORKBENCH_FORUM_ID);
    auto sub = db.add_submission(
        {.status = tasv::submissions::Submission::Status::CANCELLED, .topic_id = topic_id}
    );
    auto job = add_job(db.conn(), Job::Type::REJECT_SUBMISSION_TOPIC, sub, std::nullopt, "");
    NiceMock<MockVideoSync> video_sync;
    MockRoleGrantor role_grantor;
    tasv::forum::DbAutomationAgent automation_agent{db.conn()};
    tasv::wiki::DbWikiPages wiki_pages{db.conn()};

    EXPECT_EQ(
        drain_pending_jobs(
            db.conn(), retry_policy, {video_sync, role_grantor, automation_agent, wiki_pages}
        ),
        1
    );
    EXPECT_EQ(
        db.query_value(Select("status").from("jobs").where("id=?", job)),
        static_cast<uint8_t>(Job::Status::DONE)
    );
    EXPECT_EQ(
        db.query_value(Select("forum_id").from("forum_topics").where("id=?", topic_id)),
        tasv::forum::GRUE_FOOD_FORUM_ID
    );
    EXPECT_EQ(
        db.query_value(Select("COUNT(*)").from("forum_posts").where(
            "topic_id=? AND forum_id=?", topic_id, tasv::forum::GRUE_FOOD_FORUM_ID
        )),
        2
    );
    EXPECT_THAT(
        db.query_value<std::string>(Select("text").from("forum_posts").where(
            "topic_id=? AND text<>'first'", topic_id
        )),
        HasSubstr("cancelled")
    );
}

// NOLINTNEXTLINE
TEST(ResetInProgressJobs, basic) {
    JobServerFixture f;
    auto stuck = add_job(f.db.conn(), Job::Type::SYNC_VIDEO, 1, std::nullopt, "u");
    auto done = add_job(f.db.conn(), Job::Type::SYNC_VIDEO, 1, std::nullopt, "u");
    f.db.conn().execute(tasv::sql::Update("jobs")
                            .set("status=?", Job::Status::IN_PROGRESS)
                            .where("id=?", stuck));
    f.db.conn().execute(
        tasv::sql::Update("jobs").set("status=?", Job::Status::DONE).where("id=?", done)
    );

    reset_in_progress_jobs(f.db.conn());
    EXPECT_EQ(f.status_of(stuck), Job::Status::PENDING);
    EXPECT_EQ(f.status_of(done), Job::Status::DONE);
}

// NOLINTNEXTLINE
TEST(RestartJob, failed_job_runs_again) {
    JobServerFixture f;
    auto pub = f.db.add_publication({});
    auto job = add_job(f.db.conn(), Job::Type::GRANT_AUTHOR_ROLES, pub, std::nullopt, "");
    EXPECT_CALL(f.role_grantor, assign_auto_assignable_roles_by_publication(_, _))
        .WillOnce(Throw(std::runtime_error("transient")))
        .WillOnce(testing::Return());

    EXPECT_EQ(f.drain(), 1);
    EXPECT_EQ(f.status_of(job), Job::Status::FAILED);
    tasv::jobs::restart_job(f.db.conn(), job);
    EXPECT_EQ(f.status_of(job), Job::Status::PENDING);
    EXPECT_EQ(f.log_of(job), "");
    EXPECT_EQ(f.drain(), 1);
    EXPECT_EQ(f.status_of(job), Job::Status::DONE);
}
