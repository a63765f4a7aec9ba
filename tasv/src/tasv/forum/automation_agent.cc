#include <optional>
#include <tasv/forum/automation_agent.hh>
#include <tasv/forum/forums.hh>
#include <tasv/sql/sql.hh>
#include <tasv/submissions/submission.hh>
#include <tasv/wiki/wiki_pages.hh>
#include <tasvlib/concat_tostr.hh>
#include <tasvlib/logger.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/macros/throw.hh>
#include <tasvlib/time.hh>

using tasv::sql::InsertInto;
using tasv::sql::Select;
using tasv::sql::Update;

namespace {

// The post lands in the forum the topic currently belongs to
void add_post(tasv::db::Connection& conn, uint64_t topic_id, std::string_view text) {
    conn.execute(InsertInto("forum_posts (topic_id, forum_id, poster_id, text, created_at)")
                     .select(Select("id, forum_id, NULL, ?, ?", text, utc_mysql_datetime())
                                 .from("forum_topics")
                                 .where("id=?", topic_id)));
}

} // namespace

namespace tasv::forum {

uint64_t DbAutomationAgent::post_submission_topic(uint64_t submission_id, std::string_view title) {
    STACK_UNWINDING_MARK;
    auto topic_id = conn.execute(InsertInto("forum_topics (forum_id, title, submission_id, "
                                            "poster_id, created_at)")
                                     .values(
                                         "?, ?, ?, NULL, ?",
                                         WORKBENCH_FORUM_ID,
                                         title,
                                         submission_id,
                                         utc_mysql_datetime()
                                     ))
                        .insert_id();
    add_post(
        conn,
        topic_id,
        concat_tostr(
            "[submission]",
            submission_id,
            "[/submission]\n[module:wikilink|",
            wiki::submission_page_name(submission_id),
            "]"
        )
    );
    return topic_id;
}

void DbAutomationAgent::post_submission_published(uint64_t submission_id, uint64_t publication_id) {
    STACK_UNWINDING_MARK;
    std::optional<uint64_t> topic_id;
    {
        auto stmt =
            conn.execute(Select("topic_id").from("submissions").where("id=?", submission_id));
        stmt.res_bind(topic_id);
        if (!stmt.next()) {
            THROW("Submission ", submission_id, " does not exist");
        }
    }
    if (!topic_id) {
        stdlog("Submission ", submission_id, " has no discussion topic, skipping the notice");
        return;
    }

    add_post(
        conn,
        *topic_id,
        concat_tostr(
            "This movie has been published. The posts before this point pertain to the submission "
            "#",
            submission_id,
            ", the publication is [",
            publication_id,
            "M]."
        )
    );
}

void DbAutomationAgent::reject_and_move(uint64_t submission_id) {
    STACK_UNWINDING_MARK;
    std::optional<uint64_t> topic_id;
    submissions::Submission::Status status;
    {
        auto stmt = conn.execute(
            Select("topic_id, status").from("submissions").where("id=?", submission_id)
        );
        stmt.res_bind(topic_id, status);
        if (!stmt.next()) {
            THROW("Submission ", submission_id, " does not exist");
        }
    }
    if (!topic_id) {
        stdlog("Submission ", submission_id, " has no discussion topic, skipping the notice");
        return;
    }

    add_post(
        conn,
        *topic_id,
        status == submissions::Submission::Status::CANCELLED
            ? "om, nom, nom... The submission was cancelled by its author."
            : "om, nom, nom... The submission was rejected."
    );
    move_topic(conn, *topic_id, GRUE_FOOD_FORUM_ID);
}

void set_topic_title(db::Connection& conn, uint64_t topic_id, std::string_view title) {
    STACK_UNWINDING_MARK;
    conn.execute(Update("forum_topics").set("title=?", title).where("id=?", topic_id));
}

void move_topic(db::Connection& conn, uint64_t topic_id, uint64_t forum_id) {
    STACK_UNWINDING_MARK;
    conn.execute(Update("forum_topics").set("forum_id=?", forum_id).where("id=?", topic_id));
    conn.execute(Update("forum_posts").set("forum_id=?", forum_id).where("topic_id=?", topic_id));
}

} // namespace tasv::forum
