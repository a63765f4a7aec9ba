#include <tasv/forum/topic_watcher.hh>
#include <tasv/sql/sql.hh>
#include <tasvlib/macros/stack_unwinding.hh>

using tasv::sql::DeleteFrom;
using tasv::sql::InsertInto;
using tasv::sql::Select;

namespace tasv::forum {

void DbTopicWatcher::watch_topic(
    uint64_t topic_id, decltype(users::User::id) user_id, bool enabled
) {
    STACK_UNWINDING_MARK;
    if (!enabled) {
        conn.execute(
            DeleteFrom("forum_topic_watches").where("topic_id=? AND user_id=?", topic_id, user_id)
        );
        return;
    }

    auto stmt = conn.execute(Select("1")
                                 .from("forum_topic_watches")
                                 .where("topic_id=? AND user_id=?", topic_id, user_id));
    if (stmt.next()) {
        return; // Already watching
    }
    conn.execute(
        InsertInto("forum_topic_watches (topic_id, user_id)").values("?, ?", topic_id, user_id)
    );
}

} // namespace tasv::forum
