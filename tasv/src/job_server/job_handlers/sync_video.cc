#include "sync_video.hh"

#include <optional>
#include <string>
#include <tasv/sql/sql.hh>
#include <tasvlib/macros/stack_unwinding.hh>

using std::optional;
using std::string;
using tasv::jobs::Job;
using tasv::publications::Publication;
using tasv::sql::Select;

namespace job_server::job_handlers {

void sync_video(
    tasv::db::Connection& conn,
    JobLog& logger,
    decltype(Job::id) job_id,
    tasv::video_sync::VideoSync& video_sync,
    tasv::wiki::WikiPages& wiki_pages,
    decltype(Publication::id) publication_id,
    std::string_view url
) {
    STACK_UNWINDING_MARK;
    logger("Publication id: ", publication_id, " url: ", url);

    tasv::video_sync::VideoDescriptor video{.publication_id = publication_id, .url = string{url}};
    {
        auto stmt = conn.execute(Select("p.title, s.code, p.obsoleted_by_id")
                                     .from("publications p")
                                     .inner_join("game_systems s")
                                     .on("s.id=p.system_id")
                                     .where("p.id=?", publication_id));
        stmt.res_bind(video.title, video.system_code, video.obsoleted_by_id);
        if (!stmt.next()) {
            logger("The publication does not exist");
            finish_job(conn, logger, job_id, Job::Status::CANCELLED);
            return;
        }
    }
    {
        optional<string> display_name;
        auto stmt = conn.execute(Select("display_name")
                                     .from("publication_urls")
                                     .where("publication_id=? AND url=?", publication_id, url)
                                     .limit("1"));
        stmt.res_bind(display_name);
        if (!stmt.next()) {
            logger("The url was removed from the publication");
            finish_job(conn, logger, job_id, Job::Status::CANCELLED);
            return;
        }
        video.display_name = std::move(display_name);
    }
    {
        string username;
        auto stmt = conn.execute(Select("u.username")
                                     .from("publication_authors a")
                                     .inner_join("users u")
                                     .on("u.id=a.user_id")
                                     .where("a.publication_id=?", publication_id)
                                     .order_by("a.ordinal"));
        stmt.res_bind(username);
        while (stmt.next()) {
            video.authors.emplace_back(username);
        }
    }
    if (auto page = wiki_pages.page(tasv::wiki::publication_page_name(publication_id))) {
        video.markup = std::move(page->markup);
    }

    video_sync.sync(video);
    logger("Synced");
    finish_job(conn, logger, job_id, Job::Status::DONE);
}

} // namespace job_server::job_handlers
