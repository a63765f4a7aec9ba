#include <string>
#include <tasv/jobs/utils.hh>
#include <tasv/sql/sql.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/time.hh>

using tasv::publications::Publication;
using tasv::publications::PublicationUrl;
using tasv::sql::InsertInto;
using tasv::sql::Select;
using tasv::sql::Update;

namespace tasv::jobs {

decltype(Job::id) add_job(
    db::Connection& conn,
    Job::Type type,
    std::optional<uint64_t> aux_id,
    std::optional<uint64_t> aux_id_2,
    std::string_view info
) {
    STACK_UNWINDING_MARK;
    return conn
        .execute(InsertInto("jobs (created_at, type, status, priority, aux_id, aux_id_2, info, log)")
                     .values(
                         "?, ?, ?, ?, ?, ?, ?, ''",
                         utc_mysql_datetime(),
                         type,
                         Job::Status::PENDING,
                         default_priority(type),
                         aux_id,
                         aux_id_2,
                         info
                     ))
        .insert_id();
}

size_t add_sync_video_jobs(
    db::Connection& conn,
    const video_sync::VideoSync& video_sync,
    decltype(Publication::id) publication_id
) {
    STACK_UNWINDING_MARK;
    std::vector<std::string> urls;
    {
        std::string url;
        auto stmt = conn.execute(Select("url")
                                     .from("publication_urls")
                                     .where(
                                         "publication_id=? AND type=?",
                                         publication_id,
                                         PublicationUrl::Type::STREAMING
                                     )
                                     .order_by("id"));
        stmt.res_bind(url);
        while (stmt.next()) {
            urls.emplace_back(url);
        }
    }

    size_t added = 0;
    for (const auto& url : urls) {
        if (video_sync.is_recognized_url(url)) {
            add_job(conn, Job::Type::SYNC_VIDEO, publication_id, std::nullopt, url);
            ++added;
        }
    }
    return added;
}

void restart_job(db::Connection& conn, decltype(Job::id) job_id) {
    STACK_UNWINDING_MARK;
    conn.execute(Update("jobs").set("status=?, log=''", Job::Status::PENDING).where("id=?", job_id));
}

} // namespace tasv::jobs
