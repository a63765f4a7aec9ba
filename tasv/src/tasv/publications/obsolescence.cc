#include <set>
#include <tasv/job_server/notify.hh>
#include <tasv/jobs/utils.hh>
#include <tasv/publications/obsolescence.hh>
#include <tasv/sql/sql.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/macros/throw.hh>

using std::optional;
using tasv::sql::Select;
using tasv::sql::Update;

namespace {

struct GraphNode {
    uint64_t game_id;
    optional<uint64_t> obsoleted_by_id;
};

optional<GraphNode> find_node(tasv::db::Connection& conn, uint64_t publication_id) {
    GraphNode node{};
    auto stmt = conn.execute(
        Select("game_id, obsoleted_by_id").from("publications").where("id=?", publication_id)
    );
    stmt.res_bind(node.game_id, node.obsoleted_by_id);
    if (!stmt.next()) {
        return std::nullopt;
    }
    return node;
}

} // namespace

namespace tasv::publications {

OperationResult<size_t> obsolete_with(
    db::Connection& conn,
    const Config& config,
    const video_sync::VideoSync& video_sync,
    decltype(Publication::id) to_obsolete_id,
    decltype(Publication::id) obsoleting_id
) {
    STACK_UNWINDING_MARK;
    if (to_obsolete_id == obsoleting_id) {
        return operation_error(
            ErrorKind::PRECONDITION_FAILED, "A publication can not obsolete itself"
        );
    }

    try {
        optional<db::Transaction> transaction;
        if (!conn.in_transaction()) {
            transaction.emplace(conn.start_transaction());
        }

        auto to_obsolete = find_node(conn, to_obsolete_id);
        if (!to_obsolete) {
            return operation_error(
                ErrorKind::NOT_FOUND, "Publication ", to_obsolete_id, " does not exist"
            );
        }
        auto obsoleting = find_node(conn, obsoleting_id);
        if (!obsoleting) {
            return operation_error(
                ErrorKind::NOT_FOUND, "Publication ", obsoleting_id, " does not exist"
            );
        }
        if (to_obsolete->game_id != obsoleting->game_id) {
            return operation_error(
                ErrorKind::PRECONDITION_FAILED,
                "Publication ",
                to_obsolete_id,
                " belongs to a different game than publication ",
                obsoleting_id
            );
        }
        // Following the obsoleted-by chain of the obsoleting publication must not lead back. The
        // walk stops at a revisited id, so a cycle already in the store can not hang it.
        std::set<uint64_t> visited = {obsoleting_id};
        for (auto next = obsoleting->obsoleted_by_id; next;) {
            if (*next == to_obsolete_id) {
                return operation_error(
                    ErrorKind::PRECONDITION_FAILED,
                    "Obsoleting publication ",
                    to_obsolete_id,
                    " with ",
                    obsoleting_id,
                    " would create a cycle"
                );
            }
            if (!visited.emplace(*next).second) {
                return operation_error(
                    ErrorKind::PRECONDITION_FAILED,
                    "Obsoletion chain of publication ",
                    obsoleting_id,
                    " already contains a cycle"
                );
            }
            auto node = find_node(conn, *next);
            throw_assert(node);
            next = node->obsoleted_by_id;
        }

        conn.execute(Update("publications")
                         .set("obsoleted_by_id=?", obsoleting_id)
                         .where("id=?", to_obsolete_id));
        auto jobs_added = jobs::add_sync_video_jobs(conn, video_sync, to_obsolete_id);

        if (transaction) {
            transaction->commit();
            job_server::notify_job_server(config.job_server_notify_file);
        }
        stdlog(
            "Publication ",
            to_obsolete_id,
            " obsoleted by ",
            obsoleting_id,
            ", scheduled ",
            jobs_added,
            " video syncs"
        );
        return Ok{jobs_added};
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::UNEXPECTED, "Obsoletion failed: ", e.what());
    }
}

OperationResult<ObsoletePublicationInfo> obsolete_publication_info(
    db::Connection& conn, wiki::WikiPages& wiki_pages, decltype(Publication::id) publication_id
) {
    STACK_UNWINDING_MARK;
    try {
        ObsoletePublicationInfo info;
        {
            auto stmt =
                conn.execute(Select("title").from("publications").where("id=?", publication_id));
            stmt.res_bind(info.title);
            if (!stmt.next()) {
                return operation_error(
                    ErrorKind::NOT_FOUND, "Publication ", publication_id, " does not exist"
                );
            }
        }
        {
            uint64_t tag_id = 0;
            auto stmt = conn.execute(Select("tag_id")
                                         .from("publication_tags")
                                         .where("publication_id=?", publication_id)
                                         .order_by("tag_id"));
            stmt.res_bind(tag_id);
            while (stmt.next()) {
                info.tag_ids.emplace_back(tag_id);
            }
        }
        auto page = call_dependency("Wiki", [&] {
            return wiki_pages.page(wiki::publication_page_name(publication_id));
        });
        if (page) {
            info.markup = std::move(page->markup);
        }
        return Ok{std::move(info)};
    } catch (const DependencyFailure& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::DEPENDENCY_FAILURE, e.what());
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        return operation_error(
            ErrorKind::UNEXPECTED, "Loading the publication to obsolete failed: ", e.what()
        );
    }
}

} // namespace tasv::publications
