#include <tasv/publications/history.hh>
#include <tasv/sql/sql.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <unordered_map>

using std::optional;
using std::unordered_map;
using tasv::sql::Select;

namespace {

using tasv::publications::HistoryFlag;
using tasv::publications::Publication;
using tasv::publications::PublicationHistory;
using tasv::publications::PublicationHistoryNode;

// Returns std::nullopt if the game does not exist
optional<PublicationHistory> load_history(tasv::db::Connection& conn, uint64_t game_id) {
    STACK_UNWINDING_MARK;
    PublicationHistory history{.game_id = game_id};
    {
        auto stmt = conn.execute(Select("display_name").from("games").where("id=?", game_id));
        stmt.res_bind(history.game_display_name);
        if (!stmt.next()) {
            return std::nullopt;
        }
    }

    unordered_map<decltype(Publication::id), size_t> idx_of;
    {
        PublicationHistoryNode node;
        auto stmt = conn.execute(
            Select("p.id, p.title, g.display_name, c.name, c.icon_path, p.created_at, "
                   "p.obsoleted_by_id")
                .from("publications p")
                .inner_join("game_goals g")
                .on("g.id=p.game_goal_id")
                .inner_join("publication_classes c")
                .on("c.id=p.publication_class_id")
                .where("p.game_id=?", game_id)
                .order_by("p.id")
        );
        stmt.res_bind(
            node.id,
            node.title,
            node.goal,
            node.class_name,
            node.class_icon_path,
            node.created_at,
            node.obsoleted_by_id
        );
        while (stmt.next()) {
            idx_of.emplace(node.id, history.publications.size());
            history.publications.emplace_back(node);
        }
    }

    // Flags of all the publications in one pass
    decltype(Publication::id) publication_id = 0;
    HistoryFlag flag;
    auto stmt = conn.execute(Select("pf.publication_id, f.token, f.name")
                                 .from("publication_flags pf")
                                 .inner_join("flags f")
                                 .on("f.id=pf.flag_id")
                                 .inner_join("publications p")
                                 .on("p.id=pf.publication_id")
                                 .where("p.game_id=?", game_id)
                                 .order_by("pf.publication_id, f.token"));
    stmt.res_bind(publication_id, flag.token, flag.name);
    while (stmt.next()) {
        auto it = idx_of.find(publication_id);
        if (it != idx_of.end()) {
            history.publications[it->second].flags.emplace_back(flag);
        }
    }
    return history;
}

} // namespace

namespace tasv::publications {

void link_obsoletion_forest(PublicationHistory& history) {
    auto& pubs = history.publications;
    unordered_map<decltype(Publication::id), size_t> idx_of;
    idx_of.reserve(pubs.size());
    for (size_t i = 0; i < pubs.size(); ++i) {
        idx_of.emplace(pubs[i].id, i);
        pubs[i].obsoletes.clear();
    }

    history.roots.clear();
    for (size_t i = 0; i < pubs.size(); ++i) {
        if (!pubs[i].obsoleted_by_id) {
            history.roots.emplace_back(i);
            continue;
        }
        auto it = idx_of.find(*pubs[i].obsoleted_by_id);
        if (it == idx_of.end()) {
            // Obsoleted by a publication outside of the game, it heads its own chain here
            history.roots.emplace_back(i);
        } else {
            pubs[it->second].obsoletes.emplace_back(i);
        }
    }
}

OperationResult<PublicationHistory>
publication_history_for_game(db::Connection& conn, uint64_t game_id) {
    STACK_UNWINDING_MARK;
    try {
        auto history = load_history(conn, game_id);
        if (!history) {
            return operation_error(ErrorKind::NOT_FOUND, "Game ", game_id, " does not exist");
        }
        link_obsoletion_forest(*history);
        return Ok{std::move(*history)};
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        return operation_error(
            ErrorKind::UNEXPECTED, "Loading publication history failed: ", e.what()
        );
    }
}

OperationResult<PublicationHistory> publication_history_for_game_by_publication(
    db::Connection& conn, decltype(Publication::id) publication_id
) {
    STACK_UNWINDING_MARK;
    optional<uint64_t> game_id;
    try {
        uint64_t id = 0;
        auto stmt =
            conn.execute(Select("game_id").from("publications").where("id=?", publication_id));
        stmt.res_bind(id);
        if (stmt.next()) {
            game_id = id;
        }
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        return operation_error(
            ErrorKind::UNEXPECTED, "Loading publication history failed: ", e.what()
        );
    }
    if (!game_id) {
        return operation_error(
            ErrorKind::NOT_FOUND, "Publication ", publication_id, " does not exist"
        );
    }
    return publication_history_for_game(conn, *game_id);
}

} // namespace tasv::publications
