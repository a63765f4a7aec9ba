#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tasv/db/connection.hh>
#include <tasv/operation_error.hh>
#include <tasv/publications/publication.hh>
#include <vector>

namespace tasv::publications {

struct HistoryFlag {
    std::string token;
    std::string name;
};

struct PublicationHistoryNode {
    decltype(Publication::id) id;
    std::string title;
    std::string goal;
    std::string class_name;
    std::string class_icon_path;
    std::string created_at;
    std::optional<decltype(Publication::id)> obsoleted_by_id;
    // Ordered by token
    std::vector<HistoryFlag> flags;
    // Indices into PublicationHistory::publications of the publications obsoleted by this one
    std::vector<size_t> obsoletes;
};

struct PublicationHistory {
    uint64_t game_id;
    std::string game_display_name;
    // All publications of the game ordered by id
    std::vector<PublicationHistoryNode> publications;
    // Indices into publications of the publications that are not obsolete
    std::vector<size_t> roots;
};

// Builds the obsoletion forest from the given nodes, in linear time
void link_obsoletion_forest(PublicationHistory& history);

// NOT_FOUND if the game does not exist
OperationResult<PublicationHistory>
publication_history_for_game(db::Connection& conn, uint64_t game_id);

// History of the game of the publication, NOT_FOUND if the publication does not exist
OperationResult<PublicationHistory> publication_history_for_game_by_publication(
    db::Connection& conn, decltype(Publication::id) publication_id
);

} // namespace tasv::publications
