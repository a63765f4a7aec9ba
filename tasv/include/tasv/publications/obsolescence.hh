#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tasv/config.hh>
#include <tasv/db/connection.hh>
#include <tasv/operation_error.hh>
#include <tasv/publications/publication.hh>
#include <tasv/video_sync/video_sync.hh>
#include <tasv/wiki/wiki_pages.hh>
#include <vector>

namespace tasv::publications {

/**
 * @brief Marks publication @p to_obsolete_id as obsoleted by @p obsoleting_id and schedules
 *   a re-sync of every recognized streaming url of the obsoleted publication
 *
 * Runs inside the caller's transaction if there is one, otherwise in its own and wakes the job
 * server after committing it. A caller that owns the transaction wakes the job server itself.
 * Refuses self-obsoletion, publications of different games and edges that would close a cycle.
 *
 * @return number of scheduled SYNC_VIDEO jobs
 */
OperationResult<size_t> obsolete_with(
    db::Connection& conn,
    const Config& config,
    const video_sync::VideoSync& video_sync,
    decltype(Publication::id) to_obsolete_id,
    decltype(Publication::id) obsoleting_id
);

struct ObsoletePublicationInfo {
    std::string title;
    std::vector<uint64_t> tag_ids;
    std::string markup;
};

// What an obsoleting publication usually inherits from the one it obsoletes, NOT_FOUND if the
// publication does not exist
OperationResult<ObsoletePublicationInfo> obsolete_publication_info(
    db::Connection& conn, wiki::WikiPages& wiki_pages, decltype(Publication::id) publication_id
);

} // namespace tasv::publications
