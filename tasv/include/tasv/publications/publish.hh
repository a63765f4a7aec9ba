#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tasv/config.hh>
#include <tasv/db/connection.hh>
#include <tasv/operation_error.hh>
#include <tasv/publications/publication.hh>
#include <tasv/submissions/submission.hh>
#include <tasv/users/user.hh>
#include <tasv/video_sync/video_sync.hh>
#include <tasv/wiki/wiki_pages.hh>
#include <vector>

namespace tasv::publications {

struct PublishCollaborators {
    wiki::WikiPages& wiki_pages;
    const video_sync::VideoSync& video_sync;
};

struct PublishRequest {
    decltype(submissions::Submission::id) submission_id;
    std::string movie_filename; // without the extension
    std::string online_watching_url;
    std::string alternate_online_watching_url; // optional
    std::string alternate_online_watching_url_name;
    std::string mirror_site_url; // optional
    std::vector<uint64_t> flag_ids;
    std::vector<uint64_t> tag_ids;
    std::string movie_description; // markup of the publication wiki page
    std::optional<decltype(Publication::id)> movie_to_obsolete;
};

struct PublishResult {
    decltype(Publication::id) publication_id;
    std::string title;
};

// Turns a submission in publication underway into a publication. The downstream effects (role
// grants, the publication notice and video syncs) are scheduled as jobs committed together with
// the publication.
OperationResult<PublishResult> publish(
    db::Connection& conn,
    const Config& config,
    const PublishCollaborators& collaborators,
    const users::Actor& publisher,
    const PublishRequest& request
);

} // namespace tasv::publications
