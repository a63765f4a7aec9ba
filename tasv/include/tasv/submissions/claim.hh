#pragma once

#include <string>
#include <tasv/db/connection.hh>
#include <tasv/forum/topic_watcher.hh>
#include <tasv/operation_error.hh>
#include <tasv/submissions/submission.hh>
#include <tasv/users/user.hh>
#include <tasv/wiki/wiki_pages.hh>

namespace tasv::submissions {

struct ClaimCollaborators {
    wiki::WikiPages& wiki_pages;
    forum::TopicWatcher& topic_watcher;
};

// NEW -> JUDGING_UNDERWAY, the actor becomes the judge and starts watching the discussion topic.
// Returns the submission title.
OperationResult<std::string> claim_for_judging(
    db::Connection& conn,
    const ClaimCollaborators& collaborators,
    const users::Actor& actor,
    decltype(Submission::id) submission_id
);

// ACCEPTED -> PUBLICATION_UNDERWAY, the actor becomes the publisher. Returns the submission title.
OperationResult<std::string> claim_for_publishing(
    db::Connection& conn,
    const ClaimCollaborators& collaborators,
    const users::Actor& actor,
    decltype(Submission::id) submission_id
);

} // namespace tasv::submissions
