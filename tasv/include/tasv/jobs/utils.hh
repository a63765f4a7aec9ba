#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <tasv/db/connection.hh>
#include <tasv/jobs/job.hh>
#include <tasv/publications/publication.hh>
#include <tasv/submissions/submission.hh>
#include <tasv/video_sync/video_sync.hh>

namespace tasv::jobs {

decltype(Job::id) add_job(
    db::Connection& conn,
    Job::Type type,
    std::optional<uint64_t> aux_id,
    std::optional<uint64_t> aux_id_2,
    std::string_view info
);

// Adds a SYNC_VIDEO job for every streaming url of the publication recognized by @p video_sync,
// returns the number of added jobs
size_t add_sync_video_jobs(
    db::Connection& conn,
    const video_sync::VideoSync& video_sync,
    decltype(publications::Publication::id) publication_id
);

void restart_job(db::Connection& conn, decltype(Job::id) job_id);

} // namespace tasv::jobs
