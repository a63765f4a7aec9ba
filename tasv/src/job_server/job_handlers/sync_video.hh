#pragma once

#include "common.hh"

#include <string_view>
#include <tasv/db/connection.hh>
#include <tasv/jobs/job.hh>
#include <tasv/publications/publication.hh>
#include <tasv/video_sync/video_sync.hh>
#include <tasv/wiki/wiki_pages.hh>

namespace job_server::job_handlers {

// The descriptor is built from the current state of the publication, so a sync scheduled by an
// obsoletion carries the new obsoleted-by id
void sync_video(
    tasv::db::Connection& conn,
    JobLog& logger,
    decltype(tasv::jobs::Job::id) job_id,
    tasv::video_sync::VideoSync& video_sync,
    tasv::wiki::WikiPages& wiki_pages,
    decltype(tasv::publications::Publication::id) publication_id,
    std::string_view url
);

} // namespace job_server::job_handlers
