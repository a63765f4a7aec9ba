#pragma once

#include <string>
#include <utime.h>

namespace tasv::job_server {

// Notifies the job server that there are jobs to do
inline void notify_job_server(const std::string& notify_file) noexcept {
    (void)utime(notify_file.c_str(), nullptr);
}

} // namespace tasv::job_server
