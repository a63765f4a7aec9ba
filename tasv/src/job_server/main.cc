#include "dispatcher.hh"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <exception>
#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <sys/signalfd.h>
#include <tasv/config.hh>
#include <tasv/connect.hh>
#include <tasv/forum/automation_agent.hh>
#include <tasv/roles/role_grantor.hh>
#include <tasv/video_sync/video_sync.hh>
#include <tasv/wiki/wiki_pages.hh>
#include <tasvlib/defer.hh>
#include <tasvlib/errmsg.hh>
#include <tasvlib/logger.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <unistd.h>

namespace {

// Consumes all queued inotify events
void drain_inotify_events(int inotify_fd) {
    alignas(inotify_event) std::array<char, 4096> buff;
    while (read(inotify_fd, buff.data(), buff.size()) > 0) {
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 2) {
        errlog("Usage: ", argv[0], " <config file>");
        return 1;
    }

    tasv::Config config;
    try {
        config = tasv::Config::load(argv[1]);
    } catch (const std::exception& e) {
        errlog("Failed to load ", argv[1], ": ", e.what());
        return 1;
    }

    // Loggers
    try {
        if (!config.stdlog_file.empty()) {
            stdlog.open(config.stdlog_file);
        }
        if (!config.errlog_file.empty()) {
            errlog.open(config.errlog_file);
        }
    } catch (const std::exception& e) {
        errlog("Failed to open the log files: ", e.what());
        return 1;
    }

    // Video sync writes the description to a pipe of a child that may exit early
    (void)signal(SIGPIPE, SIG_IGN);

    sigset_t sigset;
    if (sigemptyset(&sigset) || sigaddset(&sigset, SIGINT) || sigaddset(&sigset, SIGTERM) ||
        sigaddset(&sigset, SIGQUIT))
    {
        errlog("sigaddset()", errmsg());
        return 1;
    }
    if (sigprocmask(SIG_BLOCK, &sigset, nullptr)) {
        errlog("sigprocmask()", errmsg());
        return 1;
    }
    int sigfd = signalfd(-1, &sigset, SFD_CLOEXEC);
    if (sigfd < 0) {
        errlog("signalfd()", errmsg());
        return 1;
    }
    auto sigfd_guard = Defer{[&]() noexcept { (void)close(sigfd); }};

    // Create the notify file if does not exist and start watching it
    {
        int fd = open(config.job_server_notify_file.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            errlog("Failed to create ", config.job_server_notify_file, errmsg());
            return 1;
        }
        (void)close(fd);
    }
    int inotify_fd = inotify_init1(IN_CLOEXEC | IN_NONBLOCK);
    if (inotify_fd < 0) {
        errlog("inotify_init1()", errmsg());
        return 1;
    }
    auto inotify_fd_guard = Defer{[&]() noexcept { (void)close(inotify_fd); }};
    if (inotify_add_watch(
            inotify_fd, config.job_server_notify_file.c_str(), IN_ATTRIB | IN_MODIFY | IN_CLOSE_WRITE
        ) < 0)
    {
        errlog("inotify_add_watch()", errmsg());
        return 1;
    }

    try {
        STACK_UNWINDING_MARK;
        auto conn = tasv::connect(config);
        tasv::video_sync::CommandVideoSync video_sync{config.video_sync_command};
        tasv::roles::DbRoleGrantor role_grantor{*conn};
        tasv::forum::DbAutomationAgent automation_agent{*conn};
        tasv::wiki::DbWikiPages wiki_pages{*conn};
        job_server::JobCollaborators collaborators{
            .video_sync = video_sync,
            .role_grantor = role_grantor,
            .automation_agent = automation_agent,
            .wiki_pages = wiki_pages,
        };

        stdlog(
            "=================== Job server launched ==================="
            "\nPID: ",
            getpid(),
            "\nnotify file: ",
            config.job_server_notify_file
        );

        // Restart jobs that were left in-progress by the previous invocation of the job server
        job_server::reset_in_progress_jobs(*conn);

        for (;;) {
            try {
                auto processed =
                    job_server::drain_pending_jobs(*conn, config.retry_policy, collaborators);
                if (processed > 0) {
                    stdlog("Processed ", processed, " jobs");
                }
            } catch (const std::exception& e) {
                // The store is unavailable, try again after the next wake-up
                ERRLOG_CATCH(e);
            }

            std::array<pollfd, 2> pfds = {{
                {.fd = inotify_fd, .events = POLLIN, .revents = 0},
                {.fd = sigfd, .events = POLLIN, .revents = 0},
            }};
            int rc = poll(pfds.data(), pfds.size(), static_cast<int>(config.job_server_poll_interval_ms));
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                errlog("poll()", errmsg());
                return 1;
            }
            if (pfds[1].revents & POLLIN) {
                break;
            }
            if (pfds[0].revents & POLLIN) {
                drain_inotify_events(inotify_fd);
            }
        }
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        return 1;
    }

    stdlog("Job server has shut down.");
    return 0;
}
