#include <cerrno>
#include <csignal>
#include <ctime>
#include <fcntl.h>
#include <pthread.h>
#include <spawn.h>
#include <sys/wait.h>
#include <tasv/video_sync/video_sync.hh>
#include <tasvlib/concat_tostr.hh>
#include <tasvlib/defer.hh>
#include <tasvlib/errmsg.hh>
#include <tasvlib/logger.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/macros/throw.hh>
#include <unistd.h>

extern char** environ; // NOLINT(readability-redundant-declaration)

using std::string;
using std::string_view;

namespace {

constexpr string_view youtube_prefixes[] = {
    "https://www.youtube.com/watch?v=",
    "https://youtube.com/watch?v=",
    "https://m.youtube.com/watch?v=",
    "https://youtu.be/",
    "https://www.youtube.com/embed/",
    "https://youtube.com/embed/",
};

string join_authors(const std::vector<string>& authors) {
    string res;
    for (const auto& author : authors) {
        if (!res.empty()) {
            res += ", ";
        }
        res += author;
    }
    return res;
}

// SIGPIPE is blocked in the calling thread for the duration of the write, so that a command
// exiting without reading its input fails the write with EPIPE instead of killing the process
void write_all(int fd, string_view data) {
    sigset_t sigpipe_set;
    sigemptyset(&sigpipe_set);
    sigaddset(&sigpipe_set, SIGPIPE);
    sigset_t pending;
    if (sigpending(&pending)) {
        THROW("sigpending()", errmsg());
    }
    bool sigpipe_was_pending = sigismember(&pending, SIGPIPE) == 1;
    sigset_t old_mask;
    if (int rc = pthread_sigmask(SIG_BLOCK, &sigpipe_set, &old_mask); rc) {
        THROW("pthread_sigmask()", errmsg(rc));
    }
    auto restore_mask = Defer{[&]() noexcept {
        // Discard the SIGPIPE raised by our own write before unblocking it
        if (!sigpipe_was_pending && sigpending(&pending) == 0 &&
            sigismember(&pending, SIGPIPE) == 1)
        {
            timespec no_wait = {};
            while (sigtimedwait(&sigpipe_set, nullptr, &no_wait) < 0 && errno == EINTR) {
            }
        }
        (void)pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
    }};

    while (!data.empty()) {
        auto rc = write(fd, data.data(), data.size());
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("write()", errmsg());
        }
        data.remove_prefix(static_cast<size_t>(rc));
    }
}

} // namespace

namespace tasv::video_sync {

string_view youtube_video_id(string_view url) noexcept {
    if (url.starts_with("http://")) {
        url.remove_prefix(7);
    } else if (url.starts_with("https://")) {
        url.remove_prefix(8);
    }
    for (auto prefix : youtube_prefixes) {
        prefix.remove_prefix(8); // "https://"
        if (url.starts_with(prefix)) {
            auto id = url.substr(prefix.size());
            return id.substr(0, id.find_first_of("&?#/"));
        }
    }
    return {};
}

bool is_youtube_url(string_view url) noexcept { return !youtube_video_id(url).empty(); }

string to_embed_link(string_view url) {
    auto id = youtube_video_id(url);
    if (id.empty()) {
        return string{url};
    }
    return concat_tostr("https://www.youtube.com/embed/", id);
}

void CommandVideoSync::sync(const VideoDescriptor& video) {
    STACK_UNWINDING_MARK;
    if (command.empty()) {
        stdlog(
            "Video sync disabled, skipping publication ", video.publication_id, " url: ", video.url
        );
        return;
    }

    auto publication_id = concat_tostr(video.publication_id);
    auto authors = join_authors(video.authors);
    auto obsoleted_by =
        video.obsoleted_by_id ? concat_tostr(*video.obsoleted_by_id) : string{};
    std::vector<char*> argv = {
        command.data(),
        publication_id.data(),
        const_cast<char*>(video.url.c_str()), // NOLINT(cppcoreguidelines-pro-type-const-cast)
        const_cast<char*>(video.title.c_str()), // NOLINT(cppcoreguidelines-pro-type-const-cast)
        const_cast<char*>(video.system_code.c_str()), // NOLINT(cppcoreguidelines-pro-type-const-cast)
        authors.data(),
        obsoleted_by.data(),
        nullptr,
    };

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC)) {
        THROW("pipe2()", errmsg());
    }
    bool write_end_open = true;
    auto close_pipe = Defer{[&]() noexcept {
        (void)close(pipefd[0]);
        if (write_end_open) {
            (void)close(pipefd[1]);
        }
    }};

    posix_spawn_file_actions_t file_actions;
    if (int rc = posix_spawn_file_actions_init(&file_actions); rc) {
        THROW("posix_spawn_file_actions_init()", errmsg(rc));
    }
    auto destroy_file_actions = Defer{[&]() noexcept {
        (void)posix_spawn_file_actions_destroy(&file_actions);
    }};
    if (int rc = posix_spawn_file_actions_adddup2(&file_actions, pipefd[0], STDIN_FILENO); rc) {
        THROW("posix_spawn_file_actions_adddup2()", errmsg(rc));
    }

    pid_t pid;
    if (int rc =
            posix_spawnp(&pid, command.c_str(), &file_actions, nullptr, argv.data(), environ);
        rc)
    {
        THROW("posix_spawnp(", command, ")", errmsg(rc));
    }

    try {
        write_all(pipefd[1], video.markup);
    } catch (const std::exception& e) {
        // The command may have exited without reading its input, its status decides
        errlog("Writing the description to the video sync command failed: ", e.what());
    }
    (void)close(pipefd[1]);
    write_end_open = false;

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            THROW("waitpid()", errmsg());
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        THROW(
            "Video sync command for publication ",
            video.publication_id,
            " failed with status: ",
            WIFEXITED(status) ? WEXITSTATUS(status) : -WTERMSIG(status)
        );
    }
    stdlog("Synced publication ", video.publication_id, " url: ", video.url);
}

} // namespace tasv::video_sync
