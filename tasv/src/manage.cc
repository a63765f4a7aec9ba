#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <tasv/config.hh>
#include <tasv/connect.hh>
#include <tasv/db/schema.hh>
#include <tasv/job_server/notify.hh>
#include <tasv/jobs/utils.hh>
#include <tasv/video_sync/video_sync.hh>
#include <tasvlib/concat_tostr.hh>
#include <tasvlib/logger.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/macros/throw.hh>

using std::string_view;

namespace {

uint64_t parse_id(string_view str) {
    uint64_t res = 0;
    if (str.empty()) {
        THROW("Invalid id: ", str);
    }
    for (char c : str) {
        if (c < '0' || c > '9') {
            THROW("Invalid id: ", str);
        }
        res = res * 10 + static_cast<uint64_t>(c - '0');
    }
    return res;
}

} // namespace

namespace command {

static void help(const char* program_name) {
    if (not program_name) {
        program_name = "tasv-manage";
    }

    // clang-format off
    stdlog("Usage: ", program_name, " <command> <config file> [<command args>]\n"
           "Manage is a tool for maintaining the tasv store.\n"
           "Commands:\n"
           "  help                          Display this information\n"
           "  init                          Create the schema in the configured store\n"
           "  enqueue-sync <publication id> Schedule a re-sync of the publication's videos\n"
           "  restart-job <job id>          Make the job pending again");
    // clang-format on
}

static int init(const tasv::Config& config) {
    STACK_UNWINDING_MARK;
    auto conn = tasv::connect(config);
    tasv::db::create_schema(*conn);
    stdlog("Schema created");
    return 0;
}

static int enqueue_sync(const tasv::Config& config, uint64_t publication_id) {
    STACK_UNWINDING_MARK;
    auto conn = tasv::connect(config);
    tasv::video_sync::CommandVideoSync video_sync{config.video_sync_command};
    auto transaction = conn->start_transaction();
    auto added = tasv::jobs::add_sync_video_jobs(*conn, video_sync, publication_id);
    transaction.commit();
    tasv::job_server::notify_job_server(config.job_server_notify_file);
    stdlog("Scheduled ", added, " video syncs of publication ", publication_id);
    return 0;
}

static int restart_job(const tasv::Config& config, uint64_t job_id) {
    STACK_UNWINDING_MARK;
    auto conn = tasv::connect(config);
    tasv::jobs::restart_job(*conn, job_id);
    tasv::job_server::notify_job_server(config.job_server_notify_file);
    stdlog("Job ", job_id, " restarted");
    return 0;
}

} // namespace command

static int run_command(int argc, char** argv) {
    string_view command = argv[1];
    if (command == "help") {
        command::help(argv[0]);
        return 0;
    }
    if (argc < 3) {
        command::help(argv[0]);
        return 1;
    }

    auto config = tasv::Config::load(argv[2]);
    if (command == "init" && argc == 3) {
        return command::init(config);
    }
    if (command == "enqueue-sync" && argc == 4) {
        return command::enqueue_sync(config, parse_id(argv[3]));
    }
    if (command == "restart-job" && argc == 4) {
        return command::restart_job(config, parse_id(argv[3]));
    }
    errlog("Unknown command or wrong number of arguments: ", command);
    return 1;
}

int main(int argc, char** argv) {
    stdlog.use(stdout);
    stdlog.label(false);

    if (argc < 2) {
        command::help(argv[0]);
        return 1;
    }

    try {
        return run_command(argc, argv);
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        return 1;
    }
}
