#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tasvlib/macros/enum_with_string_conversions.hh>
#include <tasvlib/macros/throw.hh>

namespace tasv::jobs {

struct Job {
    ENUM_WITH_STRING_CONVERSIONS(Type, uint8_t,
        (SYNC_VIDEO, 1, "sync_video")
        (GRANT_AUTHOR_ROLES, 2, "grant_author_roles")
        (NOTIFY_PUBLISHED, 3, "notify_published")
        (MOVE_SUBMISSION_TOPIC, 4, "move_submission_topic")
        (REJECT_SUBMISSION_TOPIC, 5, "reject_submission_topic")
    );

    ENUM_WITH_STRING_CONVERSIONS(Status, uint8_t,
        (PENDING, 1, "pending")
        (IN_PROGRESS, 3, "in_progress")
        (DONE, 4, "done")
        (FAILED, 5, "failed")
        (CANCELLED, 6, "cancelled")
    );

    uint64_t id;
    std::string created_at;
    Type type;
    int32_t priority;
    Status status;
    // SYNC_VIDEO: publication id; GRANT_AUTHOR_ROLES: publication id;
    // NOTIFY_PUBLISHED, MOVE_SUBMISSION_TOPIC, REJECT_SUBMISSION_TOPIC: submission id
    std::optional<uint64_t> aux_id;
    // NOTIFY_PUBLISHED: publication id; MOVE_SUBMISSION_TOPIC: destination forum id
    std::optional<uint64_t> aux_id_2;
    // SYNC_VIDEO: url to sync
    std::string info;
    std::string log;
};

// The greater, the more important
constexpr decltype(Job::priority) default_priority(Job::Type type) {
    switch (type) {
    case Job::Type::NOTIFY_PUBLISHED: return 30;
    case Job::Type::MOVE_SUBMISSION_TOPIC:
    case Job::Type::REJECT_SUBMISSION_TOPIC: return 25;
    case Job::Type::GRANT_AUTHOR_ROLES: return 20;
    case Job::Type::SYNC_VIDEO: return 10;
    }
    THROW("Invalid job type");
}

} // namespace tasv::jobs
