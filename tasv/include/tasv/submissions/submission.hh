#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tasv/users/user.hh>
#include <tasvlib/macros/enum_with_string_conversions.hh>

namespace tasv::submissions {

struct Submission {
    ENUM_WITH_STRING_CONVERSIONS(Status, uint8_t,
        (NEW, 1, "new")
        (DELAYED, 2, "delayed")
        (NEEDS_MORE_INFO, 3, "needs_more_info")
        (JUDGING_UNDERWAY, 4, "judging_underway")
        (ACCEPTED, 5, "accepted")
        (PUBLICATION_UNDERWAY, 6, "publication_underway")
        (PUBLISHED, 7, "published")
        (REJECTED, 8, "rejected")
        (CANCELLED, 9, "cancelled")
        (PLAYGROUND, 10, "playground")
    );

    uint64_t id;
    uint64_t version;
    Status status;
    std::string created_at;
    std::string updated_at;
    decltype(users::User::id) submitter_id;
    std::optional<decltype(users::User::id)> judge_id;
    std::optional<decltype(users::User::id)> publisher_id;
    std::optional<uint64_t> intended_class_id;
    std::optional<uint64_t> rejection_reason_id;
    std::optional<uint64_t> topic_id;
    std::optional<uint64_t> game_id;
    std::optional<uint64_t> game_version_id;
    std::optional<uint64_t> game_goal_id;
    std::optional<uint64_t> system_id;
    std::optional<uint64_t> system_frame_rate_id;
    std::string game_name;
    std::string game_version;
    std::string branch;
    std::string rom_name;
    std::string emulator_version;
    std::string encode_embed_link;
    std::string additional_authors;
    uint32_t frames;
    uint32_t rerecord_count;
    std::string movie_extension;
    std::string hash;
    std::string hash_type;
    std::string annotations;
    std::string warnings;
    std::string title;
};

// Statuses in which the judging window is still meaningful
constexpr bool can_be_judged(Submission::Status status) noexcept {
    switch (status) {
    case Submission::Status::NEW:
    case Submission::Status::JUDGING_UNDERWAY:
    case Submission::Status::DELAYED:
    case Submission::Status::NEEDS_MORE_INFO: return true;
    case Submission::Status::ACCEPTED:
    case Submission::Status::PUBLICATION_UNDERWAY:
    case Submission::Status::PUBLISHED:
    case Submission::Status::REJECTED:
    case Submission::Status::CANCELLED:
    case Submission::Status::PLAYGROUND: return false;
    }
    return false;
}

// Statuses whose discussion belongs in the workbench forum
constexpr bool is_work_in_progress(Submission::Status status) noexcept {
    switch (status) {
    case Submission::Status::NEW:
    case Submission::Status::DELAYED:
    case Submission::Status::NEEDS_MORE_INFO:
    case Submission::Status::JUDGING_UNDERWAY:
    case Submission::Status::ACCEPTED:
    case Submission::Status::PUBLICATION_UNDERWAY: return true;
    case Submission::Status::PUBLISHED:
    case Submission::Status::REJECTED:
    case Submission::Status::CANCELLED:
    case Submission::Status::PLAYGROUND: return false;
    }
    return false;
}

constexpr bool is_grue_food(Submission::Status status) noexcept {
    return status == Submission::Status::REJECTED || status == Submission::Status::CANCELLED;
}

struct StatusHistoryEntry {
    uint64_t id;
    decltype(Submission::id) submission_id;
    Submission::Status previous_status;
    Submission::Status status;
    std::optional<decltype(users::User::id)> actor_id;
    std::string created_at;
};

} // namespace tasv::submissions
