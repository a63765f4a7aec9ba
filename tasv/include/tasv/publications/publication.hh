#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tasv/submissions/submission.hh>
#include <tasv/users/user.hh>
#include <tasvlib/macros/enum_with_string_conversions.hh>

namespace tasv::publications {

struct Publication {
    uint64_t id;
    std::string created_at;
    decltype(submissions::Submission::id) submission_id;
    uint64_t publication_class_id;
    uint64_t system_id;
    uint64_t system_frame_rate_id;
    uint64_t game_id;
    uint64_t game_version_id;
    uint64_t game_goal_id;
    std::string emulator_version;
    uint32_t frames;
    uint32_t rerecord_count;
    std::string movie_file_name;
    std::string additional_authors;
    std::string title;
    std::optional<uint64_t> obsoleted_by_id;
};

struct PublicationUrl {
    ENUM_WITH_STRING_CONVERSIONS(Type, uint8_t,
        (STREAMING, 1, "streaming")
        (MIRROR, 2, "mirror")
    );

    uint64_t id;
    decltype(Publication::id) publication_id;
    std::string url;
    std::optional<std::string> display_name;
    Type type;
};

} // namespace tasv::publications
