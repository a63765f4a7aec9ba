#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tasv::submissions {

// Frame rate assumed when the system has no known rate for the region of the movie
constexpr double DEFAULT_FRAME_RATE = 60.0;

// Returns the duration of @p frames frames as [H:]MM:SS.mmm
std::string movie_time(uint32_t frames, std::optional<double> frame_rate);

// "a", "a & b", "a, b & c"
std::string join_authors(const std::vector<std::string>& authors);

// Registered authors in the order of their ordinals followed by the comma-separated additional
// authors
std::vector<std::string> all_authors(
    const std::vector<std::string>& author_usernames, std::string_view additional_authors
);

struct TitleParts {
    std::string system_code;
    std::string game_name;
    std::string goal; // omitted from the title if empty
    std::vector<std::string> authors;
    uint32_t frames;
    std::optional<double> frame_rate;
};

// #<id>: <authors>'s <system> <game>[ "<goal>"] in <time>
std::string submission_title(uint64_t submission_id, const TitleParts& parts);

// <system> <game>[ "<goal>"] by <authors> in <time>, the "baseline" goal is omitted
std::string publication_title(const TitleParts& parts);

} // namespace tasv::submissions
