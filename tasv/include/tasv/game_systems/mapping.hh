#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tasv/db/connection.hh>
#include <tasv/db/repeat_if_conflicted.hh>
#include <tasv/movie_files/movie_parser.hh>
#include <tasv/operation_error.hh>

namespace tasv::game_systems {

struct GameSystem {
    uint64_t id;
    std::string code;
    std::string display_name;
};

struct FrameRate {
    uint64_t id;
    decltype(GameSystem::id) system_id;
    double frame_rate;
    std::string region;
    bool is_default;
};

// Parse result expressed in terms of the stored systems and frame rates
struct MappedMovie {
    GameSystem system;
    // Missing if no rate is known for the region of the movie
    std::optional<FrameRate> frame_rate;
    uint32_t frames;
    uint32_t rerecord_count;
    std::string movie_extension;
    std::string hash; // empty if the parser reported none
    std::string hash_type;
    std::string annotations;
    std::string warnings;
};

constexpr size_t ANNOTATIONS_MAX_LEN = 3500;
constexpr size_t WARNINGS_MAX_LEN = 500;

std::optional<GameSystem> find_system_by_code(db::Connection& conn, std::string_view code);

// Finds the (system, frame_rate, region) record or creates it. A concurrent creation of the same
// record is not an error: the record created by the other writer is returned.
FrameRate find_or_create_frame_rate(
    db::Connection& conn,
    const db::RetryPolicy& retry_policy,
    decltype(GameSystem::id) system_id,
    double frame_rate,
    const std::string& region
);

// Returns VALIDATION_FAILED if the system of the movie is unknown
OperationResult<MappedMovie> map_parse_result(
    db::Connection& conn,
    const db::RetryPolicy& retry_policy,
    const movie_files::ParseResult& parse_result
);

} // namespace tasv::game_systems
