#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tasv::movie_files {

struct ParseResult {
    bool success = false;
    std::vector<std::string> errors;
    std::string system_code;
    uint32_t frames = 0;
    uint32_t rerecord_count = 0;
    std::string region; // e.g. "ntsc", "pal"
    std::optional<double> frame_rate_override;
    std::vector<std::pair<std::string, std::string>> hashes; // (hash type, hash) in report order
    std::string annotations;
    std::vector<std::string> warnings;
    std::string file_extension; // without the leading '.'
};

// Per-format movie parsers live outside of tasv, this is the contract they fulfil
class MovieParser {
public:
    MovieParser() = default;
    MovieParser(const MovieParser&) = delete;
    MovieParser(MovieParser&&) = delete;
    MovieParser& operator=(const MovieParser&) = delete;
    MovieParser& operator=(MovieParser&&) = delete;
    virtual ~MovieParser() = default;

    virtual ParseResult parse(std::string_view data, std::string_view filename) = 0;

    virtual ParseResult parse_zip(std::string_view zip) = 0;
};

} // namespace tasv::movie_files
