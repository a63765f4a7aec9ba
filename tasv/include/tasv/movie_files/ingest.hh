#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <tasv/movie_files/movie_parser.hh>
#include <tasv/operation_error.hh>

namespace tasv::movie_files {

struct IngestedMovie {
    ParseResult parse_result;
    std::string movie_file; // always a zip archive
};

/**
 * @brief Turns uploaded bytes into a parse result and the canonical (zipped) movie file
 *
 * @param parser parser to dispatch to
 * @param upload uploaded bytes, optionally gzip-compressed
 * @param filename name of the uploaded file
 * @param max_decompressed_size limit of the decompressed payload size (protects against zip
 *   bombs)
 *
 * @return VALIDATION_FAILED if the payload exceeds @p max_decompressed_size or the parser
 *   rejects it
 */
OperationResult<IngestedMovie> ingest_movie(
    MovieParser& parser,
    std::string_view upload,
    std::string_view filename,
    uint64_t max_decompressed_size
);

} // namespace tasv::movie_files
