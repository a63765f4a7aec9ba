#include <tasv/movie_files/ingest.hh>
#include <tasvlib/libarchive_zip.hh>
#include <tasvlib/logger.hh>
#include <tasvlib/macros/stack_unwinding.hh>

using std::string;
using std::string_view;

namespace {

string join_errors(const std::vector<string>& errors) {
    string res;
    for (const auto& err : errors) {
        res += res.empty() ? ": " : "; ";
        res += err;
    }
    return res;
}

} // namespace

namespace tasv::movie_files {

OperationResult<IngestedMovie> ingest_movie(
    MovieParser& parser, string_view upload, string_view filename, uint64_t max_decompressed_size
) {
    STACK_UNWINDING_MARK;

    string decompressed;
    string_view payload = upload;
    if (has_gzip_magic(upload)) {
        try {
            decompressed = gunzip(upload, max_decompressed_size);
            payload = decompressed;
            if (filename.ends_with(".gz")) {
                filename.remove_suffix(3);
            }
        } catch (const DecompressionLimitExceeded&) {
            return operation_error(
                ErrorKind::VALIDATION_FAILED,
                "Decompressed movie file exceeds the limit of ",
                max_decompressed_size,
                " bytes"
            );
        } catch (const std::exception& e) {
            // Some clients send uncompressed payloads that merely look compressed
            stdlog("Ungzipping ", filename, " failed, using raw bytes: ", e.what());
        }
    }
    if (payload.size() > max_decompressed_size) {
        return operation_error(
            ErrorKind::VALIDATION_FAILED,
            "Movie file exceeds the limit of ",
            max_decompressed_size,
            " bytes"
        );
    }

    IngestedMovie res;
    if (has_zip_magic(payload)) {
        try {
            (void)zip_decompressed_size(payload, max_decompressed_size);
        } catch (const DecompressionLimitExceeded&) {
            return operation_error(
                ErrorKind::VALIDATION_FAILED,
                "Decompressed movie file exceeds the limit of ",
                max_decompressed_size,
                " bytes"
            );
        } catch (const std::exception& e) {
            return operation_error(ErrorKind::VALIDATION_FAILED, "Invalid zip file: ", e.what());
        }
    }
    try {
        if (has_zip_magic(payload)) {
            res.parse_result =
                call_dependency("Movie parser", [&] { return parser.parse_zip(payload); });
            res.movie_file = payload;
        } else {
            res.parse_result =
                call_dependency("Movie parser", [&] { return parser.parse(payload, filename); });
            res.movie_file = zip_single_file(filename, payload);
        }
    } catch (const DependencyFailure& e) {
        ERRLOG_CATCH(e);
        return operation_error(ErrorKind::DEPENDENCY_FAILURE, e.what());
    }

    if (!res.parse_result.success) {
        return operation_error(
            ErrorKind::VALIDATION_FAILED,
            "Movie file parsing failed",
            join_errors(res.parse_result.errors)
        );
    }
    return Ok{std::move(res)};
}

} // namespace tasv::movie_files
