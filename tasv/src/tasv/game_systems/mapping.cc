#include <algorithm>
#include <cctype>
#include <tasv/game_systems/mapping.hh>
#include <tasv/sql/sql.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/macros/throw.hh>

using std::optional;
using std::string;
using std::string_view;
using tasv::sql::InsertInto;
using tasv::sql::Select;

namespace {

string to_upper(string str) {
    for (auto& c : str) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return str;
}

string cap_and_ellipse(string str, size_t max_len) {
    static constexpr string_view ellipsis = "...";
    if (str.size() > max_len) {
        str.resize(max_len - ellipsis.size());
        str += ellipsis;
    }
    return str;
}

template <class... Params>
optional<tasv::game_systems::FrameRate>
select_frame_rate(tasv::db::Connection& conn, string_view where, const Params&... params) {
    tasv::game_systems::FrameRate fr;
    auto stmt = conn.execute(Select("id, system_id, frame_rate, region, is_default")
                                 .from("game_system_frame_rates")
                                 .where(where, params...)
                                 .order_by("is_default DESC, id")
                                 .limit("1"));
    stmt.res_bind(fr.id, fr.system_id, fr.frame_rate, fr.region, fr.is_default);
    if (!stmt.next()) {
        return std::nullopt;
    }
    return fr;
}

} // namespace

namespace tasv::game_systems {

optional<GameSystem> find_system_by_code(db::Connection& conn, string_view code) {
    STACK_UNWINDING_MARK;
    GameSystem system;
    auto stmt =
        conn.execute(Select("id, code, display_name").from("game_systems").where("code=?", code));
    stmt.res_bind(system.id, system.code, system.display_name);
    if (!stmt.next()) {
        return std::nullopt;
    }
    return system;
}

FrameRate find_or_create_frame_rate(
    db::Connection& conn,
    const db::RetryPolicy& retry_policy,
    decltype(GameSystem::id) system_id,
    double frame_rate,
    const string& region
) {
    STACK_UNWINDING_MARK;
    auto select = [&] {
        return select_frame_rate(
            conn, "system_id=? AND frame_rate=? AND region=?", system_id, frame_rate, region
        );
    };

    return db::repeat_if_conflicted(retry_policy, [&] {
        if (auto fr = select()) {
            return *std::move(fr);
        }
        try {
            auto id = conn.execute(InsertInto("game_system_frame_rates (system_id, frame_rate, "
                                              "region, is_default)")
                                       .values("?, ?, ?, 0", system_id, frame_rate, region))
                          .insert_id();
            return FrameRate{
                .id = id,
                .system_id = system_id,
                .frame_rate = frame_rate,
                .region = region,
                .is_default = false,
            };
        } catch (const db::DuplicateKey&) {
            // Created concurrently by someone else
            auto fr = select();
            throw_assert(fr.has_value());
            return *std::move(fr);
        }
    });
}

OperationResult<MappedMovie> map_parse_result(
    db::Connection& conn,
    const db::RetryPolicy& retry_policy,
    const movie_files::ParseResult& parse_result
) {
    STACK_UNWINDING_MARK;
    if (!parse_result.success) {
        THROW("Cannot map a failed parse result");
    }

    auto system = find_system_by_code(conn, parse_result.system_code);
    if (!system) {
        return operation_error(
            ErrorKind::VALIDATION_FAILED, "Unknown system type of ", parse_result.system_code
        );
    }

    auto region = to_upper(parse_result.region);
    optional<FrameRate> frame_rate;
    if (parse_result.frame_rate_override) {
        frame_rate = find_or_create_frame_rate(
            conn, retry_policy, system->id, *parse_result.frame_rate_override, region
        );
    } else {
        frame_rate = select_frame_rate(conn, "system_id=? AND region=?", system->id, region);
    }

    string warnings;
    for (const auto& warning : parse_result.warnings) {
        if (!warnings.empty()) {
            warnings += ',';
        }
        warnings += warning;
    }
    warnings.resize(std::min(warnings.size(), WARNINGS_MAX_LEN));

    return Ok{MappedMovie{
        .system = *std::move(system),
        .frame_rate = std::move(frame_rate),
        .frames = parse_result.frames,
        .rerecord_count = parse_result.rerecord_count,
        .movie_extension = parse_result.file_extension,
        .hash = parse_result.hashes.empty() ? string{} : parse_result.hashes.front().second,
        .hash_type = parse_result.hashes.empty() ? string{} : parse_result.hashes.front().first,
        .annotations = cap_and_ellipse(parse_result.annotations, ANNOTATIONS_MAX_LEN),
        .warnings = std::move(warnings),
    }};
}

} // namespace tasv::game_systems
