#include <cmath>
#include <tasv/submissions/queries.hh>
#include <tasv/submissions/title.hh>
#include <tasvlib/concat_tostr.hh>

using std::string;
using std::string_view;

namespace {

string two_digits(uint64_t x) {
    return x < 10 ? concat_tostr('0', x) : concat_tostr(x);
}

string goal_suffix(string_view goal) {
    if (goal.empty()) {
        return {};
    }
    return concat_tostr(" \"", goal, '"');
}

} // namespace

namespace tasv::submissions {

string movie_time(uint32_t frames, std::optional<double> frame_rate) {
    double rate = frame_rate.value_or(DEFAULT_FRAME_RATE);
    if (rate <= 0) {
        rate = DEFAULT_FRAME_RATE;
    }
    auto total_ms = static_cast<uint64_t>(std::llround(frames * 1000.0 / rate));
    auto ms = total_ms % 1000;
    auto total_seconds = total_ms / 1000;
    auto seconds = total_seconds % 60;
    auto minutes = total_seconds / 60 % 60;
    auto hours = total_seconds / 3600;

    string res;
    if (hours > 0) {
        back_insert(res, hours, ':');
    }
    back_insert(res, two_digits(minutes), ':', two_digits(seconds), '.');
    if (ms < 100) {
        res += '0';
    }
    if (ms < 10) {
        res += '0';
    }
    back_insert(res, ms);
    return res;
}

string join_authors(const std::vector<string>& authors) {
    string res;
    for (size_t i = 0; i < authors.size(); ++i) {
        if (i > 0) {
            res += i + 1 == authors.size() ? " & " : ", ";
        }
        res += authors[i];
    }
    return res;
}

std::vector<string>
all_authors(const std::vector<string>& author_usernames, string_view additional_authors) {
    auto res = author_usernames;
    auto normalized = normalize_csv(additional_authors);
    string_view rest = normalized;
    while (!rest.empty()) {
        auto pos = rest.find(", ");
        res.emplace_back(rest.substr(0, pos));
        rest.remove_prefix(pos == string_view::npos ? rest.size() : pos + 2);
    }
    return res;
}

string submission_title(uint64_t submission_id, const TitleParts& parts) {
    return concat_tostr(
        '#',
        submission_id,
        ": ",
        join_authors(parts.authors),
        "'s ",
        parts.system_code,
        ' ',
        parts.game_name,
        goal_suffix(parts.goal),
        " in ",
        movie_time(parts.frames, parts.frame_rate)
    );
}

string publication_title(const TitleParts& parts) {
    return concat_tostr(
        parts.system_code,
        ' ',
        parts.game_name,
        goal_suffix(parts.goal == "baseline" ? string_view{} : string_view{parts.goal}),
        " by ",
        join_authors(parts.authors),
        " in ",
        movie_time(parts.frames, parts.frame_rate)
    );
}

} // namespace tasv::submissions
