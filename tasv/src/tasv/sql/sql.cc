#include <algorithm>
#include <tasv/sql/sql.hh>
#include <tasvlib/macros/throw.hh>

namespace tasv::sql {

void SqlWithParams::check_params_count() const {
    auto placeholders = static_cast<size_t>(std::count(sql.begin(), sql.end(), '?'));
    if (placeholders != params.size()) {
        THROW(
            "SQL has ", placeholders, " placeholders but ", params.size(), " params: ", sql
        );
    }
}

void Parts::append(std::string_view prefix, Parts&& other) {
    sql += prefix;
    sql += other.sql;
    params.insert(
        params.end(),
        std::make_move_iterator(other.params.begin()),
        std::make_move_iterator(other.params.end())
    );
}

Condition operator&&(Condition&& a, Condition&& b) {
    Condition res{"("};
    res.parts.append("", std::move(a.parts));
    res.parts.append(") AND (", std::move(b.parts));
    res.parts.sql += ')';
    return res;
}

Condition operator||(Condition&& a, Condition&& b) {
    Condition res{"("};
    res.parts.append("", std::move(a.parts));
    res.parts.append(") OR (", std::move(b.parts));
    res.parts.sql += ')';
    return res;
}

InsertValues InsertInto::select(SelectWhere&& select) && {
    parts.append(" ", std::move(select.parts));
    return InsertValues{std::move(parts)};
}

InsertValues InsertInto::select(SelectFrom&& select) && {
    parts.append(" ", std::move(select.parts));
    return InsertValues{std::move(parts)};
}

} // namespace tasv::sql
