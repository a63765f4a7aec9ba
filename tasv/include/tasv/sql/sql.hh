#pragma once

#include <string>
#include <string_view>
#include <tasv/db/value.hh>
#include <utility>
#include <vector>

namespace tasv::sql {

// Final product of every builder: SQL text with '?' placeholders and matching parameters
class SqlWithParams {
    std::string sql;
    std::vector<db::Value> params;

public:
    template <class... Params>
    explicit SqlWithParams(std::string sql_, const Params&... params_)
    : sql{std::move(sql_)}
    , params{db::to_value(params_)...} {
        check_params_count();
    }

    SqlWithParams(std::string sql_, std::vector<db::Value> params_)
    : sql{std::move(sql_)}
    , params{std::move(params_)} {
        check_params_count();
    }

    [[nodiscard]] const std::string& get_sql() const& noexcept { return sql; }

    std::string get_sql() && noexcept { return std::move(sql); }

    [[nodiscard]] const std::vector<db::Value>& get_params() const& noexcept { return params; }

    std::vector<db::Value> get_params() && noexcept { return std::move(params); }

private:
    // Throws if the number of '?' differs from the number of parameters
    void check_params_count() const;
};

class Condition;
class SelectFrom;
class SelectJoin;
class SelectWhere;
class SelectOrderBy;
class SelectLimit;

// Common state of the builders, only moved from stage to stage
struct Parts {
    std::string sql;
    std::vector<db::Value> params;

    template <class... Params>
    void append(std::string_view prefix, std::string_view sql_str, const Params&... params_) {
        sql += prefix;
        sql += sql_str;
        (params.emplace_back(db::to_value(params_)), ...);
    }

    void append(std::string_view prefix, Parts&& other);
};

class Condition {
    Parts parts;

    friend class SelectFrom;
    friend class SelectJoin;
    friend class UpdateSet;
    friend class DeleteFrom;

public:
    template <class... Params>
    explicit Condition(std::string_view sql_str, const Params&... params) {
        parts.append("", sql_str, params...);
    }

    friend Condition operator&&(Condition&& a, Condition&& b);
    friend Condition operator||(Condition&& a, Condition&& b);
};

class Select {
    Parts parts;

public:
    template <class... Params>
    explicit Select(std::string_view sql_str, const Params&... params) {
        parts.append("SELECT ", sql_str, params...);
    }

    SelectFrom from(std::string_view sql_str) &&;
};

class SelectLimit {
    Parts parts;

    friend class SelectFrom;
    friend class SelectWhere;
    friend class SelectOrderBy;

    explicit SelectLimit(Parts&& parts_) noexcept : parts{std::move(parts_)} {}

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    operator SqlWithParams() && { return SqlWithParams{std::move(parts.sql), std::move(parts.params)}; }
};

class SelectOrderBy {
    Parts parts;

    friend class SelectFrom;
    friend class SelectWhere;

    explicit SelectOrderBy(Parts&& parts_) noexcept : parts{std::move(parts_)} {}

public:
    template <class... Params>
    SelectLimit limit(std::string_view sql_str, const Params&... params) && {
        parts.append(" LIMIT ", sql_str, params...);
        return SelectLimit{std::move(parts)};
    }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator SqlWithParams() && { return SqlWithParams{std::move(parts.sql), std::move(parts.params)}; }
};

class SelectWhere {
    Parts parts;

    friend class SelectFrom;
    friend class InsertInto;

    explicit SelectWhere(Parts&& parts_) noexcept : parts{std::move(parts_)} {}

public:
    SelectOrderBy order_by(std::string_view sql_str) && {
        parts.append(" ORDER BY ", sql_str);
        return SelectOrderBy{std::move(parts)};
    }

    template <class... Params>
    SelectLimit limit(std::string_view sql_str, const Params&... params) && {
        parts.append(" LIMIT ", sql_str, params...);
        return SelectLimit{std::move(parts)};
    }

    // Appends " FOR UPDATE" on backends with row locks, SQLite locks the whole database in the
    // write transaction anyway
    SelectWhere for_update(bool supported) && {
        if (supported) {
            parts.sql += " FOR UPDATE";
        }
        return SelectWhere{std::move(parts)};
    }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator SqlWithParams() && { return SqlWithParams{std::move(parts.sql), std::move(parts.params)}; }
};

class SelectFrom {
    Parts parts;

    friend class Select;
    friend class SelectJoin;
    friend class InsertInto;

    explicit SelectFrom(Parts&& parts_) noexcept : parts{std::move(parts_)} {}

public:
    SelectJoin left_join(std::string_view sql_str) &&;
    SelectJoin inner_join(std::string_view sql_str) &&;

    template <class... Params>
    SelectWhere where(std::string_view sql_str, const Params&... params) && {
        parts.append(" WHERE ", sql_str, params...);
        return SelectWhere{std::move(parts)};
    }

    SelectWhere where(Condition&& condition) && {
        parts.append(" WHERE ", std::move(condition.parts));
        return SelectWhere{std::move(parts)};
    }

    SelectOrderBy order_by(std::string_view sql_str) && {
        parts.append(" ORDER BY ", sql_str);
        return SelectOrderBy{std::move(parts)};
    }

    template <class... Params>
    SelectLimit limit(std::string_view sql_str, const Params&... params) && {
        parts.append(" LIMIT ", sql_str, params...);
        return SelectLimit{std::move(parts)};
    }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator SqlWithParams() && { return SqlWithParams{std::move(parts.sql), std::move(parts.params)}; }
};

class SelectJoin {
    Parts parts;

    friend class SelectFrom;

    explicit SelectJoin(Parts&& parts_) noexcept : parts{std::move(parts_)} {}

public:
    template <class... Params>
    SelectFrom on(std::string_view sql_str, const Params&... params) && {
        parts.append(" ON ", sql_str, params...);
        return SelectFrom{std::move(parts)};
    }
};

inline SelectFrom Select::from(std::string_view sql_str) && {
    parts.append(" FROM ", sql_str);
    return SelectFrom{std::move(parts)};
}

inline SelectJoin SelectFrom::left_join(std::string_view sql_str) && {
    parts.append(" LEFT JOIN ", sql_str);
    return SelectJoin{std::move(parts)};
}

inline SelectJoin SelectFrom::inner_join(std::string_view sql_str) && {
    parts.append(" INNER JOIN ", sql_str);
    return SelectJoin{std::move(parts)};
}

class InsertValues {
    Parts parts;

    friend class InsertInto;

    explicit InsertValues(Parts&& parts_) noexcept : parts{std::move(parts_)} {}

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    operator SqlWithParams() && { return SqlWithParams{std::move(parts.sql), std::move(parts.params)}; }
};

class InsertInto {
    Parts parts;

public:
    explicit InsertInto(std::string_view sql_str) { parts.append("INSERT INTO ", sql_str); }

    template <class... Params>
    InsertValues values(std::string_view sql_str, const Params&... params) && {
        parts.append(" VALUES(", sql_str, params...);
        parts.sql += ')';
        return InsertValues{std::move(parts)};
    }

    // INSERT INTO ... SELECT ... [WHERE ...]
    InsertValues select(SelectWhere&& select) &&;
    InsertValues select(SelectFrom&& select) &&;
};

class UpdateWhere {
    Parts parts;

    friend class UpdateSet;

    explicit UpdateWhere(Parts&& parts_) noexcept : parts{std::move(parts_)} {}

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    operator SqlWithParams() && { return SqlWithParams{std::move(parts.sql), std::move(parts.params)}; }
};

class UpdateSet {
    Parts parts;

    friend class Update;

    explicit UpdateSet(Parts&& parts_) noexcept : parts{std::move(parts_)} {}

public:
    template <class... Params>
    UpdateWhere where(std::string_view sql_str, const Params&... params) && {
        parts.append(" WHERE ", sql_str, params...);
        return UpdateWhere{std::move(parts)};
    }

    UpdateWhere where(Condition&& condition) && {
        parts.append(" WHERE ", std::move(condition.parts));
        return UpdateWhere{std::move(parts)};
    }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator SqlWithParams() && { return SqlWithParams{std::move(parts.sql), std::move(parts.params)}; }
};

class Update {
    Parts parts;

public:
    explicit Update(std::string_view sql_str) { parts.append("UPDATE ", sql_str); }

    template <class... Params>
    UpdateSet set(std::string_view sql_str, const Params&... params) && {
        parts.append(" SET ", sql_str, params...);
        return UpdateSet{std::move(parts)};
    }
};

class DeleteWhere {
    Parts parts;

    friend class DeleteFrom;

    explicit DeleteWhere(Parts&& parts_) noexcept : parts{std::move(parts_)} {}

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    operator SqlWithParams() && { return SqlWithParams{std::move(parts.sql), std::move(parts.params)}; }
};

class DeleteFrom {
    Parts parts;

public:
    explicit DeleteFrom(std::string_view sql_str) { parts.append("DELETE FROM ", sql_str); }

    template <class... Params>
    DeleteWhere where(std::string_view sql_str, const Params&... params) && {
        parts.append(" WHERE ", sql_str, params...);
        return DeleteWhere{std::move(parts)};
    }

    DeleteWhere where(Condition&& condition) && {
        parts.append(" WHERE ", std::move(condition.parts));
        return DeleteWhere{std::move(parts)};
    }
};

} // namespace tasv::sql
