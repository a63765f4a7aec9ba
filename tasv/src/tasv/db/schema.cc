#include <string_view>
#include <tasv/db/schema.hh>
#include <tasvlib/macros/stack_unwinding.hh>

using std::string;
using std::string_view;

namespace {

struct Table {
    string_view name;
    string_view columns; // uses $PK$, $BLOB$, $TEXT$ placeholders
};

// NOLINTNEXTLINE(cert-err58-cpp)
constexpr Table tables[] = {
    {"users",
     "id $PK$,"
     "username VARCHAR(64) NOT NULL UNIQUE,"
     "created_at DATETIME NOT NULL"},
    {"game_systems",
     "id $PK$,"
     "code VARCHAR(16) NOT NULL UNIQUE,"
     "display_name VARCHAR(64) NOT NULL"},
    {"game_system_frame_rates",
     "id $PK$,"
     "system_id BIGINT UNSIGNED NOT NULL REFERENCES game_systems(id),"
     "frame_rate DOUBLE NOT NULL,"
     "region VARCHAR(8) NOT NULL,"
     "is_default TINYINT NOT NULL DEFAULT 0,"
     "UNIQUE (system_id, frame_rate, region)"},
    {"games",
     "id $PK$,"
     "display_name VARCHAR(255) NOT NULL"},
    {"game_versions",
     "id $PK$,"
     "game_id BIGINT UNSIGNED NOT NULL REFERENCES games(id),"
     "system_id BIGINT UNSIGNED NOT NULL REFERENCES game_systems(id),"
     "name VARCHAR(255) NOT NULL,"
     "region VARCHAR(8) NOT NULL"},
    {"game_goals",
     "id $PK$,"
     "game_id BIGINT UNSIGNED NOT NULL REFERENCES games(id),"
     "display_name VARCHAR(255) NOT NULL"},
    {"publication_classes",
     "id $PK$,"
     "name VARCHAR(32) NOT NULL UNIQUE,"
     "icon_path VARCHAR(255) NOT NULL DEFAULT ''"},
    {"submission_rejection_reasons",
     "id $PK$,"
     "display_name VARCHAR(255) NOT NULL"},
    {"deprecated_movie_formats",
     "id $PK$,"
     "file_extension VARCHAR(16) NOT NULL UNIQUE,"
     "deprecated TINYINT NOT NULL"},
    {"flags",
     "id $PK$,"
     "token VARCHAR(32) NOT NULL UNIQUE,"
     "name VARCHAR(64) NOT NULL"},
    {"tags",
     "id $PK$,"
     "code VARCHAR(32) NOT NULL UNIQUE,"
     "display_name VARCHAR(64) NOT NULL"},
    {"forum_topics",
     "id $PK$,"
     "forum_id BIGINT UNSIGNED NOT NULL DEFAULT 0,"
     "title VARCHAR(512) NOT NULL,"
     "submission_id BIGINT UNSIGNED NULL,"
     "poster_id BIGINT UNSIGNED NULL REFERENCES users(id),"
     "created_at DATETIME NOT NULL"},
    {"forum_posts",
     "id $PK$,"
     "topic_id BIGINT UNSIGNED NOT NULL REFERENCES forum_topics(id),"
     "forum_id BIGINT UNSIGNED NOT NULL DEFAULT 0,"
     "poster_id BIGINT UNSIGNED NULL REFERENCES users(id),"
     "text $TEXT$ NOT NULL,"
     "created_at DATETIME NOT NULL"},
    {"forum_topic_watches",
     "topic_id BIGINT UNSIGNED NOT NULL REFERENCES forum_topics(id),"
     "user_id BIGINT UNSIGNED NOT NULL REFERENCES users(id),"
     "PRIMARY KEY (topic_id, user_id)"},
    {"submissions",
     "id $PK$,"
     "version BIGINT UNSIGNED NOT NULL DEFAULT 0,"
     "status TINYINT UNSIGNED NOT NULL,"
     "created_at DATETIME NOT NULL,"
     "updated_at DATETIME NOT NULL,"
     "submitter_id BIGINT UNSIGNED NOT NULL REFERENCES users(id),"
     "judge_id BIGINT UNSIGNED NULL REFERENCES users(id),"
     "publisher_id BIGINT UNSIGNED NULL REFERENCES users(id),"
     "intended_class_id BIGINT UNSIGNED NULL REFERENCES publication_classes(id),"
     "rejection_reason_id BIGINT UNSIGNED NULL REFERENCES submission_rejection_reasons(id),"
     "topic_id BIGINT UNSIGNED NULL REFERENCES forum_topics(id),"
     "game_id BIGINT UNSIGNED NULL REFERENCES games(id),"
     "game_version_id BIGINT UNSIGNED NULL REFERENCES game_versions(id),"
     "game_goal_id BIGINT UNSIGNED NULL REFERENCES game_goals(id),"
     "system_id BIGINT UNSIGNED NULL REFERENCES game_systems(id),"
     "system_frame_rate_id BIGINT UNSIGNED NULL REFERENCES game_system_frame_rates(id),"
     "game_name VARCHAR(255) NOT NULL,"
     "game_version VARCHAR(255) NOT NULL DEFAULT '',"
     "branch VARCHAR(255) NOT NULL DEFAULT '',"
     "rom_name VARCHAR(255) NOT NULL DEFAULT '',"
     "emulator_version VARCHAR(255) NOT NULL DEFAULT '',"
     "encode_embed_link VARCHAR(512) NOT NULL DEFAULT '',"
     "additional_authors VARCHAR(255) NOT NULL DEFAULT '',"
     "frames INT UNSIGNED NOT NULL,"
     "rerecord_count INT UNSIGNED NOT NULL,"
     "movie_extension VARCHAR(16) NOT NULL,"
     "movie_file $BLOB$ NOT NULL,"
     "hash VARCHAR(128) NOT NULL DEFAULT '',"
     "hash_type VARCHAR(16) NOT NULL DEFAULT '',"
     "annotations $TEXT$ NOT NULL,"
     "warnings VARCHAR(500) NOT NULL DEFAULT '',"
     "title VARCHAR(512) NOT NULL DEFAULT ''"},
    {"submission_authors",
     "submission_id BIGINT UNSIGNED NOT NULL REFERENCES submissions(id),"
     "user_id BIGINT UNSIGNED NOT NULL REFERENCES users(id),"
     "ordinal INT UNSIGNED NOT NULL,"
     "PRIMARY KEY (submission_id, user_id)"},
    {"submission_status_history",
     "id $PK$,"
     "submission_id BIGINT UNSIGNED NOT NULL REFERENCES submissions(id),"
     "previous_status TINYINT UNSIGNED NOT NULL,"
     "status TINYINT UNSIGNED NOT NULL,"
     "actor_id BIGINT UNSIGNED NULL REFERENCES users(id),"
     "created_at DATETIME NOT NULL"},
    {"publications",
     "id $PK$,"
     "created_at DATETIME NOT NULL,"
     "submission_id BIGINT UNSIGNED NOT NULL UNIQUE REFERENCES submissions(id),"
     "publication_class_id BIGINT UNSIGNED NOT NULL REFERENCES publication_classes(id),"
     "system_id BIGINT UNSIGNED NOT NULL REFERENCES game_systems(id),"
     "system_frame_rate_id BIGINT UNSIGNED NOT NULL REFERENCES game_system_frame_rates(id),"
     "game_id BIGINT UNSIGNED NOT NULL REFERENCES games(id),"
     "game_version_id BIGINT UNSIGNED NOT NULL REFERENCES game_versions(id),"
     "game_goal_id BIGINT UNSIGNED NOT NULL REFERENCES game_goals(id),"
     "emulator_version VARCHAR(255) NOT NULL DEFAULT '',"
     "frames INT UNSIGNED NOT NULL,"
     "rerecord_count INT UNSIGNED NOT NULL,"
     "movie_file_name VARCHAR(255) NOT NULL UNIQUE,"
     "additional_authors VARCHAR(255) NOT NULL DEFAULT '',"
     "title VARCHAR(512) NOT NULL DEFAULT '',"
     "obsoleted_by_id BIGINT UNSIGNED NULL REFERENCES publications(id)"},
    {"movie_files",
     "id $PK$,"
     "publication_id BIGINT UNSIGNED NOT NULL REFERENCES publications(id),"
     "file_name VARCHAR(255) NOT NULL,"
     "contents $BLOB$ NOT NULL,"
     "created_at DATETIME NOT NULL"},
    {"publication_authors",
     "publication_id BIGINT UNSIGNED NOT NULL REFERENCES publications(id),"
     "user_id BIGINT UNSIGNED NOT NULL REFERENCES users(id),"
     "ordinal INT UNSIGNED NOT NULL,"
     "PRIMARY KEY (publication_id, user_id)"},
    {"publication_urls",
     "id $PK$,"
     "publication_id BIGINT UNSIGNED NOT NULL REFERENCES publications(id),"
     "url VARCHAR(512) NOT NULL,"
     "display_name VARCHAR(255) NULL,"
     "type TINYINT UNSIGNED NOT NULL"},
    {"publication_flags",
     "publication_id BIGINT UNSIGNED NOT NULL REFERENCES publications(id),"
     "flag_id BIGINT UNSIGNED NOT NULL REFERENCES flags(id),"
     "PRIMARY KEY (publication_id, flag_id)"},
    {"publication_tags",
     "publication_id BIGINT UNSIGNED NOT NULL REFERENCES publications(id),"
     "tag_id BIGINT UNSIGNED NOT NULL REFERENCES tags(id),"
     "PRIMARY KEY (publication_id, tag_id)"},
    {"wiki_pages",
     "id $PK$,"
     "page_name VARCHAR(255) NOT NULL,"
     "revision INT UNSIGNED NOT NULL,"
     "markup $TEXT$ NOT NULL,"
     "author_id BIGINT UNSIGNED NULL REFERENCES users(id),"
     "revision_message VARCHAR(1000) NOT NULL DEFAULT '',"
     "minor_edit TINYINT NOT NULL DEFAULT 0,"
     "created_at DATETIME NOT NULL,"
     "UNIQUE (page_name, revision)"},
    {"roles",
     "id $PK$,"
     "name VARCHAR(64) NOT NULL UNIQUE,"
     "auto_assign_publications TINYINT NOT NULL DEFAULT 0"},
    {"user_roles",
     "user_id BIGINT UNSIGNED NOT NULL REFERENCES users(id),"
     "role_id BIGINT UNSIGNED NOT NULL REFERENCES roles(id),"
     "PRIMARY KEY (user_id, role_id)"},
    {"jobs",
     "id $PK$,"
     "created_at DATETIME NOT NULL,"
     "type TINYINT UNSIGNED NOT NULL,"
     "status TINYINT UNSIGNED NOT NULL,"
     "priority INT NOT NULL,"
     "aux_id BIGINT UNSIGNED NULL,"
     "aux_id_2 BIGINT UNSIGNED NULL,"
     "info $TEXT$ NOT NULL,"
     "log $TEXT$ NOT NULL"},
};

// NOLINTNEXTLINE(cert-err58-cpp)
constexpr string_view indexes[] = {
    "CREATE INDEX submissions_status ON submissions (status, id)",
    "CREATE INDEX submission_status_history_submission ON submission_status_history "
    "(submission_id, id)",
    "CREATE INDEX publications_game ON publications (game_id, id)",
    "CREATE INDEX publications_obsoleted_by ON publications (obsoleted_by_id)",
    "CREATE INDEX publication_urls_publication ON publication_urls (publication_id, id)",
    "CREATE INDEX forum_posts_topic ON forum_posts (topic_id, id)",
    "CREATE INDEX jobs_status_priority ON jobs (status, priority, id)",
};

string substitute(string_view columns, tasv::db::Dialect dialect) {
    bool mysql = dialect == tasv::db::Dialect::MYSQL;
    string res;
    while (!columns.empty()) {
        auto beg = columns.find('$');
        if (beg == string_view::npos) {
            res += columns;
            break;
        }
        auto end = columns.find('$', beg + 1);
        res += columns.substr(0, beg);
        auto placeholder = columns.substr(beg + 1, end - beg - 1);
        if (placeholder == "PK") {
            res += mysql ? "BIGINT UNSIGNED NOT NULL AUTO_INCREMENT PRIMARY KEY"
                         : "INTEGER PRIMARY KEY AUTOINCREMENT";
        } else if (placeholder == "BLOB") {
            res += mysql ? "LONGBLOB" : "BLOB";
        } else if (placeholder == "TEXT") {
            res += mysql ? "MEDIUMTEXT" : "TEXT";
        }
        columns.remove_prefix(end + 1);
    }
    return res;
}

} // namespace

namespace tasv::db {

std::vector<string> schema_statements(Dialect dialect) {
    std::vector<string> res;
    for (const auto& table : tables) {
        res.emplace_back(concat_tostr(
            "CREATE TABLE ",
            table.name,
            " (",
            substitute(table.columns, dialect),
            ")",
            dialect == Dialect::MYSQL ? " ENGINE=InnoDB DEFAULT CHARSET=utf8mb4" : ""
        ));
    }
    for (auto index : indexes) {
        res.emplace_back(index);
    }
    return res;
}

void create_schema(Connection& conn) {
    STACK_UNWINDING_MARK;
    for (const auto& stmt : schema_statements(conn.dialect())) {
        conn.update(stmt);
    }
}

} // namespace tasv::db
