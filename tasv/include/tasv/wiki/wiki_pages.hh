#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tasv/db/connection.hh>
#include <tasv/users/user.hh>

namespace tasv::wiki {

struct WikiPage {
    uint64_t id;
    std::string page_name;
    uint32_t revision;
    std::string markup;
    std::optional<decltype(users::User::id)> author_id;
    std::string revision_message;
    bool minor_edit;
    std::string created_at;
};

struct WikiCreateRequest {
    std::string page_name;
    std::string markup;
    std::optional<decltype(users::User::id)> author_id;
    std::string revision_message;
    bool minor_edit = false;
};

std::string submission_page_name(uint64_t submission_id);

std::string publication_page_name(uint64_t publication_id);

class WikiPages {
public:
    WikiPages() = default;
    WikiPages(const WikiPages&) = delete;
    WikiPages(WikiPages&&) = delete;
    WikiPages& operator=(const WikiPages&) = delete;
    WikiPages& operator=(WikiPages&&) = delete;
    virtual ~WikiPages() = default;

    // Adds a new revision of the page, throws on failure
    virtual WikiPage add(const WikiCreateRequest& request) = 0;

    // Returns the newest revision of the page
    virtual std::optional<WikiPage> page(std::string_view page_name) = 0;
};

// Stores revisions in the wiki_pages table, using the connection of the caller so that the revision
// is part of the caller's transaction
class DbWikiPages final : public WikiPages {
    db::Connection& conn;

public:
    explicit DbWikiPages(db::Connection& conn_) noexcept : conn{conn_} {}

    WikiPage add(const WikiCreateRequest& request) override;

    std::optional<WikiPage> page(std::string_view page_name) override;
};

} // namespace tasv::wiki
