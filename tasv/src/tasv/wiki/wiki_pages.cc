#include <tasv/sql/sql.hh>
#include <tasv/wiki/wiki_pages.hh>
#include <tasvlib/concat_tostr.hh>
#include <tasvlib/macros/stack_unwinding.hh>
#include <tasvlib/macros/throw.hh>
#include <tasvlib/time.hh>

using tasv::sql::InsertInto;
using tasv::sql::Select;

namespace tasv::wiki {

std::string submission_page_name(uint64_t submission_id) {
    return concat_tostr("InternalSystem/SubmissionContent/S", submission_id);
}

std::string publication_page_name(uint64_t publication_id) {
    return concat_tostr("InternalSystem/PublicationContent/M", publication_id);
}

WikiPage DbWikiPages::add(const WikiCreateRequest& request) {
    STACK_UNWINDING_MARK;
    if (request.page_name.empty()) {
        THROW("Cannot add a wiki revision without a page name");
    }

    std::optional<decltype(WikiPage::revision)> last_revision;
    {
        auto stmt = conn.execute(
            Select("MAX(revision)").from("wiki_pages").where("page_name=?", request.page_name)
        );
        stmt.res_bind(last_revision);
        if (!stmt.next()) {
            THROW("MAX() returned no rows");
        }
    }

    WikiPage page = {
        .id = 0,
        .page_name = request.page_name,
        .revision = last_revision.value_or(0) + 1,
        .markup = request.markup,
        .author_id = request.author_id,
        .revision_message = request.revision_message,
        .minor_edit = request.minor_edit,
        .created_at = utc_mysql_datetime(),
    };
    page.id = conn.execute(InsertInto("wiki_pages (page_name, revision, markup, author_id, "
                                      "revision_message, minor_edit, created_at)")
                               .values(
                                   "?, ?, ?, ?, ?, ?, ?",
                                   page.page_name,
                                   page.revision,
                                   page.markup,
                                   page.author_id,
                                   page.revision_message,
                                   page.minor_edit,
                                   page.created_at
                               ))
                      .insert_id();
    return page;
}

std::optional<WikiPage> DbWikiPages::page(std::string_view page_name) {
    STACK_UNWINDING_MARK;
    WikiPage page;
    auto stmt = conn.execute(Select("id, page_name, revision, markup, author_id, revision_message, "
                                    "minor_edit, created_at")
                                 .from("wiki_pages")
                                 .where("page_name=?", page_name)
                                 .order_by("revision DESC")
                                 .limit("1"));
    stmt.res_bind(
        page.id,
        page.page_name,
        page.revision,
        page.markup,
        page.author_id,
        page.revision_message,
        page.minor_edit,
        page.created_at
    );
    if (!stmt.next()) {
        return std::nullopt;
    }
    return page;
}

} // namespace tasv::wiki
