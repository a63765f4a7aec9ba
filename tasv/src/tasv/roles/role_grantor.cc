#include <cstdint>
#include <string>
#include <tasv/roles/role_grantor.hh>
#include <tasv/sql/sql.hh>
#include <tasvlib/logger.hh>
#include <tasvlib/macros/stack_unwinding.hh>

using tasv::sql::InsertInto;
using tasv::sql::Select;

namespace tasv::roles {

void DbRoleGrantor::assign_auto_assignable_roles_by_publication(
    const std::vector<decltype(users::User::id)>& author_ids, std::string_view publication_title
) {
    STACK_UNWINDING_MARK;
    struct Role {
        uint64_t id;
        std::string name;
    };
    std::vector<Role> auto_roles;
    {
        Role role;
        auto stmt =
            conn.execute(Select("id, name").from("roles").where("auto_assign_publications=1"));
        stmt.res_bind(role.id, role.name);
        while (stmt.next()) {
            auto_roles.emplace_back(role);
        }
    }

    for (auto user_id : author_ids) {
        for (const auto& role : auto_roles) {
            auto stmt = conn.execute(Select("1")
                                         .from("user_roles")
                                         .where("user_id=? AND role_id=?", user_id, role.id));
            if (stmt.next()) {
                continue;
            }
            conn.execute(
                InsertInto("user_roles (user_id, role_id)").values("?, ?", user_id, role.id)
            );
            stdlog(
                "Granted role ",
                role.name,
                " to user ",
                user_id,
                " for publication: ",
                publication_title
            );
        }
    }
}

} // namespace tasv::roles
