#pragma once

#include <string_view>
#include <tasv/db/connection.hh>
#include <tasv/users/user.hh>
#include <vector>

namespace tasv::roles {

class RoleGrantor {
public:
    RoleGrantor() = default;
    RoleGrantor(const RoleGrantor&) = delete;
    RoleGrantor(RoleGrantor&&) = delete;
    RoleGrantor& operator=(const RoleGrantor&) = delete;
    RoleGrantor& operator=(RoleGrantor&&) = delete;
    virtual ~RoleGrantor() = default;

    // Grants the roles assigned automatically to publication authors to those who lack them
    virtual void assign_auto_assignable_roles_by_publication(
        const std::vector<decltype(users::User::id)>& author_ids, std::string_view publication_title
    ) = 0;
};

class DbRoleGrantor final : public RoleGrantor {
    db::Connection& conn;

public:
    explicit DbRoleGrantor(db::Connection& conn_) noexcept : conn{conn_} {}

    void assign_auto_assignable_roles_by_publication(
        const std::vector<decltype(users::User::id)>& author_ids, std::string_view publication_title
    ) override;
};

} // namespace tasv::roles
