#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <tasvlib/macros/enum_with_string_conversions.hh>
#include <vector>

namespace tasv::users {

struct User {
    uint64_t id;
    std::string username;
    std::string created_at;
};

ENUM_WITH_STRING_CONVERSIONS(PermissionTo, uint8_t,
    (SUBMIT_MOVIES, 1, "submit_movies")
    (JUDGE_SUBMISSIONS, 2, "judge_submissions")
    (PUBLISH_MOVIES, 3, "publish_movies")
    (OVERRIDE_SUBMISSION_CONSTRAINTS, 4, "override_submission_constraints")
);

// The user performing an operation together with the permissions authentication granted them
struct Actor {
    decltype(User::id) id;
    std::string username;
    std::vector<PermissionTo> permissions;

    [[nodiscard]] bool can(PermissionTo perm) const noexcept {
        return std::find(permissions.begin(), permissions.end(), perm) != permissions.end();
    }
};

} // namespace tasv::users
