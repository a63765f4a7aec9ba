#include <algorithm>
#include <tasv/submissions/authorization.hh>

using tasv::users::PermissionTo;
using Status = tasv::submissions::Submission::Status;

namespace {

constexpr Status all_statuses[] = {
    Status::NEW,
    Status::DELAYED,
    Status::NEEDS_MORE_INFO,
    Status::JUDGING_UNDERWAY,
    Status::ACCEPTED,
    Status::PUBLICATION_UNDERWAY,
    Status::PUBLISHED,
    Status::REJECTED,
    Status::CANCELLED,
    Status::PLAYGROUND,
};

bool has(const tasv::submissions::StatusChangeContext& ctx, PermissionTo perm) noexcept {
    return std::find(ctx.permissions.begin(), ctx.permissions.end(), perm) !=
        ctx.permissions.end();
}

bool claiming_judge_after_window(const tasv::submissions::StatusChangeContext& ctx) noexcept {
    return ctx.is_judge &&
        tasv::submissions::judging_window_open(
               ctx.submitted_at, ctx.now, ctx.minimum_hours_before_judgment
        );
}

} // namespace

namespace tasv::submissions {

std::vector<Submission::Status> StatusSet::to_vector() const {
    std::vector<Submission::Status> res;
    for (auto status : all_statuses) {
        if (contains(status)) {
            res.emplace_back(status);
        }
    }
    return res;
}

bool judging_window_open(
    time_t submitted_at, time_t now, uint32_t minimum_hours_before_judgment
) noexcept {
    return now >= submitted_at + static_cast<time_t>(minimum_hours_before_judgment) * 3600;
}

namespace status_rules {

StatusSet current_status(const StatusChangeContext& ctx) noexcept { return {ctx.current_status}; }

StatusSet override_constraints(const StatusChangeContext& ctx) noexcept {
    StatusSet res;
    if (has(ctx, PermissionTo::OVERRIDE_SUBMISSION_CONSTRAINTS)) {
        for (auto status : all_statuses) {
            if (status != Status::PUBLISHED) {
                res.add(status);
            }
        }
    }
    return res;
}

StatusSet judge_unclaims(const StatusChangeContext& ctx) noexcept {
    static constexpr StatusSet from = {
        Status::JUDGING_UNDERWAY,
        Status::REJECTED,
        Status::ACCEPTED,
        Status::PUBLICATION_UNDERWAY,
        Status::DELAYED,
        Status::NEEDS_MORE_INFO,
        Status::CANCELLED,
        Status::PLAYGROUND,
    };
    if (from.contains(ctx.current_status) && claiming_judge_after_window(ctx)) {
        return {Status::NEW};
    }
    return {};
}

StatusSet judge_claims(const StatusChangeContext& ctx) noexcept {
    if (ctx.current_status != Status::PUBLISHED && has(ctx, PermissionTo::JUDGE_SUBMISSIONS) &&
        !ctx.is_author_or_submitter)
    {
        return {Status::JUDGING_UNDERWAY};
    }
    return {};
}

StatusSet judge_works_in_progress(const StatusChangeContext& ctx) noexcept {
    static constexpr StatusSet from = {
        Status::JUDGING_UNDERWAY,
        Status::DELAYED,
        Status::NEEDS_MORE_INFO,
        Status::ACCEPTED,
        Status::PUBLICATION_UNDERWAY,
    };
    if (from.contains(ctx.current_status) && claiming_judge_after_window(ctx)) {
        return {Status::JUDGING_UNDERWAY, Status::DELAYED, Status::NEEDS_MORE_INFO};
    }
    return {};
}

StatusSet judge_delivers_verdict(const StatusChangeContext& ctx) noexcept {
    static constexpr StatusSet full_verdict_from = {
        Status::JUDGING_UNDERWAY,
        Status::DELAYED,
        Status::NEEDS_MORE_INFO,
        Status::PUBLICATION_UNDERWAY,
    };
    if (!claiming_judge_after_window(ctx)) {
        return {};
    }
    if (full_verdict_from.contains(ctx.current_status)) {
        return {Status::ACCEPTED, Status::REJECTED};
    }
    if (ctx.current_status == Status::ACCEPTED) {
        return {Status::REJECTED}; // Overruling the own judgment
    }
    return {};
}

StatusSet publisher_claims(const StatusChangeContext& ctx) noexcept {
    if (ctx.current_status == Status::ACCEPTED && has(ctx, PermissionTo::PUBLISH_MOVIES)) {
        return {Status::PUBLICATION_UNDERWAY};
    }
    return {};
}

StatusSet publisher_unclaims(const StatusChangeContext& ctx) noexcept {
    if (ctx.current_status == Status::PUBLICATION_UNDERWAY && ctx.is_publisher) {
        return {Status::ACCEPTED};
    }
    return {};
}

StatusSet cancel(const StatusChangeContext& ctx) noexcept {
    static constexpr StatusSet from = {
        Status::NEW,
        Status::JUDGING_UNDERWAY,
        Status::DELAYED,
        Status::NEEDS_MORE_INFO,
        Status::ACCEPTED,
        Status::PUBLICATION_UNDERWAY,
    };
    if (from.contains(ctx.current_status) && (ctx.is_judge || ctx.is_author_or_submitter)) {
        return {Status::CANCELLED};
    }
    return {};
}

StatusSet playground(const StatusChangeContext& ctx) noexcept {
    static constexpr StatusSet from = {
        Status::JUDGING_UNDERWAY,
        Status::DELAYED,
        Status::NEEDS_MORE_INFO,
    };
    if (from.contains(ctx.current_status) && claiming_judge_after_window(ctx)) {
        return {Status::PLAYGROUND};
    }
    return {};
}

} // namespace status_rules

StatusSet available_statuses(const StatusChangeContext& ctx) noexcept {
    if (ctx.current_status == Status::PUBLISHED) {
        return {Status::PUBLISHED};
    }

    using Rule = StatusSet (*)(const StatusChangeContext&) noexcept;
    static constexpr Rule rules[] = {
        status_rules::current_status,
        status_rules::override_constraints,
        status_rules::judge_unclaims,
        status_rules::judge_claims,
        status_rules::judge_works_in_progress,
        status_rules::judge_delivers_verdict,
        status_rules::publisher_claims,
        status_rules::publisher_unclaims,
        status_rules::cancel,
        status_rules::playground,
    };
    StatusSet res;
    for (auto rule : rules) {
        res.add(rule(ctx));
    }
    return res;
}

int64_t hours_remaining_for_judging(
    Submission::Status status,
    time_t submitted_at,
    time_t now,
    uint32_t minimum_hours_before_judgment
) noexcept {
    if (!can_be_judged(status)) {
        return 0;
    }
    auto hours_since = static_cast<int64_t>((now - submitted_at) / 3600);
    return std::max<int64_t>(0, int64_t{minimum_hours_before_judgment} - hours_since);
}

bool may_edit_submission(
    const users::Actor& actor,
    decltype(Submission::submitter_id) submitter_id,
    const std::vector<users::User>& authors
) noexcept {
    if (actor.id == submitter_id || actor.can(PermissionTo::JUDGE_SUBMISSIONS) ||
        actor.can(PermissionTo::PUBLISH_MOVIES) ||
        actor.can(PermissionTo::OVERRIDE_SUBMISSION_CONSTRAINTS))
    {
        return true;
    }
    return std::any_of(authors.begin(), authors.end(), [&](const users::User& author) {
        return author.id == actor.id;
    });
}

} // namespace tasv::submissions
