#pragma once

#include <cstdint>
#include <ctime>
#include <initializer_list>
#include <tasv/submissions/submission.hh>
#include <tasv/users/user.hh>
#include <vector>

namespace tasv::submissions {

class StatusSet {
    uint32_t bits_ = 0;

    static constexpr uint32_t bit(Submission::Status status) noexcept {
        return uint32_t{1} << static_cast<Submission::Status::UnderlyingType>(status);
    }

public:
    constexpr StatusSet() noexcept = default;

    constexpr StatusSet(std::initializer_list<Submission::Status> statuses) noexcept {
        for (auto status : statuses) {
            add(status);
        }
    }

    constexpr StatusSet& add(Submission::Status status) noexcept {
        bits_ |= bit(status);
        return *this;
    }

    constexpr StatusSet& add(StatusSet other) noexcept {
        bits_ |= other.bits_;
        return *this;
    }

    [[nodiscard]] constexpr bool contains(Submission::Status status) const noexcept {
        return bits_ & bit(status);
    }

    [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }

    [[nodiscard]] size_t size() const noexcept { return __builtin_popcount(bits_); }

    // In the order of the Status values
    [[nodiscard]] std::vector<Submission::Status> to_vector() const;

    friend constexpr bool operator==(StatusSet a, StatusSet b) noexcept {
        return a.bits_ == b.bits_;
    }
};

// Facts about a submission and the actor who wants to change its status
struct StatusChangeContext {
    Submission::Status current_status;
    std::vector<users::PermissionTo> permissions;
    time_t submitted_at;
    time_t now;
    uint32_t minimum_hours_before_judgment;
    bool is_author_or_submitter;
    // The actor is the judge that claimed the submission
    bool is_judge;
    // The actor is the publisher that claimed the submission
    bool is_publisher;
};

// The verdict-delivering transitions become available once the judging window is open
[[nodiscard]] bool judging_window_open(
    time_t submitted_at, time_t now, uint32_t minimum_hours_before_judgment
) noexcept;

// Independent rules, the available statuses are the union of what every applicable rule allows
namespace status_rules {

StatusSet current_status(const StatusChangeContext& ctx) noexcept;
StatusSet override_constraints(const StatusChangeContext& ctx) noexcept;
StatusSet judge_unclaims(const StatusChangeContext& ctx) noexcept;
StatusSet judge_claims(const StatusChangeContext& ctx) noexcept;
StatusSet judge_works_in_progress(const StatusChangeContext& ctx) noexcept;
StatusSet judge_delivers_verdict(const StatusChangeContext& ctx) noexcept;
StatusSet publisher_claims(const StatusChangeContext& ctx) noexcept;
StatusSet publisher_unclaims(const StatusChangeContext& ctx) noexcept;
StatusSet cancel(const StatusChangeContext& ctx) noexcept;
StatusSet playground(const StatusChangeContext& ctx) noexcept;

} // namespace status_rules

/**
 * @brief Computes the statuses the submission may be set to by the actor
 *
 * Published submissions can only stay published. Publishing itself is never offered, it is done
 * by the publish operation.
 */
[[nodiscard]] StatusSet available_statuses(const StatusChangeContext& ctx) noexcept;

// Returns the number of hours left before the submission can be judged, 0 once it can be judged
// or is not in a judgeable status anymore
[[nodiscard]] int64_t hours_remaining_for_judging(
    Submission::Status status,
    time_t submitted_at,
    time_t now,
    uint32_t minimum_hours_before_judgment
) noexcept;

// Whether @p actor may edit the submission at all: its submitter, one of its authors or a holder
// of a judge, publish or override permission
[[nodiscard]] bool may_edit_submission(
    const users::Actor& actor,
    decltype(Submission::submitter_id) submitter_id,
    const std::vector<users::User>& authors
) noexcept;

} // namespace tasv::submissions
