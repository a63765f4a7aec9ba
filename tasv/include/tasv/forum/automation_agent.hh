#pragma once

#include <cstdint>
#include <string_view>
#include <tasv/db/connection.hh>

namespace tasv::forum {

// Posts made by the site itself rather than by a user
class AutomationAgent {
public:
    AutomationAgent() = default;
    AutomationAgent(const AutomationAgent&) = delete;
    AutomationAgent(AutomationAgent&&) = delete;
    AutomationAgent& operator=(const AutomationAgent&) = delete;
    AutomationAgent& operator=(AutomationAgent&&) = delete;
    virtual ~AutomationAgent() = default;

    // Creates the discussion topic of the submission, returns its id
    virtual uint64_t post_submission_topic(uint64_t submission_id, std::string_view title) = 0;

    virtual void post_submission_published(uint64_t submission_id, uint64_t publication_id) = 0;

    // Posts the rejection (or cancellation) notice of the submission and moves its topic to the
    // grue food forum
    virtual void reject_and_move(uint64_t submission_id) = 0;
};

class DbAutomationAgent final : public AutomationAgent {
    db::Connection& conn;

public:
    explicit DbAutomationAgent(db::Connection& conn_) noexcept : conn{conn_} {}

    uint64_t post_submission_topic(uint64_t submission_id, std::string_view title) override;

    void post_submission_published(uint64_t submission_id, uint64_t publication_id) override;

    void reject_and_move(uint64_t submission_id) override;
};

void set_topic_title(db::Connection& conn, uint64_t topic_id, std::string_view title);

// Moves the topic together with all of its posts
void move_topic(db::Connection& conn, uint64_t topic_id, uint64_t forum_id);

} // namespace tasv::forum
