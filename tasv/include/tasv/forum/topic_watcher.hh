#pragma once

#include <cstdint>
#include <tasv/db/connection.hh>
#include <tasv/users/user.hh>

namespace tasv::forum {

class TopicWatcher {
public:
    TopicWatcher() = default;
    TopicWatcher(const TopicWatcher&) = delete;
    TopicWatcher(TopicWatcher&&) = delete;
    TopicWatcher& operator=(const TopicWatcher&) = delete;
    TopicWatcher& operator=(TopicWatcher&&) = delete;
    virtual ~TopicWatcher() = default;

    virtual void
    watch_topic(uint64_t topic_id, decltype(users::User::id) user_id, bool enabled) = 0;
};

class DbTopicWatcher final : public TopicWatcher {
    db::Connection& conn;

public:
    explicit DbTopicWatcher(db::Connection& conn_) noexcept : conn{conn_} {}

    void watch_topic(uint64_t topic_id, decltype(users::User::id) user_id, bool enabled) override;
};

} // namespace tasv::forum
