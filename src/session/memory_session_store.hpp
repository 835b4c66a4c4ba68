#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "session/session_store.hpp"

namespace courserag {

class InMemorySessionStore final : public SessionStore {
public:
    explicit InMemorySessionStore(std::size_t max_exchanges);

    std::string create_session() override;
    void append(const std::string& session_id, const std::string& query, const std::string& answer) override;
    std::vector<Exchange> history(const std::string& session_id) const override;
    void clear(const std::string& session_id) override;
    std::size_t max_exchanges() const noexcept override { return max_exchanges_; }

private:
    struct Session {
        std::mutex mutex;
        std::deque<Exchange> exchanges;
    };

    std::shared_ptr<Session> find(const std::string& session_id) const;
    std::shared_ptr<Session> find_or_create(const std::string& session_id);

    std::size_t max_exchanges_;
    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

}  // namespace courserag
