#include "session/memory_session_store.hpp"

#include <stdexcept>

#include "util/uuid.hpp"

namespace courserag {

InMemorySessionStore::InMemorySessionStore(std::size_t max_exchanges)
    : max_exchanges_(max_exchanges) {
    if (max_exchanges_ == 0) {
        throw std::invalid_argument("session history bound must be positive");
    }
}

std::string InMemorySessionStore::create_session() {
    auto id = uuid::generate();
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    while (sessions_.count(id) != 0) {
        id = uuid::generate();
    }
    sessions_.emplace(id, std::make_shared<Session>());
    return id;
}

std::shared_ptr<InMemorySessionStore::Session> InMemorySessionStore::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    const auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<InMemorySessionStore::Session> InMemorySessionStore::find_or_create(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto& slot = sessions_[session_id];
    if (!slot) {
        slot = std::make_shared<Session>();
    }
    return slot;
}

void InMemorySessionStore::append(const std::string& session_id, const std::string& query, const std::string& answer) {
    auto session = find_or_create(session_id);
    std::lock_guard<std::mutex> lock(session->mutex);
    session->exchanges.push_back(Exchange{query, answer});
    while (session->exchanges.size() > max_exchanges_) {
        session->exchanges.pop_front();
    }
}

std::vector<Exchange> InMemorySessionStore::history(const std::string& session_id) const {
    auto session = find(session_id);
    if (!session) {
        return {};
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    return {session->exchanges.begin(), session->exchanges.end()};
}

void InMemorySessionStore::clear(const std::string& session_id) {
    auto session = find(session_id);
    if (!session) {
        return;
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    session->exchanges.clear();
}

}  // namespace courserag
