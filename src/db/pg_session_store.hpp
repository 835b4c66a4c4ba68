#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <pqxx/pqxx>

#include "session/session_store.hpp"

namespace courserag
{

    // Session history kept in the chat_exchange table. Appends and trimming
    // run in one transaction under a per-session advisory lock, so several
    // workers can share a database.
    //
    // A lost or refused connection surfaces as ServiceUnavailable; the next
    // call reconnects.
    class PostgresSessionStore final : public SessionStore
    {
    public:
        PostgresSessionStore(std::string conninfo, std::size_t max_exchanges);

        std::string create_session() override;
        void append(const std::string &session_id, const std::string &query, const std::string &answer) override;
        std::vector<Exchange> history(const std::string &session_id) const override;
        void clear(const std::string &session_id) override;
        std::size_t max_exchanges() const noexcept override { return max_exchanges_; }

    private:
        // Runs fn(connection) under the connection mutex, translating
        // pqxx::broken_connection into ServiceUnavailable.
        template <typename Fn>
        auto with_connection(const char *action, Fn &&fn) const -> decltype(fn(std::declval<pqxx::connection &>()));

        pqxx::connection &connection_locked() const;
        void ensure_schema();

        std::string conninfo_;
        std::size_t max_exchanges_;
        mutable std::mutex connection_mutex_;
        mutable std::unique_ptr<pqxx::connection> connection_;
    };

} // namespace courserag
