#include "db/pg_session_store.hpp"

#include <stdexcept>
#include <utility>

#include "util/errors.hpp"
#include "util/log.hpp"
#include "util/uuid.hpp"

namespace courserag {

PostgresSessionStore::PostgresSessionStore(std::string conninfo, std::size_t max_exchanges)
    : conninfo_(std::move(conninfo)), max_exchanges_(max_exchanges) {
    if (max_exchanges_ == 0) {
        throw std::invalid_argument("session history bound must be positive");
    }
    ensure_schema();
}

pqxx::connection& PostgresSessionStore::connection_locked() const {
    if (!connection_ || !connection_->is_open()) {
        connection_ = std::make_unique<pqxx::connection>(conninfo_);
        log::info("postgres session store connected");
    }
    return *connection_;
}

template <typename Fn>
auto PostgresSessionStore::with_connection(const char* action, Fn&& fn) const
    -> decltype(fn(std::declval<pqxx::connection&>())) {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    try {
        return fn(connection_locked());
    } catch (const pqxx::broken_connection& ex) {
        connection_.reset();
        log::warn(std::string{"postgres "} + action + " failed: " + ex.what());
        throw ServiceUnavailable(std::string{"postgres unavailable during "} + action + ": " + ex.what());
    }
}

void PostgresSessionStore::ensure_schema() {
    with_connection("ensure_schema", [](pqxx::connection& connection) {
        pqxx::work txn{connection};
        txn.exec(
            "CREATE TABLE IF NOT EXISTS chat_exchange ("
            "id BIGSERIAL PRIMARY KEY, "
            "session_id TEXT NOT NULL, "
            "query TEXT NOT NULL, "
            "answer TEXT NOT NULL, "
            "created_at TIMESTAMPTZ NOT NULL DEFAULT NOW());");
        txn.exec(
            "CREATE INDEX IF NOT EXISTS chat_exchange_session_idx "
            "ON chat_exchange (session_id, id);");
        txn.commit();
    });
}

std::string PostgresSessionStore::create_session() {
    // Sessions have no row of their own until the first exchange lands.
    return uuid::generate();
}

void PostgresSessionStore::append(const std::string& session_id,
                                  const std::string& query,
                                  const std::string& answer) {
    with_connection("append", [&](pqxx::connection& connection) {
        pqxx::work txn{connection};
        txn.exec_params("SELECT pg_advisory_xact_lock(hashtext($1));", session_id);
        txn.exec_params(
            "INSERT INTO chat_exchange (session_id, query, answer) VALUES ($1, $2, $3);",
            session_id,
            query,
            answer);
        txn.exec_params(
            "DELETE FROM chat_exchange "
            "WHERE session_id = $1 AND id NOT IN ("
            "SELECT id FROM chat_exchange WHERE session_id = $1 ORDER BY id DESC LIMIT $2);",
            session_id,
            static_cast<long long>(max_exchanges_));
        txn.commit();
    });
}

std::vector<Exchange> PostgresSessionStore::history(const std::string& session_id) const {
    return with_connection("history", [&](pqxx::connection& connection) {
        pqxx::read_transaction txn{connection};
        const auto result = txn.exec_params(
            "SELECT query, answer FROM ("
            "SELECT id, query, answer FROM chat_exchange WHERE session_id = $1 "
            "ORDER BY id DESC LIMIT $2) recent "
            "ORDER BY id ASC;",
            session_id,
            static_cast<long long>(max_exchanges_));
        txn.commit();

        std::vector<Exchange> exchanges;
        exchanges.reserve(result.size());
        for (const auto& row : result) {
            exchanges.push_back(Exchange{row[0].c_str(), row[1].c_str()});
        }
        return exchanges;
    });
}

void PostgresSessionStore::clear(const std::string& session_id) {
    with_connection("clear", [&](pqxx::connection& connection) {
        pqxx::work txn{connection};
        txn.exec_params("SELECT pg_advisory_xact_lock(hashtext($1));", session_id);
        txn.exec_params("DELETE FROM chat_exchange WHERE session_id = $1;", session_id);
        txn.commit();
    });
}

}  // namespace courserag
