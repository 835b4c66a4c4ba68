#pragma once

#include <chrono>
#include <string>

#include "app/services.hpp"
#include "config/config.hpp"

namespace courserag {

struct RetryPolicy {
    int max_attempts = 3;
    // Attempt n waits n * backoff before the next one.
    std::chrono::milliseconds backoff{500};
};

// Runs one query request, retrying ServiceUnavailable. An empty session_id
// is replaced by a new session before the first attempt, so every attempt
// continues the same session.
QueryResponse run_query_request(QueryOrchestrator& orchestrator,
                                SessionStore& sessions,
                                std::string session_id,
                                const std::string& query,
                                const RetryPolicy& policy,
                                const std::string& request_id);

// Consumes ingest and query requests until a fatal error. Returns the process
// exit code.
int run_kafka_executor(const Config& config, Services& services);

}  // namespace courserag
