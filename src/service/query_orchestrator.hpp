#pragma once

#include <string>
#include <vector>

#include "llm/generation_client.hpp"
#include "model/course.hpp"
#include "session/session_store.hpp"
#include "tool/tool_manager.hpp"
#include "util/cancellation.hpp"

namespace courserag {

struct QueryResponse {
    std::string answer;
    std::vector<SourceAttribution> sources;
    std::string session_id;
    // Set when the tool-round bound was hit and the answer is best effort.
    bool partial = false;
};

struct OrchestratorOptions {
    int max_tool_rounds = 2;
};

// Runs one query turn: history, generation, tool rounds, final answer, and
// the history update. Holds no per-turn state, so one instance serves all
// concurrent sessions.
class QueryOrchestrator {
public:
    QueryOrchestrator(GenerationClient& generation,
                      const ToolManager& tools,
                      SessionStore& sessions,
                      OrchestratorOptions options);

    // An empty session_id starts a new session. ServiceUnavailable and
    // TurnCancelled propagate and leave the history untouched.
    QueryResponse query(const std::string& session_id,
                        const std::string& query_text,
                        const CancellationToken* cancel = nullptr);

    static const char* system_prompt();

private:
    GenerationClient& generation_;
    const ToolManager& tools_;
    SessionStore& sessions_;
    OrchestratorOptions options_;
};

}  // namespace courserag
