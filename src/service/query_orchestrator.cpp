#include "service/query_orchestrator.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>
#include <variant>

#include "util/log.hpp"
#include "util/time.hpp"

namespace courserag {
namespace {

constexpr const char* kSystemPrompt = R"PROMPT(You are an assistant specialized in course materials and educational content.

Tool usage:
- Use search_course_content only for questions about specific course content or detailed educational material.
- Use get_course_outline for questions about a course's structure, its link, or its list of lessons.
- One search per query at most. Synthesize the tool results into an accurate, fact-based answer.
- If a search yields no results, say so clearly without offering alternatives.

Answer general knowledge questions from your own knowledge without searching.

Answers must be brief, concise and focused. Provide only the direct answer: no reasoning process, no search explanations, no mention of the tools, and no restating of the question.)PROMPT";

constexpr const char* kPartialAnswerPrefix = "I wasn't able to finish answering this question.";

enum class TurnState { Start, Generate, ExecuteTools, GenerateFinal, Done };

const char* state_name(TurnState state) {
    switch (state) {
    case TurnState::Start:
        return "start";
    case TurnState::Generate:
        return "generate";
    case TurnState::ExecuteTools:
        return "execute_tools";
    case TurnState::GenerateFinal:
        return "generate_final";
    case TurnState::Done:
        return "done";
    }
    return "unknown";
}

// Used when the service keeps asking for tools even with tools disabled.
std::string fallback_answer(const std::vector<SourceAttribution>& sources) {
    std::string answer = kPartialAnswerPrefix;
    if (sources.empty()) {
        return answer;
    }
    answer += " Relevant material:";
    for (const auto& source : sources) {
        answer += "\n- " + source.label();
    }
    return answer;
}

}  // namespace

QueryOrchestrator::QueryOrchestrator(GenerationClient& generation,
                                     const ToolManager& tools,
                                     SessionStore& sessions,
                                     OrchestratorOptions options)
    : generation_(generation), tools_(tools), sessions_(sessions), options_(options) {
    if (options_.max_tool_rounds <= 0) {
        throw std::invalid_argument("max_tool_rounds must be positive");
    }
}

const char* QueryOrchestrator::system_prompt() {
    return kSystemPrompt;
}

QueryResponse QueryOrchestrator::query(const std::string& session_id,
                                       const std::string& query_text,
                                       const CancellationToken* cancel) {
    if (query_text.empty()) {
        throw std::invalid_argument("query text must not be empty");
    }
    const auto started = std::chrono::steady_clock::now();

    QueryResponse response;
    response.session_id = session_id.empty() ? sessions_.create_session() : session_id;

    GenerationRequest request;
    request.system_prompt = kSystemPrompt;
    request.query = query_text;
    request.cancel = cancel;

    ToolTurn turn{tools_};
    ToolRequest pending;
    int rounds = 0;
    TurnState state = TurnState::Start;

    while (state != TurnState::Done) {
        if (cancel != nullptr) {
            cancel->throw_if_cancelled();
        }
        log::debug("query turn session=" + response.session_id + " state=" + state_name(state));

        switch (state) {
        case TurnState::Start:
            request.history = sessions_.history(response.session_id);
            request.tools = tools_.definitions();
            state = TurnState::Generate;
            break;

        case TurnState::Generate: {
            auto result = generation_.generate(request);
            if (auto* answer = std::get_if<DirectAnswer>(&result)) {
                response.answer = std::move(answer->text);
                state = TurnState::Done;
                break;
            }
            pending = std::get<ToolRequest>(std::move(result));
            if (rounds < options_.max_tool_rounds) {
                state = TurnState::ExecuteTools;
                break;
            }
            log::warn("query turn session=" + response.session_id + " tool round limit of " +
                      std::to_string(options_.max_tool_rounds) + " exceeded, answering without tools");
            response.partial = true;
            state = TurnState::GenerateFinal;
            break;
        }

        case TurnState::ExecuteTools: {
            ToolRound round;
            round.calls = std::move(pending.calls);
            round.outputs.reserve(round.calls.size());
            for (const auto& call : round.calls) {
                round.outputs.push_back(turn.execute(call.name, call.arguments));
                if (cancel != nullptr) {
                    cancel->throw_if_cancelled();
                }
            }
            request.tool_rounds.push_back(std::move(round));
            ++rounds;
            state = TurnState::Generate;
            break;
        }

        case TurnState::GenerateFinal: {
            request.tools.clear();
            auto result = generation_.generate(request);
            if (auto* answer = std::get_if<DirectAnswer>(&result)) {
                response.answer = std::move(answer->text);
            } else {
                log::warn("query turn session=" + response.session_id +
                          " generation requested tools with tools disabled");
                response.answer = fallback_answer(turn.collected_sources());
            }
            state = TurnState::Done;
            break;
        }

        case TurnState::Done:
            break;
        }
    }

    if (cancel != nullptr) {
        cancel->throw_if_cancelled();
    }

    response.sources = turn.collected_sources();
    if (!response.partial) {
        sessions_.append(response.session_id, query_text, response.answer);
    }

    log::info("query turn session=" + response.session_id + " rounds=" + std::to_string(rounds) +
              " tool_calls=" + std::to_string(turn.executions()) + " sources=" +
              std::to_string(response.sources.size()) + " partial=" + (response.partial ? "true" : "false") +
              " elapsed_ms=" + std::to_string(time::elapsed_ms(started)));
    return response;
}

}  // namespace courserag
