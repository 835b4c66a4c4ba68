#pragma once

#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/course.hpp"
#include "util/cancellation.hpp"

namespace courserag {

// JSON-schema described function the generation service may call.
struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json parameters;
};

struct ToolCall {
    std::string id;
    std::string name;
    // Parsed arguments. Holds the raw string when the service sent
    // arguments that are not valid JSON.
    nlohmann::json arguments;
};

struct DirectAnswer {
    std::string text;
};

struct ToolRequest {
    std::vector<ToolCall> calls;
    // Text the service emitted alongside the calls, if any.
    std::string text;
};

using GenerationResult = std::variant<DirectAnswer, ToolRequest>;

// One executed tool round: the calls as requested and one output per call.
struct ToolRound {
    std::vector<ToolCall> calls;
    std::vector<std::string> outputs;
};

struct GenerationRequest {
    std::string system_prompt;
    std::vector<Exchange> history;
    std::string query;
    // Empty disables tool use for this call.
    std::vector<ToolDefinition> tools;
    std::vector<ToolRound> tool_rounds;
    const CancellationToken* cancel = nullptr;
};

// The generative answering capability: given the conversation so far it
// either answers or asks for tools to be run.
class GenerationClient {
public:
    virtual ~GenerationClient() = default;

    virtual GenerationResult generate(const GenerationRequest& request) = 0;
};

}  // namespace courserag
