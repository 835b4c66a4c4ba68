#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "llm/generation_client.hpp"

namespace courserag::chat_wire {

// Chat Completions API: history as alternating user/assistant messages,
// each executed tool round as an assistant tool_calls message followed by
// one "tool" message per call.
nlohmann::json build_chat_completions_body(const GenerationRequest& request, const std::string& model, int max_tokens);
GenerationResult parse_chat_completions_result(const nlohmann::json& json);

// Responses API: the same conversation as input items, tool rounds as
// function_call / function_call_output pairs.
nlohmann::json build_responses_body(const GenerationRequest& request, int max_tokens);
GenerationResult parse_responses_result(const nlohmann::json& json);

}  // namespace courserag::chat_wire
