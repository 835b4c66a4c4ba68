#include "llm/chat_wire.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace courserag::chat_wire {
namespace {

// Arguments arrive as a JSON-encoded string. Anything unparsable is kept as
// the raw string so the tool can reject it.
nlohmann::json decode_arguments(const nlohmann::json& raw) {
    if (raw.is_object()) {
        return raw;
    }
    if (!raw.is_string()) {
        return raw;
    }
    const auto text = raw.get<std::string>();
    if (text.empty()) {
        return nlohmann::json::object();
    }
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return raw;
    }
    return parsed;
}

std::string encode_arguments(const nlohmann::json& arguments) {
    return arguments.is_string() ? arguments.get<std::string>() : arguments.dump();
}

std::string call_id_or_default(const nlohmann::json& item, const char* field, std::size_t index) {
    if (item.contains(field) && item[field].is_string() && !item[field].get<std::string>().empty()) {
        return item[field].get<std::string>();
    }
    return "call_" + std::to_string(index);
}

nlohmann::json input_message(const std::string& role, const std::string& text) {
    const char* type = role == "assistant" ? "output_text" : "input_text";
    return nlohmann::json{{"role", role}, {"content", {{{"type", type}, {"text", text}}}}};
}

}  // namespace

nlohmann::json build_chat_completions_body(const GenerationRequest& request, const std::string& model, int max_tokens) {
    nlohmann::json messages = nlohmann::json::array();
    messages.push_back({{"role", "system"}, {"content", request.system_prompt}});
    for (const auto& exchange : request.history) {
        messages.push_back({{"role", "user"}, {"content", exchange.query}});
        messages.push_back({{"role", "assistant"}, {"content", exchange.answer}});
    }
    messages.push_back({{"role", "user"}, {"content", request.query}});

    for (const auto& round : request.tool_rounds) {
        nlohmann::json tool_calls = nlohmann::json::array();
        for (const auto& call : round.calls) {
            tool_calls.push_back({
                {"id", call.id},
                {"type", "function"},
                {"function", {{"name", call.name}, {"arguments", encode_arguments(call.arguments)}}},
            });
        }
        messages.push_back({{"role", "assistant"}, {"content", nullptr}, {"tool_calls", tool_calls}});
        for (std::size_t i = 0; i < round.calls.size(); ++i) {
            messages.push_back({
                {"role", "tool"},
                {"tool_call_id", round.calls[i].id},
                {"content", i < round.outputs.size() ? round.outputs[i] : std::string{}},
            });
        }
    }

    nlohmann::json body;
    body["model"] = model;
    body["temperature"] = 0.0;
    body["max_tokens"] = max_tokens;
    body["messages"] = messages;
    if (!request.tools.empty()) {
        body["tools"] = nlohmann::json::array();
        for (const auto& tool : request.tools) {
            body["tools"].push_back({
                {"type", "function"},
                {"function", {{"name", tool.name}, {"description", tool.description}, {"parameters", tool.parameters}}},
            });
        }
        body["tool_choice"] = "auto";
    }
    return body;
}

GenerationResult parse_chat_completions_result(const nlohmann::json& json) {
    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
        throw std::runtime_error("chat completions response missing choices");
    }
    const auto& choice = json["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object()) {
        throw std::runtime_error("chat completions response missing message");
    }
    const auto& message = choice["message"];

    std::string text;
    if (message.contains("content")) {
        const auto& content = message["content"];
        if (content.is_string()) {
            text = content.get<std::string>();
        } else if (content.is_array()) {
            for (const auto& part : content) {
                if (part.contains("text") && part["text"].is_string()) {
                    if (!text.empty()) {
                        text.push_back('\n');
                    }
                    text += part["text"].get<std::string>();
                }
            }
        }
    }

    if (message.contains("tool_calls") && message["tool_calls"].is_array() && !message["tool_calls"].empty()) {
        ToolRequest request;
        request.text = std::move(text);
        std::size_t index = 0;
        for (const auto& item : message["tool_calls"]) {
            if (!item.contains("function") || !item["function"].is_object()) {
                throw std::runtime_error("chat completions tool call missing function");
            }
            const auto& function = item["function"];
            ToolCall call;
            call.id = call_id_or_default(item, "id", index++);
            call.name = function.value("name", std::string{});
            call.arguments = decode_arguments(function.value("arguments", nlohmann::json{}));
            request.calls.push_back(std::move(call));
        }
        return request;
    }

    if (!message.contains("content") || message["content"].is_null()) {
        throw std::runtime_error("chat completions message missing content");
    }
    return DirectAnswer{std::move(text)};
}

nlohmann::json build_responses_body(const GenerationRequest& request, int max_tokens) {
    nlohmann::json input = nlohmann::json::array();
    input.push_back(input_message("system", request.system_prompt));
    for (const auto& exchange : request.history) {
        input.push_back(input_message("user", exchange.query));
        input.push_back(input_message("assistant", exchange.answer));
    }
    input.push_back(input_message("user", request.query));

    for (const auto& round : request.tool_rounds) {
        for (std::size_t i = 0; i < round.calls.size(); ++i) {
            const auto& call = round.calls[i];
            input.push_back({
                {"type", "function_call"},
                {"call_id", call.id},
                {"name", call.name},
                {"arguments", encode_arguments(call.arguments)},
            });
            input.push_back({
                {"type", "function_call_output"},
                {"call_id", call.id},
                {"output", i < round.outputs.size() ? round.outputs[i] : std::string{}},
            });
        }
    }

    nlohmann::json body;
    body["input"] = input;
    body["temperature"] = 0.0;
    body["max_output_tokens"] = max_tokens;
    if (!request.tools.empty()) {
        body["tools"] = nlohmann::json::array();
        for (const auto& tool : request.tools) {
            body["tools"].push_back({
                {"type", "function"},
                {"name", tool.name},
                {"description", tool.description},
                {"parameters", tool.parameters},
            });
        }
        body["tool_choice"] = "auto";
    }
    return body;
}

GenerationResult parse_responses_result(const nlohmann::json& json) {
    if (!json.contains("output") || !json["output"].is_array()) {
        throw std::runtime_error("azure chat response missing output array");
    }

    std::string combined;
    std::vector<ToolCall> calls;
    std::size_t index = 0;
    for (const auto& entry : json["output"]) {
        const std::string type = entry.value("type", std::string{});
        if (type == "function_call") {
            ToolCall call;
            call.id = call_id_or_default(entry, "call_id", index++);
            call.name = entry.value("name", std::string{});
            call.arguments = decode_arguments(entry.value("arguments", nlohmann::json{}));
            calls.push_back(std::move(call));
            continue;
        }
        if (!entry.contains("content") || !entry["content"].is_array()) {
            continue;
        }
        for (const auto& block : entry["content"]) {
            const std::string block_type = block.value("type", std::string{});
            if (block_type != "output_text" && block_type != "text") {
                continue;
            }
            if (!block.contains("text") || !block["text"].is_string()) {
                continue;
            }
            if (!combined.empty()) {
                combined.push_back('\n');
            }
            combined += block["text"].get<std::string>();
        }
    }

    if (!calls.empty()) {
        return ToolRequest{std::move(calls), std::move(combined)};
    }
    if (combined.empty()) {
        throw std::runtime_error("azure chat response missing text");
    }
    return DirectAnswer{std::move(combined)};
}

}  // namespace courserag::chat_wire
