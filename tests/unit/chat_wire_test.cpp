#include "llm/chat_wire.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <variant>

namespace {

using nlohmann::json;

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

courserag::GenerationRequest MakeRequest() {
    courserag::GenerationRequest request;
    request.system_prompt = "system";
    request.history = {courserag::Exchange{"earlier question", "earlier answer"}};
    request.query = "What is covered in lesson 2?";
    request.tools = {courserag::ToolDefinition{
        "search_course_content", "Search course material", json{{"type", "object"}}}};
    request.tool_rounds = {courserag::ToolRound{
        {courserag::ToolCall{"call_a", "search_course_content", json{{"query", "servers"}}}},
        {"[Intro to MCP - Lesson 2]\nServers expose resources."}}};
    return request;
}

void ScenarioChatCompletionsBody() {
    courserag::tests::Log("scenario: chat completions body carries history and tool rounds");
    const auto body = courserag::chat_wire::build_chat_completions_body(MakeRequest(), "gpt-test", 800);
    const auto& messages = body.at("messages");
    Require(messages.size() == 6, "system, two history, query, tool_calls, tool output");
    Require(messages[0].at("role") == "system", "system prompt first");
    Require(messages[1].at("role") == "user" && messages[1].at("content") == "earlier question", "history query");
    Require(messages[2].at("role") == "assistant" && messages[2].at("content") == "earlier answer",
            "history answer");
    Require(messages[3].at("content") == "What is covered in lesson 2?", "current query after history");
    Require(messages[4].at("tool_calls")[0].at("function").at("arguments") == "{\"query\":\"servers\"}",
            "arguments sent as encoded string");
    Require(messages[5].at("role") == "tool" && messages[5].at("tool_call_id") == "call_a",
            "tool output linked to call id");
    Require(body.at("tool_choice") == "auto", "tools enabled");
    Require(body.at("max_tokens") == 800, "token budget");
    Require(body.at("temperature") == 0.0, "deterministic sampling");

    auto without_tools = MakeRequest();
    without_tools.tools.clear();
    const auto final_body = courserag::chat_wire::build_chat_completions_body(without_tools, "gpt-test", 800);
    Require(!final_body.contains("tools") && !final_body.contains("tool_choice"), "tools omitted when disabled");
}

void ScenarioChatCompletionsParse() {
    courserag::tests::Log("scenario: chat completions result parsing");
    const auto answer = courserag::chat_wire::parse_chat_completions_result(
        json::parse(R"({"choices":[{"message":{"role":"assistant","content":"Lesson 2 covers servers."}}]})"));
    Require(std::holds_alternative<courserag::DirectAnswer>(answer), "plain content is a direct answer");
    Require(std::get<courserag::DirectAnswer>(answer).text == "Lesson 2 covers servers.", "answer text");

    const auto tools = courserag::chat_wire::parse_chat_completions_result(json::parse(R"({
        "choices":[{"message":{"role":"assistant","content":null,"tool_calls":[
            {"id":"c1","type":"function","function":{"name":"search_course_content","arguments":"{\"query\":\"setup\"}"}},
            {"type":"function","function":{"name":"get_course_outline","arguments":"{not json"}}
        ]}}]})"));
    Require(std::holds_alternative<courserag::ToolRequest>(tools), "tool_calls yield a tool request");
    const auto& calls = std::get<courserag::ToolRequest>(tools).calls;
    Require(calls.size() == 2, "both calls kept");
    Require(calls[0].id == "c1" && calls[0].arguments.at("query") == "setup", "arguments decoded");
    Require(calls[1].id == "call_1", "missing id gets a positional default");
    Require(calls[1].arguments.is_string() && calls[1].arguments == "{not json", "invalid arguments kept raw");

    bool threw = false;
    try {
        courserag::chat_wire::parse_chat_completions_result(json::parse(R"({"choices":[]})"));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    Require(threw, "empty choices must be rejected");
}

void ScenarioResponsesBody() {
    courserag::tests::Log("scenario: responses body carries function call outputs");
    const auto body = courserag::chat_wire::build_responses_body(MakeRequest(), 512);
    const auto& input = body.at("input");
    Require(input.size() == 6, "system, two history, query, call, output");
    Require(input[2].at("content")[0].at("type") == "output_text", "assistant history uses output_text");
    Require(input[3].at("content")[0].at("type") == "input_text", "user query uses input_text");
    Require(input[4].at("type") == "function_call" && input[4].at("call_id") == "call_a", "function call item");
    Require(input[5].at("type") == "function_call_output" && input[5].at("call_id") == "call_a",
            "function output item");
    Require(input[5].at("output") == "[Intro to MCP - Lesson 2]\nServers expose resources.", "output text");
    Require(body.at("tools")[0].at("name") == "search_course_content", "flat tool definition");
    Require(body.at("max_output_tokens") == 512, "token budget");
}

void ScenarioResponsesParse() {
    courserag::tests::Log("scenario: responses result parsing");
    const auto answer = courserag::chat_wire::parse_responses_result(json::parse(R"({"output":[
        {"type":"reasoning","summary":[]},
        {"type":"message","content":[{"type":"output_text","text":"First."},{"type":"text","text":"Second."}]}
    ]})"));
    Require(std::holds_alternative<courserag::DirectAnswer>(answer), "message output is a direct answer");
    Require(std::get<courserag::DirectAnswer>(answer).text == "First.\nSecond.", "both text block kinds joined");

    const auto tools = courserag::chat_wire::parse_responses_result(json::parse(R"({"output":[
        {"type":"function_call","call_id":"fc1","name":"get_course_outline","arguments":"{\"course_name\":\"MCP\"}"}
    ]})"));
    Require(std::holds_alternative<courserag::ToolRequest>(tools), "function_call yields a tool request");
    const auto& call = std::get<courserag::ToolRequest>(tools).calls.at(0);
    Require(call.id == "fc1" && call.arguments.at("course_name") == "MCP", "function call decoded");

    bool threw = false;
    try {
        courserag::chat_wire::parse_responses_result(json::parse(R"({"output":[]})"));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    Require(threw, "output without text or calls must be rejected");
}

}  // namespace

int main() {
    try {
        courserag::tests::Log("chat_wire_test: start");
        ScenarioChatCompletionsBody();
        ScenarioChatCompletionsParse();
        ScenarioResponsesBody();
        ScenarioResponsesParse();
        courserag::tests::Log("chat_wire_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        courserag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
