#include "qdrant/qdrant_client.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>

namespace {

using nlohmann::json;

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

void ScenarioConjunctionShape() {
    courserag::tests::Log("scenario: payload filter maps onto qdrant must clauses");
    courserag::PayloadFilter filter;
    filter.where("course_title", "Intro to MCP").where("lesson_number", 2);

    const auto expected = json::parse(R"({"must":[
        {"key":"course_title","match":{"value":"Intro to MCP"}},
        {"key":"lesson_number","match":{"value":2}}
    ]})");
    Require(courserag::to_qdrant_filter(filter) == expected, "unexpected qdrant filter shape");
}

void ScenarioEmptyFilter() {
    courserag::tests::Log("scenario: empty filter has no conditions");
    const auto rendered = courserag::to_qdrant_filter(courserag::PayloadFilter{});
    Require(rendered.at("must").is_array() && rendered.at("must").empty(), "empty must array expected");
}

void ScenarioLocalSemanticsAgree() {
    courserag::tests::Log("scenario: local matching uses the same exact-value semantics");
    courserag::PayloadFilter filter;
    filter.where("course_title", "Intro to MCP").where("lesson_number", 2);

    Require(filter.matches(json{{"course_title", "Intro to MCP"}, {"lesson_number", 2}, {"chunk_index", 0}}),
            "all conditions satisfied");
    Require(!filter.matches(json{{"course_title", "Intro to MCP"}, {"lesson_number", 3}}), "lesson mismatch");
    Require(!filter.matches(json{{"course_title", "Intro to MCP"}}), "missing key never matches");
    Require(!filter.matches(json{{"course_title", "intro to mcp"}, {"lesson_number", 2}}),
            "match is case sensitive");
    Require(courserag::PayloadFilter{}.matches(json::object()), "empty filter matches everything");
}

}  // namespace

int main() {
    try {
        courserag::tests::Log("qdrant_filter_test: start");
        ScenarioConjunctionShape();
        ScenarioEmptyFilter();
        ScenarioLocalSemanticsAgree();
        courserag::tests::Log("qdrant_filter_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        courserag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
