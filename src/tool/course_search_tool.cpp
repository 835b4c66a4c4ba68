#include "tool/course_search_tool.hpp"

namespace courserag {

CourseSearchTool::CourseSearchTool(SearchService& search_service) : search_service_(search_service) {}

ToolDefinition CourseSearchTool::definition() const {
    return ToolDefinition{
        .name = kName,
        .description = "Search course materials with smart course name matching and lesson filtering",
        .parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "query": {
                    "type": "string",
                    "description": "What to search for in the course content"
                },
                "course_name": {
                    "type": "string",
                    "description": "Course title (partial matches work, e.g. 'MCP', 'Introduction')"
                },
                "lesson_number": {
                    "type": "integer",
                    "description": "Specific lesson number to search within (e.g. 1, 2, 3)"
                }
            },
            "required": ["query"]
        })JSON"),
    };
}

ToolOutput CourseSearchTool::execute(const nlohmann::json& arguments) const {
    SearchRequest request;
    request.query = tool_args::require_string(arguments, "query", kName);
    request.course_name = tool_args::optional_string(arguments, "course_name", kName);
    request.lesson_number = tool_args::optional_int(arguments, "lesson_number", kName);

    const auto response = search_service_.search(request);

    ToolOutput output;
    output.content = format_search_response(request, response);
    for (const auto& hit : response.hits) {
        output.sources.push_back(hit.source);
    }
    return output;
}

}  // namespace courserag
