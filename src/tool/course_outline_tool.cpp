#include "tool/course_outline_tool.hpp"

#include <sstream>

namespace courserag {

CourseOutlineTool::CourseOutlineTool(CourseIndex& index, const CourseNameResolver& resolver)
    : index_(index), resolver_(resolver) {}

ToolDefinition CourseOutlineTool::definition() const {
    return ToolDefinition{
        .name = kName,
        .description = "Get a course outline: title, link, instructor and the complete lesson list",
        .parameters = nlohmann::json::parse(R"JSON({
            "type": "object",
            "properties": {
                "course_name": {
                    "type": "string",
                    "description": "Course title (partial matches work)"
                }
            },
            "required": ["course_name"]
        })JSON"),
    };
}

ToolOutput CourseOutlineTool::execute(const nlohmann::json& arguments) const {
    const std::string course_name = tool_args::require_string(arguments, "course_name", kName);

    ToolOutput output;
    const auto resolved = resolver_.resolve(course_name);
    if (!resolved) {
        output.content = "No course found matching '" + course_name + "'.";
        return output;
    }
    const auto course = index_.find_course(resolved->title);
    if (!course) {
        output.content = "No course found matching '" + course_name + "'.";
        return output;
    }

    std::ostringstream oss;
    oss << "Course: " << course->title << '\n';
    if (course->link) {
        oss << "Link: " << *course->link << '\n';
    }
    if (course->instructor) {
        oss << "Instructor: " << *course->instructor << '\n';
    }
    oss << "Lessons (" << course->lessons.size() << "):";
    for (const auto& lesson : course->lessons) {
        oss << "\n  Lesson " << lesson.number << ": " << lesson.title;
    }
    output.content = oss.str();
    output.sources.push_back(SourceAttribution{course->title, std::nullopt, course->link});
    return output;
}

}  // namespace courserag
