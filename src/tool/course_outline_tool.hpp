#pragma once

#include "index/course_index.hpp"
#include "service/course_name_resolver.hpp"
#include "tool/tool.hpp"

namespace courserag {

// Course title, link, instructor and the numbered lesson list of one course.
class CourseOutlineTool final : public Tool {
public:
    static constexpr const char* kName = "get_course_outline";

    CourseOutlineTool(CourseIndex& index, const CourseNameResolver& resolver);

    ToolDefinition definition() const override;
    ToolOutput execute(const nlohmann::json& arguments) const override;

private:
    CourseIndex& index_;
    const CourseNameResolver& resolver_;
};

}  // namespace courserag
