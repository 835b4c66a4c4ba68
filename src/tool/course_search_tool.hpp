#pragma once

#include "service/search_service.hpp"
#include "tool/tool.hpp"

namespace courserag {

class CourseSearchTool final : public Tool {
public:
    static constexpr const char* kName = "search_course_content";

    explicit CourseSearchTool(SearchService& search_service);

    ToolDefinition definition() const override;
    ToolOutput execute(const nlohmann::json& arguments) const override;

private:
    SearchService& search_service_;
};

}  // namespace courserag
