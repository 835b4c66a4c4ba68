#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "llm/generation_client.hpp"
#include "model/course.hpp"

namespace courserag {

struct ToolOutput {
    std::string content;
    std::vector<SourceAttribution> sources;
};

// A capability exposed to the generation service. Implementations are shared
// by concurrent turns and keep no per-call state.
class Tool {
public:
    virtual ~Tool() = default;

    virtual ToolDefinition definition() const = 0;
    // Throws OrchestrationError on malformed arguments.
    virtual ToolOutput execute(const nlohmann::json& arguments) const = 0;
};

// Argument helpers shared by tool implementations. All throw
// OrchestrationError naming the tool and the offending field.
namespace tool_args {

const nlohmann::json& require_object(const nlohmann::json& arguments, const std::string& tool_name);
std::string require_string(const nlohmann::json& arguments, const char* field, const std::string& tool_name);
std::optional<std::string> optional_string(const nlohmann::json& arguments,
                                           const char* field,
                                           const std::string& tool_name);
// Accepts a JSON integer or a string holding one.
std::optional<int> optional_int(const nlohmann::json& arguments, const char* field, const std::string& tool_name);

}  // namespace tool_args

}  // namespace courserag
