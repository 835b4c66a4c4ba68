#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "tool/tool.hpp"

namespace courserag {

// Registry of the tools offered to the generation service. Read-only after
// start-up, so one instance serves every concurrent turn.
class ToolManager {
public:
    // Throws std::invalid_argument on a duplicate name.
    void register_tool(std::unique_ptr<Tool> tool);

    std::vector<ToolDefinition> definitions() const;
    const Tool* find(const std::string& name) const;

private:
    std::map<std::string, std::unique_ptr<Tool>> tools_;
};

// Tool execution for one query turn. Collects the sources of every execution
// so the caller can attach them to the final answer.
class ToolTurn {
public:
    explicit ToolTurn(const ToolManager& manager);

    // Runs the named tool and returns the text for the generation service.
    // Unknown tools and malformed arguments are logged and reported back as
    // text. ServiceUnavailable and TurnCancelled propagate.
    std::string execute(const std::string& tool_name, const nlohmann::json& arguments);

    // Sources of the most recent execution.
    const std::vector<SourceAttribution>& last_sources() const noexcept { return last_sources_; }
    // Sources of all executions in first-seen order, duplicates removed.
    const std::vector<SourceAttribution>& collected_sources() const noexcept { return collected_sources_; }
    int executions() const noexcept { return executions_; }

private:
    const ToolManager& manager_;
    std::vector<SourceAttribution> last_sources_;
    std::vector<SourceAttribution> collected_sources_;
    int executions_ = 0;
};

}  // namespace courserag
