#include "tool/tool_manager.hpp"

#include <algorithm>
#include <stdexcept>

#include "util/errors.hpp"
#include "util/log.hpp"

namespace courserag {

void ToolManager::register_tool(std::unique_ptr<Tool> tool) {
    if (!tool) {
        throw std::invalid_argument("tool must not be null");
    }
    auto name = tool->definition().name;
    if (name.empty()) {
        throw std::invalid_argument("tool name must not be empty");
    }
    const auto [it, inserted] = tools_.emplace(name, std::move(tool));
    if (!inserted) {
        throw std::invalid_argument("tool already registered: " + name);
    }
}

std::vector<ToolDefinition> ToolManager::definitions() const {
    std::vector<ToolDefinition> out;
    out.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        out.push_back(tool->definition());
    }
    return out;
}

const Tool* ToolManager::find(const std::string& name) const {
    const auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : it->second.get();
}

ToolTurn::ToolTurn(const ToolManager& manager) : manager_(manager) {}

std::string ToolTurn::execute(const std::string& tool_name, const nlohmann::json& arguments) {
    ++executions_;
    last_sources_.clear();

    const Tool* tool = manager_.find(tool_name);
    if (tool == nullptr) {
        log::warn("tool call rejected: unknown tool '" + tool_name + "'");
        return "Tool '" + tool_name + "' not found";
    }

    ToolOutput output;
    try {
        output = tool->execute(arguments);
    } catch (const OrchestrationError& ex) {
        log::warn(std::string{"tool call rejected: "} + ex.what());
        return std::string{"Error: "} + ex.what();
    } catch (const std::invalid_argument& ex) {
        log::warn("tool call rejected: " + tool_name + ": " + ex.what());
        return std::string{"Error: "} + ex.what();
    }

    last_sources_ = output.sources;
    for (const auto& source : output.sources) {
        if (std::find(collected_sources_.begin(), collected_sources_.end(), source) == collected_sources_.end()) {
            collected_sources_.push_back(source);
        }
    }
    return output.content;
}

}  // namespace courserag
