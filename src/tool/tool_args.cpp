#include "tool/tool.hpp"

#include <cstdint>
#include <limits>

#include "util/errors.hpp"

namespace courserag::tool_args {
namespace {

[[noreturn]] void invalid(const std::string& tool_name, const std::string& detail) {
    throw OrchestrationError("invalid arguments for " + tool_name + ": " + detail);
}

}  // namespace

const nlohmann::json& require_object(const nlohmann::json& arguments, const std::string& tool_name) {
    if (!arguments.is_object()) {
        invalid(tool_name, "expected a JSON object, got " + arguments.dump());
    }
    return arguments;
}

std::string require_string(const nlohmann::json& arguments, const char* field, const std::string& tool_name) {
    auto value = optional_string(arguments, field, tool_name);
    if (!value || value->empty()) {
        invalid(tool_name, std::string{"missing field: "} + field);
    }
    return *value;
}

std::optional<std::string> optional_string(const nlohmann::json& arguments,
                                           const char* field,
                                           const std::string& tool_name) {
    const auto& object = require_object(arguments, tool_name);
    const auto it = object.find(field);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        invalid(tool_name, std::string{"field not string: "} + field);
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> optional_int(const nlohmann::json& arguments, const char* field, const std::string& tool_name) {
    const auto& object = require_object(arguments, tool_name);
    const auto it = object.find(field);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        const auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            invalid(tool_name, std::string{"field out of range: "} + field);
        }
        return static_cast<int>(value);
    }
    if (it->is_number_integer()) {
        const auto value = it->get<std::int64_t>();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            invalid(tool_name, std::string{"field out of range: "} + field);
        }
        return static_cast<int>(value);
    }
    if (!it->is_string()) {
        invalid(tool_name, std::string{"field not integer: "} + field);
    }
    const auto raw = it->get<std::string>();
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(raw, &consumed);
    } catch (const std::exception&) {
        invalid(tool_name, std::string{"field not integer: "} + field);
    }
    if (consumed != raw.size()) {
        invalid(tool_name, std::string{"field not integer: "} + field);
    }
    return value;
}

}  // namespace courserag::tool_args
