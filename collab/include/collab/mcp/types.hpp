#pragma once
// MCP Types: tool schema and result types

#include <nlohmann/json.hpp>
#include <functional>
#include <initializer_list>
#include <string>

namespace collab::mcp {

using json = nlohmann::json;

struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

struct ToolResult {
    bool is_error = false;
    std::string content;  // text shown to the assistant
    json structured;

    static ToolResult ok(const std::string& text, const json& data = json()) {
        return {false, text, data};
    }

    static ToolResult error(const std::string& message) {
        return {true, message, json()};
    }
};

using ToolHandler = std::function<ToolResult(const json&)>;

// Empty string if every required parameter is present
inline std::string validate_required(const json& params, std::initializer_list<const char*> required) {
    for (const char* key : required) {
        if (!params.contains(key)) {
            return std::string("Missing required parameter: ") + key;
        }
    }
    return "";
}

} // namespace collab::mcp
