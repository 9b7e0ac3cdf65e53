#pragma once
// MCP Handler: JSON-RPC dispatch for the collab tools

#include "protocol.hpp"
#include "types.hpp"
#include "tools/annotations.hpp"
#include "../version.hpp"
#include "../workspace.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace collab::mcp {

using json = nlohmann::json;

class Handler {
public:
    explicit Handler(Workspace* workspace) : workspace_(workspace) {
        register_all_tools();
    }

    // Process one request line; nullopt for notifications
    std::optional<std::string> handle(const std::string& request_str) {
        try {
            auto request = json::parse(request_str);
            auto response = handle_request(request);
            if (!response) return std::nullopt;
            return response->dump(-1, ' ', false, json::error_handler_t::replace);
        } catch (const json::parse_error& e) {
            return make_error(json(), error::PARSE_ERROR,
                              std::string("JSON parse error: ") + e.what()).dump();
        } catch (const std::exception& e) {
            return make_error(json(), error::INTERNAL_ERROR,
                              std::string("Internal error: ") + e.what()).dump();
        }
    }

    const std::vector<ToolSchema>& tools() const { return tools_; }
    bool shutdown_requested() const { return shutdown_; }

private:
    Workspace* workspace_;
    std::vector<ToolSchema> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;
    bool shutdown_ = false;

    void register_all_tools() {
        tools::annotations::register_schemas(tools_);
        tools::annotations::register_handlers(workspace_, handlers_);
    }

    // ═══════════════════════════════════════════════════════════════════
    // JSON-RPC dispatch
    // ═══════════════════════════════════════════════════════════════════

    std::optional<json> handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);

        if (info.is_notification) {
            log_debug("mcp", "notification %s", info.method.c_str());
            return std::nullopt;
        }

        if (info.method == "initialize") {
            return handle_initialize(info.id);
        } else if (info.method == "tools/list") {
            return handle_tools_list(info.id);
        } else if (info.method == "tools/call") {
            return handle_tools_call(info.params, info.id);
        } else if (info.method == "ping") {
            return make_result(info.id, json::object());
        } else if (info.method == "shutdown") {
            shutdown_ = true;
            return make_result(info.id, {{"status", "ok"}});
        }
        return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
    }

    json handle_initialize(const json& id) {
        return make_result(id, {
            {"protocolVersion", COLLAB_MCP_PROTOCOL_VERSION},
            {"serverInfo", {
                {"name", "collab"},
                {"version", COLLAB_VERSION}
            }},
            {"capabilities", {{"tools", json::object()}}}
        });
    }

    json handle_tools_list(const json& id) {
        json tools_array = json::array();
        for (const auto& tool : tools_) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return make_error(id, error::INVALID_PARAMS, "Missing tool name");
        }

        std::string name = params["name"];
        json arguments = params.value("arguments", json::object());
        if (!arguments.is_object()) {
            return make_error(id, error::INVALID_PARAMS, "Tool arguments must be an object");
        }

        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return make_error(id, error::TOOL_NOT_FOUND, "Unknown tool: " + name);
        }

        try {
            ToolResult result = it->second(arguments);
            return make_result(id, make_tool_response(result.content, result.is_error, result.structured));
        } catch (const std::exception& e) {
            return make_error(id, error::TOOL_EXECUTION_ERROR,
                              std::string("Tool execution failed: ") + e.what());
        }
    }
};

} // namespace collab::mcp
