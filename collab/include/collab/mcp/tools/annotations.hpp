#pragma once
// MCP Annotation Tools: collab_scan_annotations, collab_check_trust,
// collab_query_position
//
// Trust lookups an assistant makes before touching code.

#include "../types.hpp"
#include "../../serialize.hpp"
#include "../../workspace.hpp"
#include <sstream>
#include <unordered_map>

namespace collab::mcp::tools::annotations {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "collab_scan_annotations",
        "List the @collab regions of a file with their effective attributes "
        "(trust, owner, intent, constraints) and any annotation diagnostics.",
        {
            {"type", "object"},
            {"properties", {
                {"file_path", {{"type", "string"}, {"description", "Path to the file"}}},
                {"language", {{"type", "string"},
                              {"description", "Language tag (optional, default: from extension)"}}}
            }},
            {"required", {"file_path"}}
        }
    });

    tools.push_back({
        "collab_check_trust",
        "Check the trust level before modifying code. Returns AUTONOMOUS (edit freely), "
        "SUGGEST_ONLY (propose instead), READ_ONLY (do not modify) or SUPERVISED "
        "(proceed with caution). Inline @collab annotations are consulted when lines are given.",
        {
            {"type", "object"},
            {"properties", {
                {"file_path", {{"type", "string"}, {"description", "Path to the file to check"}}},
                {"line_start", {{"type", "integer"}, {"minimum", 1},
                                {"description", "Start line of region to modify (optional)"}}},
                {"line_end", {{"type", "integer"}, {"minimum", 1},
                              {"description", "End line of region to modify (optional)"}}}
            }},
            {"required", {"file_path"}}
        }
    });

    tools.push_back({
        "collab_query_position",
        "Effective @collab attributes at one source position, or not_covered.",
        {
            {"type", "object"},
            {"properties", {
                {"file_path", {{"type", "string"}, {"description", "Path to the file"}}},
                {"line", {{"type", "integer"}, {"minimum", 1}}},
                {"column", {{"type", "integer"}, {"minimum", 1}, {"default", 1}}}
            }},
            {"required", {"file_path", "line"}}
        }
    });
}

// 1-based line or column; false with a message when present but invalid
inline bool read_position_param(const json& params, const char* key, size_t& out,
                                std::string& error) {
    const auto& v = params.at(key);
    if (!v.is_number_integer() || v.get<long long>() < 1) {
        error = std::string("'") + key + "' must be a positive integer";
        return false;
    }
    out = v.get<size_t>();
    return true;
}

inline ToolResult scan_annotations(Workspace* ws, const json& params) {
    std::string err = validate_required(params, {"file_path"});
    if (!err.empty()) return ToolResult::error(err);

    std::string path = params.at("file_path");
    std::string language = params.value("language", "");

    std::string error;
    auto entry = ws->scan_file(path, language, error);
    if (!entry) return ToolResult::error(error);

    json data = to_json(entry->result);

    std::ostringstream ss;
    ss << path << " [" << entry->result.language << "]: "
       << entry->result.regions.size() << " region(s), "
       << entry->result.diagnostics.size() << " diagnostic(s)\n";
    for (const auto& r : entry->result.regions) {
        ss << std::string(r.depth * 2, ' ') << "lines " << r.scope.start.line << "-"
           << r.scope.end.line << " " << to_json(r.effective).dump() << "\n";
    }
    for (const auto& d : entry->result.diagnostics) {
        ss << d.to_string() << "\n";
    }
    return ToolResult::ok(ss.str(), data);
}

inline ToolResult check_trust(Workspace* ws, const json& params) {
    std::string err = validate_required(params, {"file_path"});
    if (!err.empty()) return ToolResult::error(err);

    std::string path = params.at("file_path");
    std::optional<LineRange> lines;
    if (params.contains("line_start")) {
        LineRange range;
        if (!read_position_param(params, "line_start", range.first, err)) return ToolResult::error(err);
        range.last = range.first;
        if (params.contains("line_end") &&
            !read_position_param(params, "line_end", range.last, err)) {
            return ToolResult::error(err);
        }
        lines = range;
    }

    std::string error;
    TrustResult trust = ws->check(path, lines, error);
    json data = to_json(trust, path);
    if (!error.empty()) {
        log_debug("mcp", "check_trust %s: %s", path.c_str(), error.c_str());
        data["annotation_error"] = error;
    }
    return ToolResult::ok(data.dump(2), data);
}

inline ToolResult query_position(Workspace* ws, const json& params) {
    std::string err = validate_required(params, {"file_path", "line"});
    if (!err.empty()) return ToolResult::error(err);

    std::string path = params.at("file_path");
    size_t line = 0, column = 1;
    if (!read_position_param(params, "line", line, err)) return ToolResult::error(err);
    if (params.contains("column") && !read_position_param(params, "column", column, err)) {
        return ToolResult::error(err);
    }

    std::string error;
    auto entry = ws->scan_file(path, "", error);
    if (!entry) return ToolResult::error(error);

    auto attrs = entry->index.query(line, column);
    if (!attrs) {
        json data = {{"covered", false}, {"status", "not_covered"}};
        return ToolResult::ok(path + ":" + std::to_string(line) + ":" + std::to_string(column) +
                              " is not covered by any @collab region", data);
    }
    json data = to_json(*attrs);
    return ToolResult::ok(data.dump(2), data);
}

inline void register_handlers(Workspace* ws,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["collab_scan_annotations"] = [ws](const json& p) { return scan_annotations(ws, p); };
    handlers["collab_check_trust"] = [ws](const json& p) { return check_trust(ws, p); };
    handlers["collab_query_position"] = [ws](const json& p) { return query_position(ws, p); };
}

} // namespace collab::mcp::tools::annotations
