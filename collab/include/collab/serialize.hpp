#pragma once
// JSON views of engine results (MCP responses, `collab scan --json`)
//
// Attribute maps are ordered, so the same scan always dumps to the same
// bytes.

#include "region_index.hpp"
#include "scanner.hpp"
#include "trust_config.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>

namespace collab {

using json = nlohmann::json;

inline json to_json(const Position& p) {
    return {{"line", p.line}, {"column", p.column}};
}

inline json to_json(const Span& s) {
    return {{"start", to_json(s.start)}, {"end", to_json(s.end)}};
}

inline json to_json(const AttributeValue& v) {
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    return std::get<std::vector<std::string>>(v);
}

inline json to_json(const Attributes& attrs) {
    json out = json::object();
    for (const auto& [key, value] : attrs) {
        out[key] = to_json(value);
    }
    return out;
}

inline json to_json(const Diagnostic& d) {
    json out = {
        {"kind", diagnostic_kind_str(d.kind)},
        {"message", d.message},
        {"position", to_json(d.position)}
    };
    if (d.related) out["related"] = to_json(*d.related);
    if (!d.text.empty()) out["text"] = d.text;
    return out;
}

inline json to_json(const Directive& d) {
    json out = {
        {"ordinal", d.ordinal},
        {"form", directive_form_str(d.form)},
        {"attributes", to_json(d.attributes)},
        {"source", to_json(d.source)},
        {"anchor", to_json(d.anchor)}
    };
    if (d.partner) out["partner"] = *d.partner;
    return out;
}

inline json to_json(const ResolvedRegion& r) {
    json provenance = json::array();
    for (const auto& ref : r.provenance) {
        provenance.push_back({
            {"ordinal", ref.ordinal},
            {"form", directive_form_str(ref.form)},
            {"at", to_json(ref.at)}
        });
    }
    json out = {
        {"scope", to_json(r.scope)},
        {"kind", scope_kind_str(r.kind)},
        {"form", directive_form_str(r.form)},
        {"depth", r.depth},
        {"attributes", to_json(r.attributes)},
        {"effective", to_json(r.effective)},
        {"provenance", provenance}
    };
    out["parent"] = r.parent ? json(*r.parent) : json();
    return out;
}

inline json to_json(const ScanResult& result, bool with_directives = false) {
    json regions = json::array();
    for (const auto& r : result.regions) regions.push_back(to_json(r));
    json diagnostics = json::array();
    for (const auto& d : result.diagnostics) diagnostics.push_back(to_json(d));

    json out = {
        {"file", result.file_path},
        {"language", result.language},
        {"regions", regions},
        {"diagnostics", diagnostics}
    };
    if (with_directives) {
        json directives = json::array();
        for (const auto& d : result.directives) directives.push_back(to_json(d));
        out["directives"] = directives;
    }
    return out;
}

inline json to_json(const EffectiveAttributes& attrs) {
    json out = {
        {"covered", true},
        {"region", attrs.region()},
        {"scope", to_json(attrs.scope())},
        {"attributes", to_json(attrs.values())}
    };
    auto trust = attrs.trust();
    out["trust"] = trust ? json(trust_level_str(*trust)) : json();
    return out;
}

inline json to_json(const TrustResult& t, const std::string& file_path) {
    json out = {
        {"file", file_path},
        {"trust_level", trust_level_str(t.level)},
        {"source", trust_source_str(t.source)},
        {"reason", t.reason},
        {"guidance", trust_guidance(t.level)}
    };
    if (t.owner) out["owner"] = *t.owner;
    if (t.intent) out["intent"] = *t.intent;
    if (!t.constraints.empty()) out["constraints"] = t.constraints;
    if (t.scope) out["scope"] = to_json(*t.scope);
    return out;
}

} // namespace collab
