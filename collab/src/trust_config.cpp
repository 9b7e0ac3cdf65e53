#include <collab/trust_config.hpp>
#include <collab/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>

namespace collab {

using json = nlohmann::json;

namespace {

std::string to_slashes(std::string_view s) {
    std::string out(s);
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

bool glob_match(std::string_view p, std::string_view s) {
    while (!p.empty()) {
        if (p.size() >= 2 && p[0] == '*' && p[1] == '*') {
            size_t stars = p.find_first_not_of('*');
            p = stars == std::string_view::npos ? std::string_view() : p.substr(stars);
            if (p.empty()) return true;
            // "**/" also matches zero directories
            if (p[0] == '/' && glob_match(p.substr(1), s)) return true;
            for (size_t k = 0; k <= s.size(); ++k) {
                if (glob_match(p, s.substr(k))) return true;
            }
            return false;
        }
        if (p[0] == '*') {
            p.remove_prefix(1);
            for (size_t k = 0; k <= s.size(); ++k) {
                if (glob_match(p, s.substr(k))) return true;
                if (k < s.size() && s[k] == '/') break;
            }
            return false;
        }
        if (s.empty()) return false;
        if (p[0] != '?' && p[0] != s[0]) return false;
        p.remove_prefix(1);
        s.remove_prefix(1);
    }
    return s.empty();
}

bool read_trust(const json& j, const char* key, TrustLevel& out, std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    auto level = parse_trust_level(j[key].get<std::string>());
    if (!level) {
        error = "unknown trust level '" + j[key].get<std::string>() + "'";
        return false;
    }
    out = *level;
    return true;
}

} // namespace

bool matches_pattern(std::string_view path, std::string_view pattern) {
    return glob_match(to_slashes(pattern), to_slashes(path));
}

TrustConfig default_trust_config() {
    TrustConfig config;
    config.default_trust = TrustLevel::Supervised;
    config.policies = {
        {"**/generated/**", TrustLevel::Autonomous, "", "Auto-generated code, can be regenerated"},
        {"**/test/**", TrustLevel::Autonomous, "", "Test files can be freely modified"},
        {"**/*.test.*", TrustLevel::Autonomous, "", "Test files can be freely modified"},
        {"**/security/**", TrustLevel::ReadOnly, "", "Security-critical code requires human modification"},
    };
    return config;
}

bool load_trust_config(const std::string& path, TrustConfig& config, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        config = TrustConfig{};
        log_debug("trust", "%s not found, using SUPERVISED default", path.c_str());
        return true;
    }

    TrustConfig loaded;
    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            error = path + ": expected a JSON object";
            return false;
        }
        if (!read_trust(j, "default_trust", loaded.default_trust, error)) {
            error = path + ": " + error;
            return false;
        }

        for (const auto& p : j.value("policies", json::array())) {
            TrustPolicy policy;
            policy.pattern = p.at("pattern").get<std::string>();
            if (!read_trust(p, "trust", policy.trust, error)) {
                error = path + ": policy '" + policy.pattern + "': " + error;
                return false;
            }
            policy.owner = p.value("owner", "");
            policy.reason = p.value("reason", "");
            loaded.policies.push_back(std::move(policy));
        }

        for (const auto& r : j.value("regions", json::array())) {
            RegionOverride region;
            region.file = r.at("file").get<std::string>();
            region.line_start = r.at("line_start").get<size_t>();
            region.line_end = r.value("line_end", region.line_start);
            if (!read_trust(r, "trust", region.trust, error)) {
                error = path + ": region '" + region.file + "': " + error;
                return false;
            }
            region.reason = r.value("reason", "");
            loaded.regions.push_back(std::move(region));
        }
    } catch (const json::exception& e) {
        error = path + ": " + e.what();
        return false;
    }

    config = std::move(loaded);
    log_debug("trust", "loaded %s: %zu policies, %zu regions", path.c_str(),
              config.policies.size(), config.regions.size());
    return true;
}

bool save_trust_config(const std::string& path, const TrustConfig& config, std::string& error) {
    json j;
    j["default_trust"] = trust_level_str(config.default_trust);
    j["policies"] = json::array();
    for (const auto& p : config.policies) {
        json entry = {{"pattern", p.pattern}, {"trust", trust_level_str(p.trust)}};
        if (!p.owner.empty()) entry["owner"] = p.owner;
        if (!p.reason.empty()) entry["reason"] = p.reason;
        j["policies"].push_back(entry);
    }
    j["regions"] = json::array();
    for (const auto& r : config.regions) {
        json entry = {{"file", r.file},
                      {"line_start", r.line_start},
                      {"line_end", r.line_end},
                      {"trust", trust_level_str(r.trust)}};
        if (!r.reason.empty()) entry["reason"] = r.reason;
        j["regions"].push_back(entry);
    }

    std::ofstream out(path);
    if (!out) {
        error = "cannot write " + path;
        return false;
    }
    out << j.dump(2) << "\n";
    return true;
}

const char* trust_guidance(TrustLevel level) {
    switch (level) {
        case TrustLevel::Autonomous:
            return "You may edit this region freely.";
        case TrustLevel::SuggestOnly:
            return "Propose the change instead of editing directly.";
        case TrustLevel::ReadOnly:
            return "Do not modify this region. Explain why changes are needed and ask a human to make them.";
        case TrustLevel::Supervised:
            return "Proceed with caution. Consider proposing significant changes for review.";
    }
    return "";
}

TrustResult check_trust(const TrustConfig& config, const std::string& file_path,
                        const RegionIndex* index, std::optional<LineRange> lines) {
    const std::string path = to_slashes(file_path);
    TrustResult result;

    if (lines && lines->last < lines->first) std::swap(lines->first, lines->last);

    // 1. Inline annotation: the deepest region with a usable trust tag
    if (lines && index) {
        std::optional<size_t> best;
        for (size_t i : index->touching(lines->first, lines->last)) {
            EffectiveAttributes attrs(index->region(i), i);
            if (!attrs.trust()) continue;
            if (!best || index->region(i).depth > index->region(*best).depth) best = i;
        }
        if (best) {
            EffectiveAttributes attrs(index->region(*best), *best);
            result.level = *attrs.trust();
            result.source = TrustSource::Annotation;
            result.reason = "Inline @collab annotation";
            result.owner = attrs.owner();
            result.intent = attrs.intent();
            result.constraints = attrs.constraints();
            result.scope = attrs.scope();
            return result;
        }
    }

    // 2. Line-range override
    if (lines) {
        for (const auto& region : config.regions) {
            std::string file = to_slashes(region.file);
            bool same_file = path == file ||
                             (path.size() >= file.size() &&
                              path.compare(path.size() - file.size(), file.size(), file) == 0);
            if (!same_file) continue;
            if (lines->first <= region.line_end && lines->last >= region.line_start) {
                result.level = region.trust;
                result.source = TrustSource::Region;
                result.reason = region.reason;
                return result;
            }
        }
    }

    // 3. Pattern policies
    for (const auto& policy : config.policies) {
        if (matches_pattern(path, policy.pattern)) {
            result.level = policy.trust;
            result.source = TrustSource::Policy;
            result.reason = policy.reason;
            if (!policy.owner.empty()) result.owner = policy.owner;
            return result;
        }
    }

    // 4. Default
    result.level = config.default_trust;
    result.source = TrustSource::Default;
    result.reason = "Default trust level";
    return result;
}

} // namespace collab
