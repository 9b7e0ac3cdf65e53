#pragma once
// Trust configuration and the trust lookup used by the policy layer
//
// .collab/trust.json:
//   {
//     "default_trust": "SUPERVISED",
//     "policies": [{"pattern": "**/security/**", "trust": "READ_ONLY",
//                   "owner": "security-team", "reason": "..."}],
//     "regions":  [{"file": "src/auth.ts", "line_start": 10, "line_end": 40,
//                   "trust": "SUGGEST_ONLY", "reason": "..."}]
//   }
//
// Lookup order: inline annotation > region override > first matching
// policy > default_trust.

#include "region_index.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace collab {

struct TrustPolicy {
    std::string pattern;  // glob: ** any path, * within one segment, ? one char
    TrustLevel trust = TrustLevel::Supervised;
    std::string owner;
    std::string reason;
};

struct RegionOverride {
    std::string file;  // matched as a path suffix
    size_t line_start = 1;
    size_t line_end = 1;
    TrustLevel trust = TrustLevel::Supervised;
    std::string reason;
};

struct TrustConfig {
    TrustLevel default_trust = TrustLevel::Supervised;
    std::vector<TrustPolicy> policies;  // first match wins
    std::vector<RegionOverride> regions;
};

// Starter policies written by `collab init`
TrustConfig default_trust_config();

// Missing file yields an empty config with SUPERVISED default and succeeds
bool load_trust_config(const std::string& path, TrustConfig& config, std::string& error);
bool save_trust_config(const std::string& path, const TrustConfig& config, std::string& error);

bool matches_pattern(std::string_view path, std::string_view pattern);

enum class TrustSource : uint8_t { Annotation, Region, Policy, Default };

inline const char* trust_source_str(TrustSource source) {
    switch (source) {
        case TrustSource::Annotation: return "annotation";
        case TrustSource::Region: return "region";
        case TrustSource::Policy: return "policy";
        case TrustSource::Default: return "default";
    }
    return "default";
}

struct TrustResult {
    TrustLevel level = TrustLevel::Supervised;
    TrustSource source = TrustSource::Default;
    std::string reason;
    std::optional<std::string> owner;
    std::optional<std::string> intent;
    std::vector<std::string> constraints;
    std::optional<Scope> scope;  // annotated region, for Annotation results
};

// What an assistant should do at each level
const char* trust_guidance(TrustLevel level);

struct LineRange {
    size_t first = 1;
    size_t last = 1;
};

// Annotations are consulted only when lines are given and index is set
TrustResult check_trust(const TrustConfig& config, const std::string& file_path,
                        const RegionIndex* index, std::optional<LineRange> lines);

} // namespace collab
