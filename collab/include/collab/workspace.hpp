#pragma once
// Workspace: configuration + file-content provider + scan cache
//
// Shared by the CLI and the MCP server. Reading a file is the only I/O on
// the scan path.

#include "config.hpp"
#include "language.hpp"
#include "log.hpp"
#include "scan_cache.hpp"
#include "trust_config.hpp"
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace collab {

class Workspace {
public:
    Workspace() = default;

    // Load .collab/config.json and .collab/trust.json; false on malformed files
    bool load(std::string& error) {
        if (!load_collab_config(collab_config_path(), config_, error)) return false;
        config_.apply(resolver_);
        return load_trust_config(trust_config_path(), trust_, error);
    }

    static bool read_file(const std::string& path, std::string& content, std::string& error) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            error = "cannot read " + path;
            return false;
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        content = ss.str();
        return true;
    }

    // Scan through the cache; language empty = resolve from the extension
    ScanCache::Entry scan_file(const std::string& path, const std::string& language,
                               std::string& error) {
        std::string content;
        if (!read_file(path, content, error)) return nullptr;
        std::string tag = language.empty() ? resolver_.resolve(path) : language;
        if (tag.empty()) log_debug("workspace", "no language for %s", path.c_str());
        return cache_.get_or_scan(path, tag, content);
    }

    TrustResult check(const std::string& path, std::optional<LineRange> lines, std::string& error) {
        if (!lines) return check_trust(trust_, path, nullptr, std::nullopt);
        auto entry = scan_file(path, "", error);
        // Unreadable file: fall back to configured trust without annotations
        return check_trust(trust_, path, entry ? &entry->index : nullptr, lines);
    }

    CollabConfig& config() { return config_; }
    TrustConfig& trust() { return trust_; }
    LanguageResolver& resolver() { return resolver_; }
    ScanCache& cache() { return cache_; }

private:
    CollabConfig config_;
    TrustConfig trust_;
    LanguageResolver resolver_;
    ScanCache cache_;
};

} // namespace collab
