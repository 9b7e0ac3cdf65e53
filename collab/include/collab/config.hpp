#pragma once
// CollabConfig: engine settings from .collab/config.json
//
//   {
//     "workers": 4,
//     "verbose": false,
//     "extensions": {"mjsx": "javascript", "pyw": "python"}
//   }
//
// Precedence: command-line flags > environment > config file > defaults.

#include "language.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <map>
#include <string>

namespace collab {

using json = nlohmann::json;

// Directory holding trust.json and config.json
inline std::string collab_dir() {
    if (const char* env = std::getenv("COLLAB_DIR")) {
        if (*env) return env;
    }
    return ".collab";
}

inline std::string trust_config_path() { return collab_dir() + "/trust.json"; }
inline std::string collab_config_path() { return collab_dir() + "/config.json"; }

struct CollabConfig {
    size_t workers = 0;  // 0 = hardware concurrency
    bool verbose = false;
    std::map<std::string, std::string> extensions;  // extension → language tag

    // Apply extension mappings on top of the built-in table
    void apply(LanguageResolver& resolver) const {
        for (const auto& [ext, tag] : extensions) {
            resolver.map_extension(ext, tag);
        }
    }
};

// Missing file leaves defaults and succeeds; malformed content fails with
// a message in error.
inline bool load_collab_config(const std::string& path, CollabConfig& config, std::string& error) {
    std::ifstream in(path);
    if (!in) return true;

    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            error = path + ": expected a JSON object";
            return false;
        }
        if (j.contains("workers")) {
            if (!j["workers"].is_number_unsigned()) {
                error = path + ": 'workers' must be a non-negative integer";
                return false;
            }
            config.workers = j["workers"].get<size_t>();
        }
        config.verbose = j.value("verbose", config.verbose);
        if (j.contains("extensions")) {
            for (const auto& [ext, tag] : j["extensions"].items()) {
                if (!tag.is_string()) {
                    error = path + ": extension '" + ext + "' must map to a language tag";
                    return false;
                }
                if (!find_language(tag.get<std::string>())) {
                    error = path + ": unknown language tag '" + tag.get<std::string>() + "'";
                    return false;
                }
                config.extensions[ext] = tag.get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        error = path + ": " + e.what();
        return false;
    }

    if (config.verbose) set_verbose(true);
    log_debug("config", "loaded %s (workers=%zu, %zu extension mappings)",
              path.c_str(), config.workers, config.extensions.size());
    return true;
}

} // namespace collab
