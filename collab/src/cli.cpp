// collab: command-line interface for @collab trust annotations
//
// Usage: collab <command> [options]
//
// Commands:
//   scan       Resolve the @collab regions of one or more files
//   query      Effective attributes at a position
//   check      Trust level for a file or line range
//   languages  List language tags, scoping styles and extensions
//   init       Write a starter .collab/trust.json
//   help       Show this help

#include <collab/collab.hpp>
#include <collab/version.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace collab;

static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "collab " << COLLAB_VERSION << " - @collab trust annotations\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  scan <file>...          Resolve @collab regions and report diagnostics\n"
              << "  query <file> <line> [<column>]\n"
              << "                          Effective attributes at a position\n"
              << "  check <file>            Trust level (inline annotation, region, policy, default)\n"
              << "  languages               List supported languages\n"
              << "  init                    Write a starter trust.json into the .collab directory\n"
              << "  help                    Show this help\n\n"
              << "Options:\n"
              << "  --language TAG          Language tag instead of the file extension\n"
              << "  --lines A[-B]           Line range for check\n"
              << "  --workers N             Parallel scan workers (default: all cores)\n"
              << "  --json                  Output as JSON\n"
              << "  --verbose               Enable verbose debug logging\n"
              << "  -v, --version           Show version\n\n"
              << "Environment:\n"
              << "  COLLAB_DIR              Configuration directory (default: .collab)\n"
              << "  COLLAB_VERBOSE          Enable debug logging\n";
}

static bool parse_number(const std::string& s, size_t& out) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        out = std::stoul(s);
    } catch (const std::out_of_range&) {
        return false;
    }
    return out > 0;
}

static bool parse_lines(const std::string& s, LineRange& range) {
    auto dash = s.find('-');
    if (dash == std::string::npos) {
        if (!parse_number(s, range.first)) return false;
        range.last = range.first;
        return true;
    }
    return parse_number(s.substr(0, dash), range.first) &&
           parse_number(s.substr(dash + 1), range.last);
}

static std::string describe(const Attributes& attrs) {
    std::string out;
    for (const auto& [key, value] : attrs) {
        if (!out.empty()) out += " ";
        out += key + "=";
        out += is_list(value) ? "[" + attribute_text(value) + "]" : attribute_text(value);
    }
    return out;
}

static void print_scan(const ScanResult& result) {
    std::cout << result.file_path << " [" << result.language << "]\n";
    if (result.regions.empty()) std::cout << "  (no regions)\n";
    for (const auto& r : result.regions) {
        std::cout << "  " << std::string(r.depth * 2, ' ')
                  << r.scope.to_string() << " " << scope_kind_str(r.kind) << "  "
                  << describe(r.effective) << "\n";
    }
    for (const auto& d : result.diagnostics) {
        std::cout << "  ! " << d.to_string() << "\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int cmd_scan(Workspace& ws, const std::vector<std::string>& files, const std::string& language,
             size_t workers, bool json_output) {
    std::vector<SourceFile> sources;
    for (const auto& path : files) {
        SourceFile f;
        f.path = path;
        f.language = language.empty() ? ws.resolver().resolve(path) : language;
        std::string error;
        if (!Workspace::read_file(path, f.content, error)) {
            std::cerr << "[collab] " << error << "\n";
            return 1;
        }
        sources.push_back(std::move(f));
    }

    auto results = scan_files(sources, workers);

    if (json_output) {
        json out = json::array();
        for (const auto& [path, result] : results) out.push_back(to_json(result, true));
        std::cout << (out.size() == 1 ? out[0] : out).dump(2) << "\n";
        return 0;
    }

    size_t diagnostics = 0;
    for (const auto& [path, result] : results) {
        print_scan(result);
        diagnostics += result.diagnostics.size();
    }
    if (results.size() > 1) {
        std::cout << results.size() << " files, " << diagnostics << " diagnostic(s)\n";
    }
    return 0;
}

int cmd_query(Workspace& ws, const std::string& path, const std::string& language,
              size_t line, size_t column, bool json_output) {
    std::string error;
    auto entry = ws.scan_file(path, language, error);
    if (!entry) {
        std::cerr << "[collab] " << error << "\n";
        return 1;
    }

    auto attrs = query(entry->index, line, column);
    if (json_output) {
        json out = attrs ? to_json(*attrs) : json{{"covered", false}, {"status", "not_covered"}};
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (!attrs) {
        std::cout << path << ":" << line << ":" << column << " not covered\n";
        return 0;
    }
    std::cout << path << ":" << line << ":" << column << " in " << attrs->scope().to_string() << "\n";
    auto trust = attrs->trust();
    std::cout << "  trust: " << (trust ? trust_level_str(*trust) : attrs->get("trust").value_or("(none)"))
              << (trust || !attrs->get("trust") ? "" : " (invalid)") << "\n";
    for (const auto& [key, value] : attrs->values()) {
        if (key == "trust") continue;
        std::cout << "  " << key << ": " << attribute_text(value) << "\n";
    }
    return 0;
}

int cmd_check(Workspace& ws, const std::string& path, std::optional<LineRange> lines,
              bool json_output) {
    std::string error;
    TrustResult trust = ws.check(path, lines, error);
    if (!error.empty()) std::cerr << "[collab] " << error << " (annotations skipped)\n";

    if (json_output) {
        std::cout << to_json(trust, path).dump(2) << "\n";
        return 0;
    }
    std::cout << path << ": " << trust_level_str(trust.level)
              << " (" << trust_source_str(trust.source) << ")\n";
    if (!trust.reason.empty()) std::cout << "  reason: " << trust.reason << "\n";
    if (trust.owner) std::cout << "  owner: " << *trust.owner << "\n";
    if (trust.intent) std::cout << "  intent: " << *trust.intent << "\n";
    for (const auto& c : trust.constraints) std::cout << "  constraint: " << c << "\n";
    std::cout << "  " << trust_guidance(trust.level) << "\n";
    return 0;
}

int cmd_languages(Workspace& ws, bool json_output) {
    std::map<std::string, std::vector<std::string>> by_tag;
    for (const auto& [ext, tag] : ws.resolver().extensions()) by_tag[tag].push_back(ext);
    for (auto& [tag, exts] : by_tag) std::sort(exts.begin(), exts.end());

    json out = json::array();
    for (const auto& p : language_table()) {
        if (json_output) {
            out.push_back({{"tag", p.tag},
                           {"style", scope_style_str(p.style)},
                           {"extensions", by_tag[p.tag]}});
            continue;
        }
        std::cout << p.tag << std::string(p.tag.size() < 12 ? 12 - p.tag.size() : 1, ' ')
                  << scope_style_str(p.style) << std::string(14 - std::strlen(scope_style_str(p.style)), ' ');
        for (const auto& ext : by_tag[p.tag]) std::cout << "." << ext << " ";
        std::cout << "\n";
    }
    if (json_output) std::cout << out.dump(2) << "\n";
    return 0;
}

int cmd_init() {
    std::string dir = collab_dir();
    std::string path = trust_config_path();
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[collab] cannot create " << dir << ": " << ec.message() << "\n";
        return 1;
    }
    if (std::filesystem::exists(path)) {
        std::cerr << "[collab] " << path << " already exists\n";
        return 1;
    }
    std::string error;
    if (!save_trust_config(path, default_trust_config(), error)) {
        std::cerr << "[collab] " << error << "\n";
        return 1;
    }
    std::cout << "Wrote " << path << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::vector<std::string> positional;
    std::string language;
    std::string lines_arg;
    std::string workers_arg;
    bool json_output = false;
    bool verbose_mode = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--language") == 0 && i + 1 < argc) {
            language = argv[++i];
        } else if (std::strcmp(argv[i], "--lines") == 0 && i + 1 < argc) {
            lines_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            workers_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose_mode = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            std::cout << "collab " << COLLAB_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else {
                positional.push_back(argv[i]);
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    if (command == "init") return cmd_init();

    Workspace ws;
    std::string error;
    if (!ws.load(error)) {
        std::cerr << "[collab] " << error << "\n";
        return 1;
    }
    // Flags win over config files
    if (verbose_mode) set_verbose(true);
    size_t workers = ws.config().workers;
    if (!workers_arg.empty() && !parse_number(workers_arg, workers)) {
        std::cerr << "[collab] --workers expects a positive number\n";
        return 1;
    }
    if (!language.empty() && !find_language(language)) {
        std::cerr << "[collab] unknown language '" << language << "', using generic scanner\n";
    }

    if (command == "scan") {
        if (positional.empty()) {
            std::cerr << "Usage: collab scan <file>... [--language TAG] [--json]\n";
            return 1;
        }
        return cmd_scan(ws, positional, language, workers, json_output);
    }

    if (command == "query") {
        size_t line = 0, column = 1;
        if (positional.size() < 2 || !parse_number(positional[1], line) ||
            (positional.size() > 2 && !parse_number(positional[2], column))) {
            std::cerr << "Usage: collab query <file> <line> [<column>]\n";
            return 1;
        }
        return cmd_query(ws, positional[0], language, line, column, json_output);
    }

    if (command == "check") {
        if (positional.empty()) {
            std::cerr << "Usage: collab check <file> [--lines A[-B]]\n";
            return 1;
        }
        std::optional<LineRange> lines;
        if (!lines_arg.empty()) {
            LineRange range;
            if (!parse_lines(lines_arg, range)) {
                std::cerr << "[collab] --lines expects A or A-B\n";
                return 1;
            }
            lines = range;
        }
        return cmd_check(ws, positional[0], lines, json_output);
    }

    if (command == "languages") return cmd_languages(ws, json_output);

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
