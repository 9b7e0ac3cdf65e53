#pragma once
// Language table: comment syntax, literal syntax and scoping style
//
// One entry per language tag. Adding a language means adding an entry;
// a new scoping style means one more ScopeStyle value and detector.

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace collab {

enum class ScopeStyle : uint8_t {
    Brace,               // { ... } blocks
    Indentation,         // offside rule
    ExplicitMarkerOnly,  // own line unless @collab:begin/end is used
};

inline const char* scope_style_str(ScopeStyle style) {
    switch (style) {
        case ScopeStyle::Brace: return "brace";
        case ScopeStyle::Indentation: return "indentation";
        case ScopeStyle::ExplicitMarkerOnly: return "explicit";
    }
    return "explicit";
}

struct LanguageProfile {
    std::string tag;
    ScopeStyle style = ScopeStyle::ExplicitMarkerOnly;
    std::vector<std::string> line_comments;  // longest first
    std::string block_open;                  // empty = no block comments
    std::string block_close;
    bool block_at_line_start = false;        // Ruby =begin / =end
    bool nested_block_comments = false;      // Rust, Swift, Scala
    std::string quotes = "\"";               // string delimiters
    bool char_literals = false;              // '\'' opens a char literal only when it closes
    bool triple_quotes = false;              // Python """ / '''
    std::string block_terminator;            // keyword closing an indented block ("end")
    std::vector<std::string> clause_keywords;  // base-indented words that continue a block (rescue, else)
    bool newline_statements = false;         // a line break can end a statement (no ';' needed)
};

namespace detail {

inline LanguageProfile c_family(const std::string& tag, const std::string& quotes = "\"") {
    LanguageProfile p;
    p.tag = tag;
    p.style = ScopeStyle::Brace;
    p.line_comments = {"//"};
    p.block_open = "/*";
    p.block_close = "*/";
    p.quotes = quotes;
    p.char_literals = true;
    return p;
}

inline std::vector<LanguageProfile> build_language_table() {
    std::vector<LanguageProfile> table;

    for (const char* tag : {"c", "cpp", "java", "csharp", "dart"}) {
        table.push_back(c_family(tag));
    }
    {
        auto p = c_family("kotlin");
        p.newline_statements = true;
        table.push_back(p);
    }
    for (const char* tag : {"javascript", "typescript"}) {
        auto p = c_family(tag, "\"'`");
        p.char_literals = false;
        p.newline_statements = true;
        table.push_back(p);
    }
    {
        auto p = c_family("go", "\"`");
        p.newline_statements = true;
        table.push_back(p);
    }
    for (const char* tag : {"rust", "swift", "scala"}) {
        auto p = c_family(tag);
        p.nested_block_comments = true;
        p.newline_statements = p.tag != "rust";
        table.push_back(p);
    }
    {
        auto p = c_family("php", "\"'");
        p.line_comments = {"//", "#"};
        p.char_literals = false;
        table.push_back(p);
    }
    {
        LanguageProfile p;
        p.tag = "python";
        p.style = ScopeStyle::Indentation;
        p.line_comments = {"#"};
        p.quotes = "\"'";
        p.triple_quotes = true;
        table.push_back(p);
    }
    {
        LanguageProfile p;
        p.tag = "ruby";
        p.style = ScopeStyle::Indentation;
        p.line_comments = {"#"};
        p.block_open = "=begin";
        p.block_close = "=end";
        p.block_at_line_start = true;
        p.quotes = "\"'";
        p.block_terminator = "end";
        p.clause_keywords = {"rescue", "ensure", "else", "elsif", "when", "in"};
        table.push_back(p);
    }
    {
        LanguageProfile p;
        p.tag = "lua";
        p.style = ScopeStyle::Indentation;
        p.line_comments = {"--"};
        p.block_open = "--[[";
        p.block_close = "]]";
        p.quotes = "\"'";
        p.block_terminator = "end";
        p.clause_keywords = {"else", "elseif"};
        table.push_back(p);
    }
    {
        LanguageProfile p;
        p.tag = "yaml";
        p.style = ScopeStyle::Indentation;
        p.line_comments = {"#"};
        p.quotes = "\"'";
        table.push_back(p);
    }
    for (const char* tag : {"shell", "toml"}) {
        LanguageProfile p;
        p.tag = tag;
        p.style = ScopeStyle::ExplicitMarkerOnly;
        p.line_comments = {"#"};
        p.quotes = "\"'";
        table.push_back(p);
    }
    {
        LanguageProfile p;
        p.tag = "sql";
        p.style = ScopeStyle::ExplicitMarkerOnly;
        p.line_comments = {"--"};
        p.block_open = "/*";
        p.block_close = "*/";
        p.quotes = "'";
        table.push_back(p);
    }

    // Match longest delimiter first ("--[[" before "--")
    for (auto& p : table) {
        std::sort(p.line_comments.begin(), p.line_comments.end(),
                  [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
    }
    return table;
}

} // namespace detail

inline const std::vector<LanguageProfile>& language_table() {
    static const std::vector<LanguageProfile> table = detail::build_language_table();
    return table;
}

// nullptr for unknown tags
inline const LanguageProfile* find_language(std::string_view tag) {
    for (const auto& p : language_table()) {
        if (p.tag == tag) return &p;
    }
    return nullptr;
}

// Best-effort scanner used when the language is unknown
inline const LanguageProfile& generic_profile() {
    static const LanguageProfile profile = [] {
        LanguageProfile p;
        p.tag = "generic";
        p.style = ScopeStyle::ExplicitMarkerOnly;
        p.line_comments = {"//", "#"};
        p.block_open = "/*";
        p.block_close = "*/";
        p.quotes = "\"";
        return p;
    }();
    return profile;
}

// ═══════════════════════════════════════════════════════════════════════════
// Extension → language tag
// ═══════════════════════════════════════════════════════════════════════════

class LanguageResolver {
public:
    LanguageResolver() {
        const std::pair<const char*, const char*> defaults[] = {
            {"ts", "typescript"}, {"tsx", "typescript"}, {"mts", "typescript"},
            {"js", "javascript"}, {"jsx", "javascript"}, {"mjs", "javascript"}, {"cjs", "javascript"},
            {"go", "go"}, {"rs", "rust"}, {"java", "java"},
            {"kt", "kotlin"}, {"kts", "kotlin"}, {"scala", "scala"}, {"swift", "swift"},
            {"dart", "dart"},
            {"c", "c"}, {"h", "c"},
            {"cc", "cpp"}, {"cpp", "cpp"}, {"cxx", "cpp"}, {"hpp", "cpp"}, {"hh", "cpp"}, {"hxx", "cpp"},
            {"cs", "csharp"}, {"php", "php"},
            {"py", "python"}, {"pyi", "python"},
            {"rb", "ruby"}, {"lua", "lua"},
            {"sh", "shell"}, {"bash", "shell"}, {"zsh", "shell"},
            {"yaml", "yaml"}, {"yml", "yaml"}, {"toml", "toml"}, {"sql", "sql"},
        };
        for (const auto& [ext, tag] : defaults) {
            extensions_[ext] = tag;
        }
    }

    // Extension without the dot, case-insensitive
    void map_extension(std::string ext, std::string tag) {
        extensions_[normalize(std::move(ext))] = std::move(tag);
    }

    // Empty string when the extension is unknown
    std::string resolve(std::string_view file_path) const {
        auto slash = file_path.find_last_of("/\\");
        auto name = slash == std::string_view::npos ? file_path : file_path.substr(slash + 1);
        auto dot = name.find_last_of('.');
        if (dot == std::string_view::npos || dot + 1 == name.size()) return "";
        auto it = extensions_.find(normalize(std::string(name.substr(dot + 1))));
        return it != extensions_.end() ? it->second : "";
    }

    const std::unordered_map<std::string, std::string>& extensions() const { return extensions_; }

private:
    std::unordered_map<std::string, std::string> extensions_;

    static std::string normalize(std::string ext) {
        if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext;
    }
};

} // namespace collab
