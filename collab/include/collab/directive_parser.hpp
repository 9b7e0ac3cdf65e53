#pragma once
// Directive Parser: @collab comments → structured directives
//
// Grammar carried inside the host language's comments:
//   @collab key1="v1" key2='v2' key3=bare
//   @collab constraints=["a", "b"]
//   @collab:begin [key="v" ...]
//   @collab:end
//
// Consecutive single-line @collab comments merge into one directive
// (last key wins). Block markers are paired with an explicit LIFO stack.

#include "comment_extractor.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace collab {

enum class DirectiveForm : uint8_t {
    SingleLine,
    MultiLineMerged,
    BlockBegin,
    BlockEnd,
};

inline const char* directive_form_str(DirectiveForm form) {
    switch (form) {
        case DirectiveForm::SingleLine: return "single_line";
        case DirectiveForm::MultiLineMerged: return "multi_line_merged";
        case DirectiveForm::BlockBegin: return "block_begin";
        case DirectiveForm::BlockEnd: return "block_end";
    }
    return "single_line";
}

struct Directive {
    size_t ordinal = 0;  // declaration order within the file
    DirectiveForm form = DirectiveForm::SingleLine;
    Attributes attributes;
    Span source;          // the comment(s) carrying the directive
    Position anchor;      // immediately after the directive's comment text
    bool trailing = false;  // written after code on the same line

    // Block pairing, filled for BlockBegin/BlockEnd that survived balancing
    std::optional<size_t> partner;  // ordinal of the matching marker
};

// ═══════════════════════════════════════════════════════════════════════════
// Attribute syntax
// ═══════════════════════════════════════════════════════════════════════════

struct AttributeParse {
    bool ok = true;
    Attributes attributes;
    std::string error;
    size_t error_offset = 0;  // into the parsed text

    static AttributeParse failure(std::string message, size_t offset) {
        AttributeParse r;
        r.ok = false;
        r.error = std::move(message);
        r.error_offset = offset;
        return r;
    }
};

// Parse `key="v" key=[...] ...`; duplicate keys: last wins
AttributeParse parse_attributes(std::string_view text);

// ═══════════════════════════════════════════════════════════════════════════
// Parser
// ═══════════════════════════════════════════════════════════════════════════

enum class MarkerKind : uint8_t {
    None,       // not a directive
    Single,     // @collab ...
    Begin,      // @collab:begin ...
    End,        // @collab:end
    Unknown,    // @collab:<something else>
};

struct Marker {
    MarkerKind kind = MarkerKind::None;
    std::string word;  // the word after "@collab:" for Begin/End/Unknown
    std::string rest;  // text after the marker
};

// Recognize the @collab marker at the start of a comment's text.
// Block comment decoration (leading '*' and '!' on doc comments) is ignored.
Marker classify_comment(const Comment& comment);

class DirectiveParser {
public:
    explicit DirectiveParser(const SourceText& source) : source_(&source) {}

    // Consume the whole comment sequence. Syntax and balance problems are
    // appended to diagnostics; affected directives are dropped.
    std::vector<Directive> parse(CommentCursor& comments, Diagnostics& diagnostics);

private:
    const SourceText* source_;

    // A run of single-line directives still open for merging
    struct Pending {
        Directive directive;
        CommentStyle style = CommentStyle::Line;
        std::string delimiter;
        size_t run_length = 0;
    };

    bool continues_run(const Pending& run, const Comment& next) const;
    void check_trust_value(const Directive& d, Diagnostics& diagnostics) const;
    Diagnostic syntax_error(const Comment& comment, std::string message) const;
};

} // namespace collab
