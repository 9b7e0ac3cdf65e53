#pragma once
// Scope Detector: which code does a directive govern?
//
// The language table picks one of three styles:
//   Brace              declaration header through its matching '}'
//   Indentation        declaration plus every more-indented line after it
//   ExplicitMarkerOnly the directive's own lines
// Block directives need no inference: their scope is the text between
// the @collab:begin anchor and the matching @collab:end.

#include "comment_extractor.hpp"
#include "directive_parser.hpp"
#include "language.hpp"
#include "source_text.hpp"
#include "types.hpp"
#include <optional>
#include <string>

namespace collab {

// How a scope was obtained; also the tie-break rank for identical scopes
enum class ScopeKind : uint8_t {
    OwnLine,      // fallback: the directive's own line span
    Declaration,  // structural detection from the anchor
    Block,        // explicit @collab:begin / @collab:end
};

inline const char* scope_kind_str(ScopeKind kind) {
    switch (kind) {
        case ScopeKind::OwnLine: return "own_line";
        case ScopeKind::Declaration: return "declaration";
        case ScopeKind::Block: return "block";
    }
    return "own_line";
}

enum class ScopeStatus : uint8_t {
    Found,
    NoDeclaration,  // nothing structural follows the anchor
    Failed,         // a declaration starts but never closes
};

struct ScopeOutcome {
    ScopeStatus status = ScopeStatus::NoDeclaration;
    Scope scope;
    std::string error;

    static ScopeOutcome found(const Scope& s) { return {ScopeStatus::Found, s, ""}; }
    static ScopeOutcome none() { return {ScopeStatus::NoDeclaration, Scope{}, ""}; }
    static ScopeOutcome failure(std::string message) {
        return {ScopeStatus::Failed, Scope{}, std::move(message)};
    }
};

class ScopeDetector {
public:
    ScopeDetector(const SourceText& source, const LanguageProfile& profile)
        : source_(&source), profile_(&profile) {}

    // Structural scope of the declaration following anchor
    ScopeOutcome detect(const Position& anchor) const;

    // Fallback scope: the lines the directive itself occupies
    Scope own_line(const Directive& directive) const;

    // Trailing directive: its line, minus any closers that lead it
    Scope trailing_line(const Directive& directive) const;

    // Explicit scope between a begin marker and its end marker
    Scope block(const Directive& begin, const Directive& end) const {
        return {begin.anchor, end.source.start};
    }

    ScopeStyle style() const { return profile_->style; }

private:
    const SourceText* source_;
    const LanguageProfile* profile_;

    // Offset of the first code character at or after offset, skipping
    // whitespace and comments
    std::optional<size_t> find_declaration(size_t offset) const;

    ScopeOutcome brace_scope(size_t decl) const;
    ScopeOutcome indentation_scope(size_t decl) const;

    bool comment_only_line(size_t line_no) const;
    bool starts_with_word(size_t line_no, const std::string& word) const;
    // rescue / else / elsif ... at the block's own indentation
    bool starts_with_clause(size_t line_no) const;
};

} // namespace collab
