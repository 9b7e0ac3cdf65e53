#pragma once
// Precedence Resolver: scoped directives → nested resolved regions
//
// Scopes form a containment tree. Effective attributes flow outward-in:
// an inner directive overrides the keys it names and inherits the rest.
// Scopes that overlap without nesting are refused with a diagnostic.

#include "directive_parser.hpp"
#include "scope_detector.hpp"
#include "types.hpp"
#include <optional>
#include <vector>

namespace collab {

// A directive paired with the code it governs
struct ScopedDirective {
    Directive directive;
    Scope scope;
    ScopeKind kind = ScopeKind::OwnLine;
};

// Tie-break rank for identical scopes; the higher rank becomes the inner
// region and wins. Block > single-line on a declaration > merged on a
// declaration > own-line fallback.
inline int specificity(const ScopedDirective& sd) {
    switch (sd.kind) {
        case ScopeKind::Block: return 3;
        case ScopeKind::Declaration:
            return sd.directive.form == DirectiveForm::MultiLineMerged ? 1 : 2;
        case ScopeKind::OwnLine: return 0;
    }
    return 0;
}

// One contributing directive in a region's provenance chain
struct DirectiveRef {
    size_t ordinal = 0;
    DirectiveForm form = DirectiveForm::SingleLine;
    Position at;  // start of the directive's comment
};

struct ResolvedRegion {
    Scope scope;
    Attributes attributes;  // the region's own directive
    Attributes effective;   // after inheritance from enclosing regions
    std::vector<DirectiveRef> provenance;  // outer → inner
    std::optional<size_t> parent;          // index into the region list
    size_t depth = 0;
    ScopeKind kind = ScopeKind::OwnLine;
    DirectiveForm form = DirectiveForm::SingleLine;
};

// Regions come back depth-first, outer before inner; parent indices
// always point backwards.
std::vector<ResolvedRegion> resolve(std::vector<ScopedDirective> scoped,
                                    Diagnostics& diagnostics);

} // namespace collab
