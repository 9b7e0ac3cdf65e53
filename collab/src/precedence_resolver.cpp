#include <collab/precedence_resolver.hpp>
#include <collab/log.hpp>
#include <algorithm>

namespace collab {

std::vector<ResolvedRegion> resolve(std::vector<ScopedDirective> scoped,
                                    Diagnostics& diagnostics) {
    // Empty scopes govern nothing
    scoped.erase(std::remove_if(scoped.begin(), scoped.end(),
                                [](const ScopedDirective& sd) { return sd.scope.empty(); }),
                 scoped.end());

    // Start ascending, end descending: every scope follows the scopes that
    // contain it. Equal scopes put the winner (higher rank, later ordinal) last.
    std::sort(scoped.begin(), scoped.end(), [](const ScopedDirective& a, const ScopedDirective& b) {
        if (a.scope.start != b.scope.start) return a.scope.start < b.scope.start;
        if (a.scope.end != b.scope.end) return a.scope.end > b.scope.end;
        int ra = specificity(a), rb = specificity(b);
        if (ra != rb) return ra < rb;
        return a.directive.ordinal < b.directive.ordinal;
    });

    // Refuse overlapping-but-not-nested pairs
    std::vector<bool> refused(scoped.size(), false);
    for (size_t i = 0; i < scoped.size(); ++i) {
        const Scope& a = scoped[i].scope;
        for (size_t j = i + 1; j < scoped.size(); ++j) {
            const Scope& b = scoped[j].scope;
            if (b.start >= a.end) break;
            if (a.contains(b) || b.contains(a)) continue;

            refused[i] = refused[j] = true;
            Diagnostic diag;
            diag.kind = DiagnosticKind::OverlapNotNested;
            diag.message = "scope " + b.to_string() + " overlaps " + a.to_string() +
                           " without nesting";
            diag.position = scoped[j].directive.source.start;
            diag.related = scoped[i].directive.source.start;
            diagnostics.push_back(std::move(diag));
        }
    }

    std::vector<ResolvedRegion> regions;
    regions.reserve(scoped.size());
    std::vector<size_t> stack;  // indices into regions, outermost first

    for (size_t i = 0; i < scoped.size(); ++i) {
        if (refused[i]) continue;
        auto& sd = scoped[i];

        while (!stack.empty() && !regions[stack.back()].scope.contains(sd.scope)) {
            stack.pop_back();
        }

        ResolvedRegion region;
        region.scope = sd.scope;
        region.kind = sd.kind;
        region.form = sd.directive.form;
        if (!stack.empty()) {
            const ResolvedRegion& parent = regions[stack.back()];
            region.parent = stack.back();
            region.depth = parent.depth + 1;
            region.effective = parent.effective;
            region.provenance = parent.provenance;
        }
        overlay(region.effective, sd.directive.attributes);
        region.provenance.push_back({sd.directive.ordinal, sd.directive.form,
                                     sd.directive.source.start});
        region.attributes = std::move(sd.directive.attributes);

        stack.push_back(regions.size());
        regions.push_back(std::move(region));
    }

    log_debug("resolver", "%zu directives -> %zu regions", scoped.size(), regions.size());
    return regions;
}

} // namespace collab
