#pragma once
// Region Index: position → effective attributes of the deepest region
//
// Regions are stored flat (depth-first order, parent indices) with a
// per-region child list; a lookup descends from the roots.

#include "precedence_resolver.hpp"
#include "types.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace collab {

// Fully merged attributes of one region, as seen by the policy layer
class EffectiveAttributes {
public:
    EffectiveAttributes(const ResolvedRegion& region, size_t index)
        : values_(region.effective), scope_(region.scope), region_(index) {}

    // nullopt when absent, a list, or not one of the four tags
    std::optional<TrustLevel> trust() const {
        auto it = values_.find("trust");
        if (it == values_.end() || is_list(it->second)) return std::nullopt;
        return parse_trust_level(std::get<std::string>(it->second));
    }

    // Raw text, even when trust is not a valid tag
    std::optional<std::string> get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        return attribute_text(it->second);
    }

    const AttributeValue* find(const std::string& key) const {
        auto it = values_.find(key);
        return it == values_.end() ? nullptr : &it->second;
    }

    std::optional<std::string> owner() const { return get("owner"); }
    std::optional<std::string> intent() const { return get("intent"); }

    std::vector<std::string> constraints() const {
        const AttributeValue* v = find("constraints");
        if (!v) return {};
        if (const auto* s = std::get_if<std::string>(v)) return {*s};
        return std::get<std::vector<std::string>>(*v);
    }

    const Attributes& values() const { return values_; }
    const Scope& scope() const { return scope_; }
    size_t region() const { return region_; }

private:
    Attributes values_;
    Scope scope_;
    size_t region_;
};

class RegionIndex {
public:
    RegionIndex() = default;

    explicit RegionIndex(std::vector<ResolvedRegion> regions)
        : regions_(std::move(regions)), children_(regions_.size()) {
        for (size_t i = 0; i < regions_.size(); ++i) {
            if (regions_[i].parent) {
                children_[*regions_[i].parent].push_back(i);
            } else {
                roots_.push_back(i);
            }
        }
    }

    // Index of the deepest region containing p
    std::optional<size_t> deepest_at(const Position& p) const {
        std::optional<size_t> found;
        const std::vector<size_t>* level = &roots_;
        while (true) {
            auto hit = find_in(*level, p);
            if (!hit) break;
            found = hit;
            level = &children_[*hit];
        }
        return found;
    }

    // nullopt means NotCovered
    std::optional<EffectiveAttributes> query(size_t line, size_t column) const {
        auto idx = deepest_at({line, column});
        if (!idx) return std::nullopt;
        return EffectiveAttributes(regions_[*idx], *idx);
    }

    // Regions intersecting lines [first, last], depth-first order
    std::vector<size_t> touching(size_t first, size_t last) const {
        std::vector<size_t> out;
        for (size_t i = 0; i < regions_.size(); ++i) {
            if (regions_[i].scope.touches_lines(first, last)) out.push_back(i);
        }
        return out;
    }

    const ResolvedRegion& region(size_t i) const { return regions_[i]; }
    const std::vector<ResolvedRegion>& regions() const { return regions_; }
    const std::vector<size_t>& children(size_t i) const { return children_[i]; }
    const std::vector<size_t>& roots() const { return roots_; }
    size_t size() const { return regions_.size(); }
    bool empty() const { return regions_.empty(); }

private:
    std::vector<ResolvedRegion> regions_;
    std::vector<std::vector<size_t>> children_;
    std::vector<size_t> roots_;

    // Siblings are disjoint and sorted by start
    std::optional<size_t> find_in(const std::vector<size_t>& siblings, const Position& p) const {
        auto it = std::upper_bound(siblings.begin(), siblings.end(), p,
                                   [this](const Position& pos, size_t i) {
                                       return pos < regions_[i].scope.start;
                                   });
        if (it == siblings.begin()) return std::nullopt;
        --it;
        if (regions_[*it].scope.contains(p)) return *it;
        return std::nullopt;
    }
};

inline std::optional<EffectiveAttributes> query(const RegionIndex& index, size_t line, size_t column) {
    return index.query(line, column);
}

} // namespace collab
