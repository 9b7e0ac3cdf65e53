#pragma once
// Core types: trust levels, source positions, attributes, diagnostics
//
// Positions are 1-based (line, column) with byte columns. A Span is
// half-open: it covers start up to, but not including, end.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace collab {

// ═══════════════════════════════════════════════════════════════════════════
// Trust levels
// ═══════════════════════════════════════════════════════════════════════════

// Policy tags consumed verbatim by the enforcement layer.
// The numeric values carry no ordering.
enum class TrustLevel : uint8_t {
    ReadOnly,
    SuggestOnly,
    Supervised,
    Autonomous,
};

inline const char* trust_level_str(TrustLevel level) {
    switch (level) {
        case TrustLevel::ReadOnly: return "READ_ONLY";
        case TrustLevel::SuggestOnly: return "SUGGEST_ONLY";
        case TrustLevel::Supervised: return "SUPERVISED";
        case TrustLevel::Autonomous: return "AUTONOMOUS";
    }
    return "SUPERVISED";
}

inline std::optional<TrustLevel> parse_trust_level(std::string_view s) {
    if (s == "READ_ONLY") return TrustLevel::ReadOnly;
    if (s == "SUGGEST_ONLY") return TrustLevel::SuggestOnly;
    if (s == "SUPERVISED") return TrustLevel::Supervised;
    if (s == "AUTONOMOUS") return TrustLevel::Autonomous;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Positions and spans
// ═══════════════════════════════════════════════════════════════════════════

struct Position {
    size_t line = 0;
    size_t column = 0;

    bool operator==(const Position& other) const {
        return line == other.line && column == other.column;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
    bool operator<(const Position& other) const {
        return line < other.line || (line == other.line && column < other.column);
    }
    bool operator<=(const Position& other) const { return !(other < *this); }
    bool operator>(const Position& other) const { return other < *this; }
    bool operator>=(const Position& other) const { return !(*this < other); }

    std::string to_string() const {
        return std::to_string(line) + ":" + std::to_string(column);
    }
};

struct Span {
    Position start;
    Position end;  // exclusive

    bool empty() const { return !(start < end); }

    bool contains(const Position& p) const {
        return start <= p && p < end;
    }

    // Inclusion of ranges; an identical span contains itself
    bool contains(const Span& other) const {
        return start <= other.start && other.end <= end;
    }

    bool overlaps(const Span& other) const {
        return start < other.end && other.start < end;
    }

    // Does any line in [first, last] intersect this span?
    bool touches_lines(size_t first, size_t last) const {
        if (empty()) return false;
        size_t last_line = end.column > 1 ? end.line : end.line - 1;
        return first <= last_line && start.line <= last;
    }

    bool operator==(const Span& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const Span& other) const { return !(*this == other); }

    std::string to_string() const {
        return "[" + start.to_string() + ", " + end.to_string() + ")";
    }
};

// The code a directive governs
using Scope = Span;

// ═══════════════════════════════════════════════════════════════════════════
// Attributes
// ═══════════════════════════════════════════════════════════════════════════

// A value is a scalar string or an ordered list (constraints=["a","b"])
using AttributeValue = std::variant<std::string, std::vector<std::string>>;

// Ordered by key so serialized output is stable across scans
using Attributes = std::map<std::string, AttributeValue>;

inline bool is_list(const AttributeValue& v) {
    return std::holds_alternative<std::vector<std::string>>(v);
}

// Scalar text, or the list joined with ", "
inline std::string attribute_text(const AttributeValue& v) {
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    std::string out;
    for (const auto& item : std::get<std::vector<std::string>>(v)) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

// Right-hand side wins key by key
inline void overlay(Attributes& base, const Attributes& top) {
    for (const auto& [key, value] : top) {
        base[key] = value;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Diagnostics
// ═══════════════════════════════════════════════════════════════════════════

enum class DiagnosticKind : uint8_t {
    UnsupportedLanguage,
    DirectiveSyntax,
    UnbalancedBlock,
    ScopeDetection,
    InvalidTrustValue,
    OverlapNotNested,
};

inline const char* diagnostic_kind_str(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::UnsupportedLanguage: return "UnsupportedLanguageError";
        case DiagnosticKind::DirectiveSyntax: return "DirectiveSyntaxError";
        case DiagnosticKind::UnbalancedBlock: return "UnbalancedBlockError";
        case DiagnosticKind::ScopeDetection: return "ScopeDetectionError";
        case DiagnosticKind::InvalidTrustValue: return "InvalidTrustValueError";
        case DiagnosticKind::OverlapNotNested: return "OverlapNotNestedError";
    }
    return "Diagnostic";
}

// Every engine problem is recoverable and reported as a value
struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::DirectiveSyntax;
    std::string message;
    Position position;                // where the problem was detected
    std::optional<Position> related;  // e.g. start of the still-open block
    std::string text;                 // offending source line or value

    std::string to_string() const {
        std::string s = std::string(diagnostic_kind_str(kind)) + " at " +
                        position.to_string() + ": " + message;
        if (related) s += " (see " + related->to_string() + ")";
        return s;
    }
};

using Diagnostics = std::vector<Diagnostic>;

} // namespace collab
