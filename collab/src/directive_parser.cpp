#include <collab/directive_parser.hpp>
#include <collab/log.hpp>
#include <cctype>
#include <limits>

namespace collab {

namespace {

constexpr std::string_view MARKER = "@collab";
constexpr size_t NO_DIRECTIVE = std::numeric_limits<size_t>::max();

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

bool is_key_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

// Collapse comment decoration: "///", "//!", "/** ... \n * ..." all
// reduce to their words joined by single spaces
std::string normalize_comment_text(const Comment& comment) {
    std::string out;
    std::string_view text = comment.text;
    bool first = true;
    while (true) {
        size_t nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        line = trim(line);
        if (first && comment.style == CommentStyle::Line) {
            while (!line.empty() && (line.front() == '/' || line.front() == '!')) line.remove_prefix(1);
        } else if (comment.style == CommentStyle::Block) {
            while (!line.empty() && (line.front() == '*' || line.front() == '!')) line.remove_prefix(1);
        }
        line = trim(line);
        if (!line.empty()) {
            if (!out.empty()) out += ' ';
            out.append(line.data(), line.size());
        }
        first = false;
        if (nl == std::string_view::npos) break;
        text.remove_prefix(nl + 1);
    }
    return out;
}

// Reads a quoted value starting at text[i] (the quote). On success i is
// just past the closing quote.
bool read_quoted(std::string_view text, size_t& i, std::string& value) {
    const char q = text[i];
    size_t j = i + 1;
    value.clear();
    while (j < text.size()) {
        char c = text[j];
        if (c == '\\' && j + 1 < text.size()) {
            value += text[j + 1];
            j += 2;
            continue;
        }
        if (c == q) {
            i = j + 1;
            return true;
        }
        value += c;
        ++j;
    }
    return false;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Attribute syntax
// ═══════════════════════════════════════════════════════════════════════════

AttributeParse parse_attributes(std::string_view text) {
    AttributeParse result;
    const size_t n = text.size();
    size_t i = 0;

    auto skip_space = [&]() {
        while (i < n && is_space(text[i])) ++i;
    };

    skip_space();
    while (i < n) {
        if (!is_key_start(text[i])) {
            return AttributeParse::failure(
                std::string("expected attribute name, found '") + text[i] + "'", i);
        }
        size_t key_begin = i;
        while (i < n && is_key_char(text[i])) ++i;
        std::string key(text.substr(key_begin, i - key_begin));

        skip_space();
        if (i >= n || text[i] != '=') {
            return AttributeParse::failure("missing '=' after '" + key + "'", i);
        }
        ++i;
        skip_space();
        if (i >= n) {
            return AttributeParse::failure("missing value for '" + key + "'", i);
        }

        char c = text[i];
        if (c == '"' || c == '\'') {
            std::string value;
            size_t quote_at = i;
            if (!read_quoted(text, i, value)) {
                return AttributeParse::failure("unterminated quote in value of '" + key + "'", quote_at);
            }
            result.attributes[key] = std::move(value);
        } else if (c == '[') {
            size_t open_at = i;
            ++i;
            std::vector<std::string> items;
            bool closed = false;
            while (i < n) {
                skip_space();
                if (i < n && text[i] == ']') {
                    ++i;
                    closed = true;
                    break;
                }
                if (i >= n) break;
                std::string item;
                if (text[i] == '"' || text[i] == '\'') {
                    size_t quote_at = i;
                    if (!read_quoted(text, i, item)) {
                        return AttributeParse::failure(
                            "unterminated quote in list '" + key + "'", quote_at);
                    }
                } else {
                    size_t b = i;
                    while (i < n && text[i] != ',' && text[i] != ']') ++i;
                    item = std::string(trim(text.substr(b, i - b)));
                }
                items.push_back(std::move(item));
                skip_space();
                if (i < n && text[i] == ',') {
                    ++i;
                } else if (i < n && text[i] != ']') {
                    return AttributeParse::failure(
                        "expected ',' or ']' in list '" + key + "'", i);
                }
            }
            if (!closed) {
                return AttributeParse::failure("unterminated list in value of '" + key + "'", open_at);
            }
            result.attributes[key] = std::move(items);
        } else {
            size_t b = i;
            while (i < n && !is_space(text[i])) ++i;
            result.attributes[key] = std::string(text.substr(b, i - b));
        }

        if (i < n && !is_space(text[i])) {
            return AttributeParse::failure(
                "unexpected '" + std::string(1, text[i]) + "' after value of '" + key + "'", i);
        }
        skip_space();
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════
// Marker recognition
// ═══════════════════════════════════════════════════════════════════════════

Marker classify_comment(const Comment& comment) {
    Marker m;
    std::string text = normalize_comment_text(comment);
    if (text.compare(0, MARKER.size(), MARKER) != 0) return m;

    std::string_view after(text);
    after.remove_prefix(MARKER.size());

    if (after.empty()) {
        m.kind = MarkerKind::Single;
        return m;
    }
    if (after.front() == ':') {
        after.remove_prefix(1);
        size_t w = 0;
        while (w < after.size() && std::isalpha(static_cast<unsigned char>(after[w]))) ++w;
        m.word = std::string(after.substr(0, w));
        m.rest = std::string(after.substr(w));
        if (m.word == "begin") {
            m.kind = MarkerKind::Begin;
        } else if (m.word == "end") {
            m.kind = MarkerKind::End;
        } else {
            m.kind = MarkerKind::Unknown;
        }
        return m;
    }
    if (is_space(after.front())) {
        m.kind = MarkerKind::Single;
        m.rest = std::string(after);
    }
    // "@collaborator" and the like are ordinary words
    return m;
}

// Prose that merely mentions @collab ("# @collab system for trust ...")
// has no attribute punctuation and does not open with a known key.
// "@collab trust READ_ONLY" is a malformed directive, not prose.
static bool looks_like_attributes(std::string_view rest) {
    rest = trim(rest);
    if (rest.empty() || rest.find_first_of("=\"'[") != std::string_view::npos) return true;
    size_t w = 0;
    while (w < rest.size() && is_key_char(rest[w])) ++w;
    std::string_view word = rest.substr(0, w);
    return word == "trust" || word == "owner" || word == "intent" || word == "constraints";
}

// ═══════════════════════════════════════════════════════════════════════════
// DirectiveParser
// ═══════════════════════════════════════════════════════════════════════════

Diagnostic DirectiveParser::syntax_error(const Comment& comment, std::string message) const {
    Diagnostic d;
    d.kind = DiagnosticKind::DirectiveSyntax;
    d.message = std::move(message);
    d.position = comment.span.start;
    d.text = std::string(source_->line(comment.span.start.line));
    return d;
}

bool DirectiveParser::continues_run(const Pending& run, const Comment& next) const {
    const Directive& d = run.directive;
    if (d.trailing || next.trailing) return false;
    if (run.style != next.style || run.delimiter != next.delimiter) return false;
    if (next.span.start.line != d.source.end.line + 1) return false;

    // Nothing but whitespace may follow the previous comment on its line
    auto line = source_->line(d.source.end.line);
    for (size_t i = d.source.end.column - 1; i < line.size(); ++i) {
        if (!is_space(line[i])) return false;
    }
    return true;
}

void DirectiveParser::check_trust_value(const Directive& d, Diagnostics& diagnostics) const {
    auto it = d.attributes.find("trust");
    if (it == d.attributes.end()) return;

    Diagnostic diag;
    diag.kind = DiagnosticKind::InvalidTrustValue;
    diag.position = d.source.start;
    if (is_list(it->second)) {
        diag.message = "trust must be a single value, got a list";
        diag.text = attribute_text(it->second);
        diagnostics.push_back(std::move(diag));
        return;
    }
    const auto& value = std::get<std::string>(it->second);
    if (!parse_trust_level(value)) {
        diag.message = "unknown trust level '" + value +
                       "' (expected READ_ONLY, SUGGEST_ONLY, SUPERVISED or AUTONOMOUS)";
        diag.text = value;
        diagnostics.push_back(std::move(diag));
    }
}

std::vector<Directive> DirectiveParser::parse(CommentCursor& comments, Diagnostics& diagnostics) {
    std::vector<Directive> out;
    std::optional<Pending> pending;
    size_t ordinal = 0;

    // Open blocks, innermost last; NO_DIRECTIVE marks a begin whose
    // attributes failed to parse (it still pairs with its end)
    struct OpenBlock {
        size_t index;
        Position start;
    };
    std::vector<OpenBlock> open_blocks;
    std::optional<Position> imbalance;

    auto flush = [&]() {
        if (!pending) return;
        Directive& d = pending->directive;
        if (pending->run_length > 1) d.form = DirectiveForm::MultiLineMerged;
        check_trust_value(d, diagnostics);
        out.push_back(std::move(d));
        pending.reset();
    };

    auto note_imbalance = [&](const Position& at) {
        if (!imbalance || at < *imbalance) imbalance = at;
    };

    while (auto comment = comments.next()) {
        Marker marker = classify_comment(*comment);

        if (marker.kind == MarkerKind::None ||
            (marker.kind == MarkerKind::Single && !looks_like_attributes(marker.rest))) {
            flush();
            continue;
        }

        if (marker.kind == MarkerKind::Unknown) {
            flush();
            diagnostics.push_back(syntax_error(*comment, "unknown marker '@collab:" + marker.word + "'"));
            continue;
        }

        if (marker.kind == MarkerKind::Begin) {
            flush();
            auto attrs = parse_attributes(marker.rest);
            if (!attrs.ok) {
                diagnostics.push_back(syntax_error(*comment, attrs.error));
                open_blocks.push_back({NO_DIRECTIVE, comment->span.start});
                continue;
            }
            Directive d;
            d.ordinal = ordinal++;
            d.form = DirectiveForm::BlockBegin;
            d.attributes = std::move(attrs.attributes);
            d.source = comment->span;
            d.anchor = comment->span.end;
            d.trailing = comment->trailing;
            check_trust_value(d, diagnostics);
            open_blocks.push_back({out.size(), comment->span.start});
            out.push_back(std::move(d));
            continue;
        }

        if (marker.kind == MarkerKind::End) {
            flush();
            if (!trim(marker.rest).empty()) {
                diagnostics.push_back(syntax_error(*comment, "unexpected text after @collab:end"));
            }
            if (open_blocks.empty()) {
                Diagnostic diag;
                diag.kind = DiagnosticKind::UnbalancedBlock;
                diag.message = "@collab:end without a matching @collab:begin";
                diag.position = comment->span.start;
                diag.text = std::string(source_->line(comment->span.start.line));
                diagnostics.push_back(std::move(diag));
                note_imbalance(comment->span.start);
                continue;
            }
            OpenBlock open = open_blocks.back();
            open_blocks.pop_back();
            if (open.index == NO_DIRECTIVE) continue;

            Directive d;
            d.ordinal = ordinal++;
            d.form = DirectiveForm::BlockEnd;
            d.source = comment->span;
            d.anchor = comment->span.end;
            d.trailing = comment->trailing;
            d.partner = out[open.index].ordinal;
            out[open.index].partner = d.ordinal;
            out.push_back(std::move(d));
            continue;
        }

        // Single-line directive
        auto attrs = parse_attributes(marker.rest);
        if (!attrs.ok) {
            flush();
            diagnostics.push_back(syntax_error(*comment, attrs.error));
            continue;
        }

        if (pending && continues_run(*pending, *comment)) {
            overlay(pending->directive.attributes, attrs.attributes);
            pending->directive.source.end = comment->span.end;
            pending->directive.anchor = comment->span.end;
            ++pending->run_length;
            continue;
        }

        flush();
        Pending run;
        run.directive.ordinal = ordinal++;
        run.directive.form = DirectiveForm::SingleLine;
        run.directive.attributes = std::move(attrs.attributes);
        run.directive.source = comment->span;
        run.directive.anchor = comment->span.end;
        run.directive.trailing = comment->trailing;
        run.style = comment->style;
        run.delimiter = comment->delimiter;
        run.run_length = 1;
        pending = std::move(run);
    }
    flush();

    if (!open_blocks.empty()) {
        Position eof = source_->position_of(source_->size());
        for (const auto& open : open_blocks) {
            Diagnostic diag;
            diag.kind = DiagnosticKind::UnbalancedBlock;
            diag.message = "@collab:begin still open at end of file";
            diag.position = eof;
            diag.related = open.start;
            diag.text = std::string(source_->line(open.start.line));
            diagnostics.push_back(std::move(diag));
            note_imbalance(open.start);
        }
    }

    // Block markers from the first imbalance onward are unreliable
    if (imbalance) {
        size_t dropped = 0;
        std::vector<Directive> kept;
        kept.reserve(out.size());
        for (auto& d : out) {
            bool block = d.form == DirectiveForm::BlockBegin || d.form == DirectiveForm::BlockEnd;
            if (block && d.source.start >= *imbalance) {
                ++dropped;
                continue;
            }
            kept.push_back(std::move(d));
        }
        out = std::move(kept);
        log_debug("parser", "discarded %zu block markers after imbalance at %s",
                  dropped, imbalance->to_string().c_str());
    }

    return out;
}

} // namespace collab
