#include <collab/scope_detector.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

namespace collab {

namespace {

bool is_blank_char(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// Per-line classification for the offside rule
enum LineFlag : uint8_t {
    LINE_NORMAL = 0,
    LINE_CONTINUATION = 1,  // starts inside an open bracket or multi-line string
    LINE_IGNORED = 2,       // inside a multi-line comment
};

} // namespace

ScopeOutcome ScopeDetector::detect(const Position& anchor) const {
    if (profile_->style == ScopeStyle::ExplicitMarkerOnly) {
        return ScopeOutcome::none();
    }

    auto decl = find_declaration(source_->offset_of(anchor));
    if (!decl) return ScopeOutcome::none();

    switch (profile_->style) {
        case ScopeStyle::Brace: {
            char c = source_->content()[*decl];
            // The enclosing construct closes before anything is declared
            if (c == '}' || c == ')' || c == ']') return ScopeOutcome::none();
            return brace_scope(*decl);
        }
        case ScopeStyle::Indentation:
            return indentation_scope(*decl);
        case ScopeStyle::ExplicitMarkerOnly:
            break;
    }
    return ScopeOutcome::none();
}

Scope ScopeDetector::own_line(const Directive& directive) const {
    size_t first = directive.source.start.line;
    size_t last = directive.source.end.line;
    return {{first, source_->first_code_column(first)}, source_->end_of_line(last)};
}

Scope ScopeDetector::trailing_line(const Directive& directive) const {
    const size_t line_no = directive.source.start.line;
    const size_t comment_col = directive.source.start.column;
    const auto& word = profile_->block_terminator;
    auto line = source_->line(line_no);

    // Closers at the front of the line finish the construct above
    size_t col = source_->first_code_column(line_no);
    while (col < comment_col && col <= line.size()) {
        char c = line[col - 1];
        if (std::strchr("})];, \t", c) != nullptr) {
            ++col;
            continue;
        }
        size_t after = col - 1 + word.size();
        if (!word.empty() && line.compare(col - 1, word.size(), word) == 0 &&
            (after >= line.size() || !(std::isalnum(static_cast<unsigned char>(line[after])) ||
                                       line[after] == '_'))) {
            col += word.size();
            continue;
        }
        break;
    }
    return {{line_no, std::min(col, comment_col)}, source_->end_of_line(directive.source.end.line)};
}

std::optional<size_t> ScopeDetector::find_declaration(size_t offset) const {
    auto content = source_->content();
    SourceLexer lexer(content, *profile_, offset);
    Segment seg;
    while (lexer.next(seg)) {
        if (seg.is_comment()) continue;
        if (seg.kind == SegmentKind::String) return seg.begin;
        for (size_t i = seg.begin; i < seg.end; ++i) {
            if (!is_blank_char(content[i])) return i;
        }
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Brace style
// ═══════════════════════════════════════════════════════════════════════════

ScopeOutcome ScopeDetector::brace_scope(size_t decl) const {
    auto content = source_->content();
    SourceLexer lexer(content, *profile_, decl);

    int parens = 0;   // ( and [ nesting; braces inside them are expression braces
    int braces = 0;
    bool opened = false;
    bool line_has_content = true;
    bool line_has_code = true;
    bool annotation = content[decl] == '@';  // @Decorator / @Annotation lines lead a declaration
    char last = 0, prev = 0;                 // last two code characters
    size_t last_code_end = decl;
    const Position start = source_->position_of(decl);

    auto finish = [&](size_t end) {
        return ScopeOutcome::found({start, source_->position_of(end)});
    };

    // Newline-terminated languages: a line break at depth 0 ends a
    // body-less declaration unless the expression visibly continues
    auto line_ends_statement = [&](size_t newline) {
        if (!profile_->newline_statements || !line_has_code || annotation) return false;
        if (last != 0 && std::strchr("=+-*/%&|^,.:\\", last) != nullptr) return false;
        if (last == '>' && prev == '=') return false;
        size_t j = newline + 1;
        while (j < content.size() && (content[j] == ' ' || content[j] == '\t')) ++j;
        return j >= content.size() || content[j] != '.';
    };

    Segment seg;
    while (lexer.next(seg)) {
        if (seg.is_comment()) {
            line_has_content = true;
            continue;
        }
        if (seg.kind == SegmentKind::String) {
            line_has_content = true;
            line_has_code = true;
            prev = last;
            last = '"';
            last_code_end = seg.end;
            continue;
        }

        for (size_t i = seg.begin; i < seg.end; ++i) {
            const char c = content[i];
            if (c == '\n') {
                if (!opened && parens == 0) {
                    // A blank line ends a body-less declaration
                    if (!line_has_content) return finish(last_code_end);
                    if (line_ends_statement(i)) return finish(last_code_end);
                }
                line_has_content = false;
                if (parens == 0) {
                    line_has_code = false;
                    annotation = false;
                }
                continue;
            }
            if (is_blank_char(c)) continue;
            line_has_content = true;
            if (!line_has_code && parens == 0) annotation = c == '@';
            line_has_code = true;
            prev = last;
            last = c;

            switch (c) {
                case '(':
                case '[':
                    ++parens;
                    break;
                case ')':
                case ']':
                    if (parens > 0) {
                        --parens;
                    } else if (!opened) {
                        return finish(last_code_end);
                    }
                    break;
                case '{':
                    if (parens == 0) {
                        ++braces;
                        opened = true;
                    }
                    break;
                case '}':
                    if (parens == 0) {
                        if (braces == 0) return finish(last_code_end);
                        if (--braces == 0) return finish(i + 1);
                    }
                    break;
                case ';':
                    if (parens == 0 && braces == 0) return finish(i + 1);
                    break;
                default:
                    break;
            }
            last_code_end = i + 1;
        }
    }

    if (opened) {
        return ScopeOutcome::failure("no matching '}' for declaration at line " +
                                     std::to_string(start.line));
    }
    if (parens > 0) {
        return ScopeOutcome::failure("unclosed bracket in declaration at line " +
                                     std::to_string(start.line));
    }
    return finish(last_code_end);
}

// ═══════════════════════════════════════════════════════════════════════════
// Indentation style
// ═══════════════════════════════════════════════════════════════════════════

bool ScopeDetector::comment_only_line(size_t line_no) const {
    auto line = source_->line(line_no);
    size_t col = source_->first_code_column(line_no) - 1;
    for (const auto& lc : profile_->line_comments) {
        if (line.compare(col, lc.size(), lc) == 0) return true;
    }
    return false;
}

bool ScopeDetector::starts_with_word(size_t line_no, const std::string& word) const {
    if (word.empty()) return false;
    auto line = source_->line(line_no);
    size_t col = source_->first_code_column(line_no) - 1;
    if (line.compare(col, word.size(), word) != 0) return false;
    size_t after = col + word.size();
    if (after >= line.size()) return true;
    unsigned char c = static_cast<unsigned char>(line[after]);
    return !(std::isalnum(c) || c == '_');
}

bool ScopeDetector::starts_with_clause(size_t line_no) const {
    for (const auto& word : profile_->clause_keywords) {
        if (starts_with_word(line_no, word)) return true;
    }
    return false;
}

ScopeOutcome ScopeDetector::indentation_scope(size_t decl) const {
    auto content = source_->content();
    const size_t line_count = source_->line_count();
    const Position start = source_->position_of(decl);

    // Mark lines that continue an expression, string or comment
    std::vector<uint8_t> flags(line_count + 2, LINE_NORMAL);
    int depth = 0;
    {
        SourceLexer lexer(content, *profile_, decl);
        Segment seg;
        while (lexer.next(seg)) {
            if (seg.kind == SegmentKind::Code) {
                for (size_t i = seg.begin; i < seg.end; ++i) {
                    char c = content[i];
                    if (c == '(' || c == '[' || c == '{') {
                        ++depth;
                    } else if ((c == ')' || c == ']' || c == '}') && depth > 0) {
                        --depth;
                    } else if (c == '\n' && depth > 0) {
                        size_t next_line = source_->position_of(i + 1).line;
                        if (next_line <= line_count) flags[next_line] = LINE_CONTINUATION;
                    }
                }
                continue;
            }
            size_t first = source_->position_of(seg.begin).line;
            size_t last = source_->position_of(seg.end).line;
            uint8_t flag = seg.kind == SegmentKind::String ? LINE_CONTINUATION : LINE_IGNORED;
            for (size_t l = first + 1; l <= last && l <= line_count; ++l) {
                if (flags[l] == LINE_NORMAL) flags[l] = flag;
            }
        }
    }

    const size_t base = source_->indentation(start.line);

    // Skip to the next line that opens a statement at the base indentation
    auto next_statement = [&](size_t from) -> size_t {
        for (size_t l = from; l <= line_count; ++l) {
            if (flags[l] != LINE_NORMAL) continue;
            if (source_->is_blank(l) || comment_only_line(l)) continue;
            return l;
        }
        return 0;
    };

    // Decorators (@name ...) belong to the definition below them
    size_t header = start.line;
    while (source_->line(header).substr(source_->first_code_column(header) - 1, 1) == "@") {
        size_t next = next_statement(header + 1);
        if (next == 0 || source_->indentation(next) != base) break;
        header = next;
    }

    size_t end_line = header;
    bool has_body = false;
    bool closed = false;
    bool reached_eof = true;

    for (size_t l = header + 1; l <= line_count; ++l) {
        if (flags[l] == LINE_CONTINUATION) {
            end_line = l;
            continue;
        }
        if (flags[l] == LINE_IGNORED) continue;
        if (source_->is_blank(l) || comment_only_line(l)) continue;

        size_t indent = source_->indentation(l);
        if (indent > base) {
            end_line = l;
            has_body = true;
            continue;
        }
        if (has_body && indent == base && starts_with_clause(l)) {
            end_line = l;
            continue;
        }
        if (has_body && indent == base && starts_with_word(l, profile_->block_terminator)) {
            end_line = l;
            closed = true;
        }
        reached_eof = false;
        break;
    }

    if (reached_eof && depth > 0) {
        return ScopeOutcome::failure("unclosed bracket in statement at line " +
                                     std::to_string(start.line));
    }
    if (!profile_->block_terminator.empty() && has_body && !closed) {
        return ScopeOutcome::failure("block at line " + std::to_string(start.line) +
                                     " never reaches '" + profile_->block_terminator + "'");
    }

    return ScopeOutcome::found({start, source_->end_of_line(end_line)});
}

} // namespace collab
