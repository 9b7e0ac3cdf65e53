#include <collab/comment_extractor.hpp>

namespace collab {

namespace {

// Length of the UTF-8 sequence introduced by lead byte c
size_t utf8_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// SourceLexer
// ═══════════════════════════════════════════════════════════════════════════

// 'x', '\n', '\u{1F600}' are char literals; Rust lifetimes ('a) are not
bool SourceLexer::char_literal_at(size_t pos) const {
    size_t n = content_.size();
    if (pos + 1 >= n) return false;
    char c = content_[pos + 1];
    if (c == '\n' || c == '\'') return false;
    if (c == '\\') {
        for (size_t i = pos + 2; i < n && i < pos + 14; ++i) {
            if (content_[i] == '\n') return false;
            if (content_[i] == '\'' && i > pos + 2) return true;
        }
        return false;
    }
    size_t close = pos + 1 + utf8_length(static_cast<unsigned char>(c));
    return close < n && content_[close] == '\'';
}

SegmentKind SourceLexer::opener_at(size_t pos, std::string* delimiter) const {
    const auto& p = *profile_;

    if (!p.block_open.empty() && starts_with(pos, p.block_open) &&
        (!p.block_at_line_start || at_line_start(pos))) {
        if (delimiter) *delimiter = p.block_open;
        return SegmentKind::BlockComment;
    }
    for (const auto& lc : p.line_comments) {
        if (starts_with(pos, lc)) {
            if (delimiter) *delimiter = lc;
            return SegmentKind::LineComment;
        }
    }

    char c = content_[pos];
    if (c == '\'' && p.char_literals) {
        return char_literal_at(pos) ? SegmentKind::String : SegmentKind::Code;
    }
    if (p.quotes.find(c) != std::string::npos) {
        return SegmentKind::String;
    }
    return SegmentKind::Code;
}

// Returns the offset just past the closing quote. An unterminated
// single-line string ends at the newline so one bad literal cannot
// swallow the rest of the file.
size_t SourceLexer::scan_string(size_t pos) const {
    const size_t n = content_.size();
    const char q = content_[pos];

    if (profile_->triple_quotes && pos + 2 < n &&
        content_[pos + 1] == q && content_[pos + 2] == q) {
        const char closing[] = {q, q, q};
        std::string_view close(closing, 3);
        size_t i = pos + 3;
        while (i < n) {
            if (content_[i] == '\\') { i += 2; continue; }
            if (starts_with(i, close)) return i + 3;
            ++i;
        }
        return n;
    }

    const bool raw = (q == '`' && profile_->tag == "go");
    const bool multiline = (q == '`');
    size_t i = pos + 1;
    while (i < n) {
        char c = content_[i];
        if (c == '\\' && !raw) { i += 2; continue; }
        if (c == q) return i + 1;
        if (c == '\n' && !multiline) return i;
        ++i;
    }
    return n;
}

size_t SourceLexer::scan_line_comment(size_t pos, size_t delim_len, size_t& body_end) const {
    size_t nl = content_.find('\n', pos + delim_len);
    size_t end = nl == std::string_view::npos ? content_.size() : nl;
    body_end = end;
    if (body_end > pos + delim_len && content_[body_end - 1] == '\r') --body_end;
    return end;
}

size_t SourceLexer::scan_block_comment(size_t pos, size_t& body_end) const {
    const auto& p = *profile_;
    const size_t n = content_.size();

    if (p.block_at_line_start) {
        // =begin ... =end: the closer owns the rest of its line
        size_t i = content_.find('\n', pos);
        while (i != std::string_view::npos) {
            if (starts_with(i + 1, p.block_close)) {
                body_end = i + 1;
                size_t nl = content_.find('\n', i + 1);
                return nl == std::string_view::npos ? n : nl;
            }
            i = content_.find('\n', i + 1);
        }
        body_end = n;
        return n;
    }

    int depth = 1;
    size_t i = pos + p.block_open.size();
    while (i < n) {
        if (p.nested_block_comments && starts_with(i, p.block_open)) {
            ++depth;
            i += p.block_open.size();
            continue;
        }
        if (starts_with(i, p.block_close)) {
            if (--depth == 0) {
                body_end = i;
                return i + p.block_close.size();
            }
            i += p.block_close.size();
            continue;
        }
        ++i;
    }
    body_end = n;
    return n;
}

bool SourceLexer::next(Segment& out) {
    const size_t n = content_.size();
    if (pos_ >= n) return false;

    std::string delimiter;
    SegmentKind kind = opener_at(pos_, &delimiter);

    out = Segment{};
    out.kind = kind;
    out.begin = pos_;

    switch (kind) {
        case SegmentKind::String:
            out.end = scan_string(pos_);
            break;
        case SegmentKind::LineComment:
            out.body_begin = pos_ + delimiter.size();
            out.end = scan_line_comment(pos_, delimiter.size(), out.body_end);
            out.delimiter = std::move(delimiter);
            break;
        case SegmentKind::BlockComment:
            out.body_begin = pos_ + delimiter.size();
            out.end = scan_block_comment(pos_, out.body_end);
            out.delimiter = std::move(delimiter);
            break;
        case SegmentKind::Code: {
            size_t i = pos_ + 1;
            while (i < n && opener_at(i, nullptr) == SegmentKind::Code) ++i;
            out.end = i;
            break;
        }
    }

    if (out.end <= pos_) out.end = pos_ + 1;
    pos_ = out.end;
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// CommentCursor
// ═══════════════════════════════════════════════════════════════════════════

std::optional<Comment> CommentCursor::next() {
    Segment seg;
    while (lexer_.next(seg)) {
        if (!seg.is_comment()) continue;

        Comment c;
        c.style = seg.kind == SegmentKind::LineComment ? CommentStyle::Line : CommentStyle::Block;
        c.delimiter = seg.delimiter;
        auto content = source_->content();
        if (seg.body_end > seg.body_begin) {
            c.text = std::string(content.substr(seg.body_begin, seg.body_end - seg.body_begin));
        }
        c.span.start = source_->position_of(seg.begin);
        c.span.end = source_->position_of(seg.end);

        // Strip a trailing '\r' from the reported end of a line comment
        if (c.style == CommentStyle::Line) {
            c.span.end = source_->end_of_line(c.span.start.line);
        }

        auto line = source_->line(c.span.start.line);
        for (size_t i = 0; i + 1 < c.span.start.column && i < line.size(); ++i) {
            if (line[i] != ' ' && line[i] != '\t') {
                c.trailing = true;
                break;
            }
        }
        return c;
    }
    return std::nullopt;
}

} // namespace collab
