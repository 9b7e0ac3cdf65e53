#pragma once
// Comment Extractor: lexical walk over source content
//
// SourceLexer splits content into code, string literal and comment
// segments. CommentCursor is a lazy, restartable walk that yields only
// the comments. Neither interprets comment text.

#include "language.hpp"
#include "source_text.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace collab {

enum class SegmentKind : uint8_t {
    Code,
    String,
    LineComment,
    BlockComment,
};

struct Segment {
    SegmentKind kind = SegmentKind::Code;
    size_t begin = 0;       // byte offset, inclusive
    size_t end = 0;         // byte offset, exclusive
    size_t body_begin = 0;  // comment text without delimiters
    size_t body_end = 0;
    std::string delimiter;  // comment opener ("//", "#", "/*", ...)

    bool is_comment() const {
        return kind == SegmentKind::LineComment || kind == SegmentKind::BlockComment;
    }
};

class SourceLexer {
public:
    SourceLexer(std::string_view content, const LanguageProfile& profile, size_t offset = 0)
        : content_(content), profile_(&profile), pos_(offset) {}

    // Next segment starting at the current offset; false at end of input
    bool next(Segment& out);

    // Restart from an offset that is known to be outside any literal or comment
    void seek(size_t offset) { pos_ = offset; }
    size_t offset() const { return pos_; }

private:
    std::string_view content_;
    const LanguageProfile* profile_;
    size_t pos_;

    bool starts_with(size_t pos, std::string_view s) const {
        return content_.compare(pos, s.size(), s) == 0;
    }
    bool at_line_start(size_t pos) const {
        return pos == 0 || content_[pos - 1] == '\n';
    }

    // Which segment would start at pos (Code = none)
    SegmentKind opener_at(size_t pos, std::string* delimiter) const;
    bool char_literal_at(size_t pos) const;

    size_t scan_string(size_t pos) const;
    size_t scan_line_comment(size_t pos, size_t delim_len, size_t& body_end) const;
    size_t scan_block_comment(size_t pos, size_t& body_end) const;
};

// ═══════════════════════════════════════════════════════════════════════════
// Comments
// ═══════════════════════════════════════════════════════════════════════════

enum class CommentStyle : uint8_t {
    Line,
    Block,
};

struct Comment {
    CommentStyle style = CommentStyle::Line;
    std::string delimiter;
    std::string text;    // raw text between the delimiters
    Span span;           // whole comment including delimiters
    bool trailing = false;  // code precedes it on the same line
};

class CommentCursor {
public:
    CommentCursor(const SourceText& source, const LanguageProfile& profile)
        : source_(&source), lexer_(source.content(), profile) {}

    std::optional<Comment> next();

    // Start over from the top of the file
    void reset() { lexer_.seek(0); }

private:
    const SourceText* source_;
    SourceLexer lexer_;
};

class CommentExtractor {
public:
    CommentExtractor(const SourceText& source, const LanguageProfile& profile)
        : source_(&source), profile_(&profile) {}

    // Each call returns an independent cursor positioned at the top
    CommentCursor cursor() const { return CommentCursor(*source_, *profile_); }

    std::vector<Comment> collect() const {
        std::vector<Comment> out;
        auto c = cursor();
        while (auto comment = c.next()) {
            out.push_back(std::move(*comment));
        }
        return out;
    }

    const LanguageProfile& profile() const { return *profile_; }

private:
    const SourceText* source_;
    const LanguageProfile* profile_;
};

} // namespace collab
