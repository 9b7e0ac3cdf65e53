#pragma once
// SourceText: file content with a line table
//
// Maps byte offsets to 1-based positions and back. Lines are split on
// '\n'; a trailing '\r' is not part of the line text.

#include "types.hpp"
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace collab {

class SourceText {
public:
    explicit SourceText(std::string_view content) : content_(content) {
        line_starts_.push_back(0);
        for (size_t i = 0; i < content_.size(); ++i) {
            if (content_[i] == '\n') line_starts_.push_back(i + 1);
        }
    }

    std::string_view content() const { return content_; }
    size_t size() const { return content_.size(); }
    size_t line_count() const { return line_starts_.size(); }

    // Line text without its terminator; empty for out-of-range lines
    std::string_view line(size_t line_no) const {
        if (line_no == 0 || line_no > line_starts_.size()) return {};
        size_t begin = line_starts_[line_no - 1];
        size_t end = line_no < line_starts_.size() ? line_starts_[line_no] - 1 : content_.size();
        if (end > begin && content_[end - 1] == '\r') --end;
        return content_.substr(begin, end - begin);
    }

    size_t line_start_offset(size_t line_no) const {
        if (line_no == 0) return 0;
        if (line_no > line_starts_.size()) return content_.size();
        return line_starts_[line_no - 1];
    }

    Position position_of(size_t offset) const {
        offset = std::min(offset, content_.size());
        auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
        size_t line_idx = static_cast<size_t>(it - line_starts_.begin()) - 1;
        return {line_idx + 1, offset - line_starts_[line_idx] + 1};
    }

    size_t offset_of(const Position& p) const {
        if (p.line == 0) return 0;
        if (p.line > line_starts_.size()) return content_.size();
        size_t off = line_starts_[p.line - 1] + (p.column > 0 ? p.column - 1 : 0);
        return std::min(off, content_.size());
    }

    // Position just past the last character of the line
    Position end_of_line(size_t line_no) const {
        return {line_no, line(line_no).size() + 1};
    }

    bool is_blank(size_t line_no) const {
        for (char c : line(line_no)) {
            if (c != ' ' && c != '\t' && c != '\f' && c != '\v') return false;
        }
        return true;
    }

    // Column of the first non-blank character (1-based), or line length + 1
    size_t first_code_column(size_t line_no) const {
        auto text = line(line_no);
        size_t i = 0;
        while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) ++i;
        return i + 1;
    }

    // Visual indentation width; tabs advance to the next multiple of 8
    size_t indentation(size_t line_no) const {
        size_t width = 0;
        for (char c : line(line_no)) {
            if (c == ' ') {
                ++width;
            } else if (c == '\t') {
                width = (width / 8 + 1) * 8;
            } else {
                break;
            }
        }
        return width;
    }

private:
    std::string_view content_;
    std::vector<size_t> line_starts_;
};

} // namespace collab
