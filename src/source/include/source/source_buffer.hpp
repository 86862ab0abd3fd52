/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "source/line_classifier.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rpl::source {

    struct LineInfo {
        size_t begin = 0; // offset of the first character
        size_t end = 0;   // offset of the newline (or end of text)
        int indent = 0;
        LineKind kind = LineKind::Blank;
        bool continuation = false; // starts inside brackets, a triple-quoted string or after a backslash
    };

    /**
     * Indexed, read-only view of a Python source text.
     *
     * Lines are split on '\n'; a trailing newline does not open an extra line.
     * Each line is classified once and marked when it continues the previous
     * logical line, so navigation never has to re-lex the text.
     */
    class SourceBuffer {
    public:
        explicit SourceBuffer(std::string text);

        const std::string& text() const { return text_; }
        size_t size() const { return text_.size(); }
        bool empty() const { return lines_.empty(); }

        size_t line_count() const { return lines_.size(); }
        const LineInfo& line(size_t index) const { return lines_[index]; }
        std::string_view line_text(size_t index) const;

        // Line containing offset; offsets past the end map to the last line.
        size_t line_at(size_t offset) const;

        // A code line starts a logical line and is neither blank nor comment-only.
        bool is_code(size_t index) const;
        // Blank and not inside a multi-line construct
        bool is_separator(size_t index) const;

        // First code line at or after `from`
        std::optional<size_t> next_code_line(size_t from) const;
        // Last code line strictly before `before`
        std::optional<size_t> prev_code_line(size_t before) const;

        // First line of the logical line containing `index`
        size_t logical_start(size_t index) const;
        // Last physical line of the logical line containing `index`
        size_t logical_end(size_t index) const;

    private:
        void index_lines();

        std::string text_;
        std::vector<LineInfo> lines_;
    };

} // namespace rpl::source
