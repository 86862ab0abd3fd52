/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "source/source_buffer.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace rpl::source {

    namespace {

        // Lexical state carried from one physical line to the next
        struct LexState {
            int depth = 0;
            char quote = 0; // 0 when outside a string
            bool triple = false;
            bool backslash = false;

            bool open() const { return depth > 0 || (quote != 0 && triple) || backslash; }
        };

        void scan_line(std::string_view line, LexState& state) {
            state.backslash = false;
            size_t i = 0;
            while (i < line.size()) {
                const char c = line[i];
                if (state.quote != 0) {
                    if (c == '\\') {
                        if (i + 1 == line.size()) {
                            state.backslash = !state.triple;
                            return;
                        }
                        i += 2;
                        continue;
                    }
                    if (c == state.quote) {
                        if (!state.triple) {
                            state.quote = 0;
                        } else if (line.substr(i, 3) == std::string(3, state.quote)) {
                            state.quote = 0;
                            state.triple = false;
                            i += 3;
                            continue;
                        }
                    }
                    ++i;
                    continue;
                }

                switch (c) {
                case '#':
                    return;
                case '\'':
                case '"':
                    state.quote = c;
                    state.triple = line.substr(i, 3) == std::string(3, c);
                    i += state.triple ? 3 : 1;
                    continue;
                case '(':
                case '[':
                case '{':
                    ++state.depth;
                    break;
                case ')':
                case ']':
                case '}':
                    state.depth = std::max(0, state.depth - 1);
                    break;
                case '\\':
                    if (i + 1 == line.size()) {
                        state.backslash = true;
                        return;
                    }
                    break;
                default:
                    break;
                }
                ++i;
            }
            // An unterminated single-quoted string ends with its line.
            if (state.quote != 0 && !state.triple && !state.backslash)
                state.quote = 0;
        }

    } // namespace

    SourceBuffer::SourceBuffer(std::string text) : text_(std::move(text)) {
        LOG_TIMER_TRACE("index source lines");
        index_lines();
    }

    void SourceBuffer::index_lines() {
        lines_.clear();
        LexState state;
        size_t begin = 0;
        while (begin < text_.size()) {
            size_t end = text_.find('\n', begin);
            if (end == std::string::npos)
                end = text_.size();

            const std::string_view content(text_.data() + begin, end - begin);
            LineInfo info;
            info.begin = begin;
            info.end = end;
            info.indent = indentation(content);
            info.kind = classify(content);
            info.continuation = state.open();
            scan_line(content, state);
            lines_.push_back(info);

            begin = end + 1;
        }
    }

    std::string_view SourceBuffer::line_text(const size_t index) const {
        const auto& info = lines_[index];
        return std::string_view(text_).substr(info.begin, info.end - info.begin);
    }

    size_t SourceBuffer::line_at(const size_t offset) const {
        if (lines_.empty())
            return 0;
        const auto it = std::upper_bound(lines_.begin(), lines_.end(), offset,
                                         [](const size_t value, const LineInfo& info) { return value < info.begin; });
        if (it == lines_.begin())
            return 0;
        return static_cast<size_t>(std::distance(lines_.begin(), it)) - 1;
    }

    bool SourceBuffer::is_code(const size_t index) const {
        const auto& info = lines_[index];
        return !info.continuation && info.kind != LineKind::Blank && info.kind != LineKind::Comment;
    }

    bool SourceBuffer::is_separator(const size_t index) const {
        const auto& info = lines_[index];
        return !info.continuation && info.kind == LineKind::Blank;
    }

    std::optional<size_t> SourceBuffer::next_code_line(const size_t from) const {
        for (size_t i = from; i < lines_.size(); ++i) {
            if (is_code(i))
                return i;
        }
        return std::nullopt;
    }

    std::optional<size_t> SourceBuffer::prev_code_line(const size_t before) const {
        for (size_t i = std::min(before, lines_.size()); i > 0; --i) {
            if (is_code(i - 1))
                return i - 1;
        }
        return std::nullopt;
    }

    size_t SourceBuffer::logical_start(size_t index) const {
        while (index > 0 && lines_[index].continuation)
            --index;
        return index;
    }

    size_t SourceBuffer::logical_end(size_t index) const {
        while (index + 1 < lines_.size() && lines_[index + 1].continuation)
            ++index;
        return index;
    }

} // namespace rpl::source
