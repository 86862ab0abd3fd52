/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "source/block_locator.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"

#include <algorithm>
#include <climits>

namespace rpl::source {

    using core::ErrorKind;
    using core::make_error;
    using core::Result;

    std::string_view to_string(const BlockKind kind) {
        switch (kind) {
        case BlockKind::Statement: return "statement";
        case BlockKind::TopStatement: return "top-level statement";
        case BlockKind::Defun: return "function definition";
        case BlockKind::Defclass: return "class definition";
        case BlockKind::Group: return "group";
        case BlockKind::Cell: return "cell";
        case BlockKind::Region: return "region";
        case BlockKind::Buffer: return "buffer";
        }
        return "block";
    }

    // ---------------------------------------------------------------------
    // CellPatterns
    // ---------------------------------------------------------------------

    CellPatterns::CellPatterns()
        : CellPatterns(std::regex(core::param::DEFAULT_CELL_BOUNDARY_PATTERN),
                       std::regex(core::param::DEFAULT_CELL_BEGINNING_PATTERN)) {
    }

    CellPatterns::CellPatterns(std::regex boundary, std::regex beginning)
        : boundary_(std::move(boundary)),
          beginning_(std::move(beginning)) {
    }

    Result<CellPatterns> CellPatterns::compile(const std::string& boundary, const std::string& beginning) {
        try {
            return CellPatterns(std::regex(boundary), std::regex(beginning));
        } catch (const std::regex_error& e) {
            return make_error(ErrorKind::Configuration, "Invalid cell pattern: {}", e.what());
        }
    }

    bool CellPatterns::is_boundary(const std::string_view line) const {
        return std::regex_search(line.begin(), line.end(), boundary_);
    }

    bool CellPatterns::is_beginning(const std::string_view line) const {
        return std::regex_search(line.begin(), line.end(), beginning_);
    }

    // ---------------------------------------------------------------------
    // Structural primitives
    // ---------------------------------------------------------------------

    size_t BlockLocator::block_end(const size_t header) const {
        size_t end = buffer_.logical_end(header);
        const int indent = buffer_.line(header).indent;
        for (size_t i = end + 1; i < buffer_.line_count(); ++i) {
            if (!buffer_.is_code(i))
                continue;
            if (buffer_.line(i).indent <= indent)
                break;
            end = buffer_.logical_end(i);
            i = end;
        }
        return end;
    }

    std::optional<size_t> BlockLocator::forward_sibling(const size_t line) const {
        const auto next = buffer_.next_code_line(block_end(line) + 1);
        if (next && buffer_.line(*next).indent == buffer_.line(line).indent)
            return next;
        return std::nullopt;
    }

    std::optional<size_t> BlockLocator::backward_sibling(const size_t line) const {
        const int indent = buffer_.line(line).indent;
        size_t cursor = line;
        while (const auto prev = buffer_.prev_code_line(cursor)) {
            const int prev_indent = buffer_.line(*prev).indent;
            if (prev_indent == indent)
                return prev;
            if (prev_indent < indent)
                return std::nullopt;
            cursor = *prev;
        }
        return std::nullopt;
    }

    bool BlockLocator::has_separator(const size_t from, const size_t to) const {
        for (size_t i = from; i < to; ++i) {
            if (buffer_.is_separator(i))
                return true;
        }
        return false;
    }

    Block BlockLocator::make_block(const BlockKind kind, const size_t first, const size_t last) const {
        Block block;
        block.kind = kind;
        block.first_line = first;
        block.last_line = last;
        block.begin = buffer_.line(first).begin;
        block.end = buffer_.line(last).end;
        LOG_TRACE("Located {} at lines {}-{}", to_string(kind), first + 1, last + 1);
        return block;
    }

    // ---------------------------------------------------------------------
    // Statements
    // ---------------------------------------------------------------------

    Result<BlockLocator::Span> BlockLocator::statement_span(const size_t line) const {
        size_t start = buffer_.logical_start(line);
        if (!buffer_.is_code(start)) {
            const auto next = buffer_.next_code_line(start);
            if (!next)
                return make_error(ErrorKind::NoActiveBlock, "No statement at or after line {}", line + 1);
            start = *next;
        }

        const size_t limit = buffer_.line_count() + 1;

        // Climb to the head of an if/try chain and to the first decorator of a chain.
        size_t guard = 0;
        for (;; ++guard) {
            if (guard > limit)
                return make_error(ErrorKind::Navigation, "Statement start scan did not converge at line {}", start + 1);

            const auto kind = buffer_.line(start).kind;
            if (kind == LineKind::ElseElifContinuation) {
                const auto sibling = backward_sibling(start);
                if (!sibling)
                    break;
                start = *sibling;
                continue;
            }
            if (kind == LineKind::Decorator || is_definition(kind)) {
                const auto prev = buffer_.prev_code_line(start);
                if (prev && buffer_.line(*prev).kind == LineKind::Decorator &&
                    buffer_.line(*prev).indent == buffer_.line(start).indent) {
                    start = *prev;
                    continue;
                }
            }
            break;
        }

        // Walk forward through decorated headers and trailing arms.
        size_t cursor = start;
        for (guard = 0;; ++guard) {
            if (guard > limit)
                return make_error(ErrorKind::Navigation, "Statement end scan did not converge at line {}", cursor + 1);

            if (buffer_.line(cursor).kind == LineKind::Decorator) {
                const auto next = buffer_.next_code_line(buffer_.logical_end(cursor) + 1);
                if (!next || buffer_.line(*next).indent != buffer_.line(cursor).indent)
                    break;
                cursor = *next;
                continue;
            }
            const auto sibling = forward_sibling(cursor);
            if (sibling && buffer_.line(*sibling).kind == LineKind::ElseElifContinuation) {
                cursor = *sibling;
                continue;
            }
            break;
        }

        return Span{start, block_end(cursor)};
    }

    Result<BlockLocator::Span> BlockLocator::top_statement_span(const size_t line) const {
        auto span = statement_span(line);
        if (!span)
            return span;

        for (size_t guard = 0; buffer_.line(span->first).indent > 0; ++guard) {
            const auto prev = buffer_.prev_code_line(span->first);
            if (!prev || guard > buffer_.line_count())
                return make_error(ErrorKind::Navigation, "No top-level statement encloses line {}", line + 1);
            const auto outer = statement_span(*prev);
            if (!outer)
                return outer;
            if (outer->first >= span->first)
                return make_error(ErrorKind::Navigation, "Top-level scan made no progress at line {}", line + 1);
            span = outer;
        }
        return span;
    }

    Result<Block> BlockLocator::locate_statement(const size_t pos) const {
        if (buffer_.empty())
            return make_error(ErrorKind::NoActiveBlock, "Buffer is empty");
        const auto span = statement_span(buffer_.line_at(pos));
        if (!span)
            return std::unexpected(span.error());
        return make_block(BlockKind::Statement, span->first, span->second);
    }

    Result<Block> BlockLocator::locate_top_statement(const size_t pos) const {
        if (buffer_.empty())
            return make_error(ErrorKind::NoActiveBlock, "Buffer is empty");
        const auto span = top_statement_span(buffer_.line_at(pos));
        if (!span)
            return std::unexpected(span.error());
        return make_block(BlockKind::TopStatement, span->first, span->second);
    }

    // ---------------------------------------------------------------------
    // Definitions
    // ---------------------------------------------------------------------

    Result<Block> BlockLocator::locate_definition(const size_t pos, const HeaderPredicate& predicate) const {
        if (buffer_.empty())
            return make_error(ErrorKind::NoActiveBlock, "Buffer is empty");

        const size_t line = buffer_.logical_start(buffer_.line_at(pos));

        // On a decorator, the definition is the header it decorates.
        size_t candidate = line;
        while (buffer_.line(candidate).kind == LineKind::Decorator) {
            const auto next = buffer_.next_code_line(buffer_.logical_end(candidate) + 1);
            if (!next || buffer_.line(*next).indent != buffer_.line(candidate).indent)
                break;
            candidate = *next;
        }

        std::optional<size_t> header;
        if (buffer_.is_code(candidate) && predicate(buffer_.line(candidate).kind)) {
            header = candidate;
        } else {
            // Only headers strictly shallower than everything between them and
            // point enclose point; equal indentation would be a sibling.
            int min_indent = INT_MAX;
            if (buffer_.is_code(line)) {
                min_indent = buffer_.line(line).indent;
            } else if (const auto next = buffer_.next_code_line(line)) {
                min_indent = buffer_.line(*next).indent;
            }

            for (size_t i = line; i > 0 && min_indent > 0; --i) {
                const size_t current = i - 1;
                if (!buffer_.is_code(current))
                    continue;
                const int indent = buffer_.line(current).indent;
                if (indent >= min_indent)
                    continue;
                if (predicate(buffer_.line(current).kind)) {
                    header = current;
                    break;
                }
                min_indent = indent;
            }
        }

        if (!header)
            return make_error(ErrorKind::NoActiveBlock, "No enclosing definition at line {}", line + 1);

        size_t first = *header;
        while (const auto prev = buffer_.prev_code_line(first)) {
            if (buffer_.line(*prev).kind != LineKind::Decorator ||
                buffer_.line(*prev).indent != buffer_.line(*header).indent)
                break;
            first = *prev;
        }

        const auto kind = is_class_header(buffer_.line(*header).kind) ? BlockKind::Defclass : BlockKind::Defun;
        return make_block(kind, first, block_end(*header));
    }

    Result<Block> BlockLocator::locate_defun(const size_t pos) const {
        return locate_definition(pos, is_def_header);
    }

    Result<Block> BlockLocator::locate_defclass(const size_t pos) const {
        return locate_definition(pos, is_class_header);
    }

    // ---------------------------------------------------------------------
    // Groups and cells
    // ---------------------------------------------------------------------

    Result<Block> BlockLocator::locate_group(const size_t pos) const {
        if (buffer_.empty())
            return make_error(ErrorKind::NoActiveBlock, "Buffer is empty");
        auto top = top_statement_span(buffer_.line_at(pos));
        if (!top)
            return std::unexpected(top.error());

        auto [first, last] = *top;

        while (const auto prev = buffer_.prev_code_line(first)) {
            const auto outer = top_statement_span(*prev);
            if (!outer)
                return std::unexpected(outer.error());
            if (outer->first >= first)
                return make_error(ErrorKind::Navigation, "Group scan made no progress at line {}", first + 1);
            if (has_separator(outer->second + 1, first))
                break;
            first = outer->first;
        }

        while (const auto next = buffer_.next_code_line(last + 1)) {
            const auto outer = top_statement_span(*next);
            if (!outer)
                return std::unexpected(outer.error());
            if (outer->second <= last)
                return make_error(ErrorKind::Navigation, "Group scan made no progress at line {}", last + 1);
            if (has_separator(last + 1, outer->first))
                break;
            last = outer->second;
        }

        return make_block(BlockKind::Group, first, last);
    }

    Result<Block> BlockLocator::locate_cell(const size_t pos, const CellPatterns& patterns) const {
        if (buffer_.empty())
            return make_error(ErrorKind::NoActiveBlock, "Buffer is empty");

        const size_t line = buffer_.line_at(pos);

        std::optional<size_t> boundary;
        for (size_t i = line + 1; i > 0; --i) {
            if (patterns.is_boundary(buffer_.line_text(i - 1))) {
                boundary = i - 1;
                break;
            }
        }
        if (!boundary || !patterns.is_beginning(buffer_.line_text(*boundary)))
            return make_error(ErrorKind::NoActiveBlock, "Not in a cell");

        size_t last = buffer_.line_count() - 1;
        for (size_t i = line + 1; i < buffer_.line_count(); ++i) {
            if (patterns.is_boundary(buffer_.line_text(i))) {
                last = i - 1;
                break;
            }
        }

        const size_t first = *boundary + 1;
        if (first > last)
            return make_error(ErrorKind::NoActiveBlock, "Cell at line {} is empty", *boundary + 1);
        return make_block(BlockKind::Cell, first, last);
    }

    // ---------------------------------------------------------------------
    // Regions
    // ---------------------------------------------------------------------

    Result<Block> BlockLocator::region(size_t begin, size_t end) const {
        if (buffer_.empty())
            return make_error(ErrorKind::NoActiveBlock, "Buffer is empty");
        if (begin > end)
            std::swap(begin, end);

        const size_t first = buffer_.line_at(begin);
        size_t last = buffer_.line_at(end);
        // A region ending at the start of a line does not include that line.
        if (last > first && end == buffer_.line(last).begin)
            --last;
        return make_block(BlockKind::Region, first, last);
    }

    Result<Block> BlockLocator::whole_buffer() const {
        if (buffer_.empty())
            return make_error(ErrorKind::NoActiveBlock, "Buffer is empty");
        return make_block(BlockKind::Buffer, 0, buffer_.line_count() - 1);
    }

    size_t BlockLocator::step_position(const Block& block) const {
        if (const auto next = buffer_.next_code_line(block.last_line + 1))
            return buffer_.line(*next).begin;
        return buffer_.size();
    }

} // namespace rpl::source
