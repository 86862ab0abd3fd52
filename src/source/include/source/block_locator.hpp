/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "source/source_buffer.hpp"

#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

namespace rpl::source {

    enum class BlockKind {
        Statement,
        TopStatement,
        Defun,
        Defclass,
        Group,
        Cell,
        Region,
        Buffer
    };

    std::string_view to_string(BlockKind kind);

    // Whole-line span of a buffer; lines are 0-based and inclusive.
    struct Block {
        BlockKind kind = BlockKind::Statement;
        size_t first_line = 0;
        size_t last_line = 0;
        size_t begin = 0; // offset of first_line
        size_t end = 0;   // end-of-line offset of last_line

        bool operator==(const Block&) const = default;
    };

    // Compiled cell delimiters. Every beginning must also be a boundary.
    class CellPatterns {
    public:
        CellPatterns();

        static core::Result<CellPatterns> compile(const std::string& boundary, const std::string& beginning);

        bool is_boundary(std::string_view line) const;
        bool is_beginning(std::string_view line) const;

    private:
        CellPatterns(std::regex boundary, std::regex beginning);

        std::regex boundary_;
        std::regex beginning_;
    };

    using HeaderPredicate = std::function<bool(LineKind)>;

    class BlockLocator {
    public:
        explicit BlockLocator(const SourceBuffer& buffer) : buffer_(buffer) {}

        // Innermost statement at pos, with else/elif/except/finally arms and decorator chains attached
        core::Result<Block> locate_statement(size_t pos) const;
        // Statement at pos, widened until it starts at column 0
        core::Result<Block> locate_top_statement(size_t pos) const;
        // Innermost enclosing definition whose header satisfies the predicate
        core::Result<Block> locate_definition(size_t pos, const HeaderPredicate& predicate) const;
        core::Result<Block> locate_defun(size_t pos) const;
        core::Result<Block> locate_defclass(size_t pos) const;
        // Top-level statements around pos not separated by blank lines
        core::Result<Block> locate_group(size_t pos) const;
        // Lines between the boundary at or above pos and the next boundary
        core::Result<Block> locate_cell(size_t pos, const CellPatterns& patterns) const;

        // [begin, end) widened to whole lines
        core::Result<Block> region(size_t begin, size_t end) const;
        core::Result<Block> whole_buffer() const;

        // Where point goes after the block has been sent: the next code line, or end of buffer
        size_t step_position(const Block& block) const;

    private:
        using Span = std::pair<size_t, size_t>;

        core::Result<Span> statement_span(size_t line) const;
        core::Result<Span> top_statement_span(size_t line) const;

        size_t block_end(size_t header) const;
        std::optional<size_t> forward_sibling(size_t line) const;
        std::optional<size_t> backward_sibling(size_t line) const;
        bool has_separator(size_t from, size_t to) const;

        Block make_block(BlockKind kind, size_t first, size_t last) const;

        const SourceBuffer& buffer_;
    };

} // namespace rpl::source
