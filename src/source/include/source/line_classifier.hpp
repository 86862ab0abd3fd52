/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <string_view>

namespace rpl::source {

    enum class LineKind {
        Blank,
        Comment,
        Decorator,
        DefHeader,
        ClassHeader,
        ElseElifContinuation, // else, elif, except, finally
        Code
    };

    inline constexpr int TAB_WIDTH = 8;

    // Pure function of the line text (without its newline). Precedence:
    // Decorator > DefHeader > ClassHeader > ElseElifContinuation > Code/Comment/Blank.
    LineKind classify(std::string_view line);

    // Column of the first non-whitespace character; tabs advance to the next multiple of TAB_WIDTH.
    int indentation(std::string_view line);

    // Byte length of the leading whitespace
    size_t indentation_bytes(std::string_view line);

    constexpr bool is_def_header(const LineKind kind) { return kind == LineKind::DefHeader; }
    constexpr bool is_class_header(const LineKind kind) { return kind == LineKind::ClassHeader; }
    constexpr bool is_definition(const LineKind kind) {
        return kind == LineKind::DefHeader || kind == LineKind::ClassHeader;
    }

    std::string_view to_string(LineKind kind);

} // namespace rpl::source
