/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "source/block_locator.hpp"
#include "source/source_buffer.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace rpl::source {

    inline constexpr std::string_view TRUNCATION_MARKER = "  ...";
    inline constexpr std::string_view UTF8_CODING_COOKIE = "# -*- coding: utf-8 -*-\n";
    inline constexpr std::string_view BLOCK_GUARD = "if True:\n";

    // Shifts code left by the indentation of its first code line. Fails with
    // MalformedBlock when a later code line sits left of the first one.
    core::Result<std::string> dedent(std::string_view code);

    // Removes everything a send wraps around user code: loader preambles,
    // a leading coding cookie, leading blank lines and the block guard.
    std::string strip_bootstrap(std::string_view code);

    // Keeps the first `head` and last `tail` lines around a single marker line.
    std::string truncate_for_display(std::string_view text, size_t head, size_t tail);

    // PEP 263 declaration in the first two lines, "utf-8" when absent.
    std::string detect_encoding(std::string_view text);

    /**
     * Extracts a block as interpreter input with its original line numbers.
     *
     * The text is preceded by one newline per line above the block so tracebacks
     * point at the right line. An indented first statement gets BLOCK_GUARD,
     * non-ASCII text gets UTF8_CODING_COOKIE; both take the place of padding
     * lines where there are any.
     */
    std::string prepare_region(const SourceBuffer& buffer, const Block& block);

    // Escapes a value for use inside a ''' quoted Python string.
    std::string python_quote(std::string_view value);

    /**
     * One-line interpreter command that loads code from temp_file, deletes the
     * file, executes it under display_name and evaluates a trailing expression
     * so its value is shown.
     *
     * Unless keep_main_guard is set, top-level `if __name__ ...` blocks are
     * dropped. A body consisting of a single BLOCK_GUARD conditional is unwrapped
     * first.
     */
    std::string build_bootstrap(const std::filesystem::path& temp_file,
                                std::string_view encoding,
                                std::string_view display_name,
                                bool keep_main_guard);

} // namespace rpl::source
