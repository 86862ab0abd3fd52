/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace rpl::shell {

    // Recognizes an interpreter prompt as the unterminated last line of some output.
    class PromptMatcher {
    public:
        PromptMatcher() = default;

        static core::Result<PromptMatcher> compile(const std::vector<std::string>& patterns);

        // Offset where the trailing prompt line starts, if text ends with a prompt
        std::optional<size_t> find(std::string_view text) const;
        bool ends_with_prompt(std::string_view text) const { return find(text).has_value(); }
        // End offset of the first prompt that begins a line, followed by output or not
        std::optional<size_t> find_first(std::string_view text) const;

    private:
        std::vector<std::regex> patterns_;
    };

} // namespace rpl::shell
