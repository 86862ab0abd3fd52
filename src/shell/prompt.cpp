/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "prompt.hpp"

namespace rpl::shell {

    core::Result<PromptMatcher> PromptMatcher::compile(const std::vector<std::string>& patterns) {
        if (patterns.empty())
            return core::make_error(core::ErrorKind::Configuration, "At least one prompt pattern is required");

        PromptMatcher matcher;
        for (const auto& pattern : patterns) {
            try {
                matcher.patterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::optimize);
            } catch (const std::regex_error& e) {
                return core::make_error(core::ErrorKind::Configuration, "Invalid prompt pattern '{}': {}", pattern, e.what());
            }
        }
        return matcher;
    }

    std::optional<size_t> PromptMatcher::find(const std::string_view text) const {
        const size_t newline = text.rfind('\n');
        const size_t start = newline == std::string_view::npos ? 0 : newline + 1;
        const std::string_view last_line = text.substr(start);
        if (last_line.empty())
            return std::nullopt;

        for (const auto& pattern : patterns_) {
            if (std::regex_match(last_line.begin(), last_line.end(), pattern))
                return start;
        }
        return std::nullopt;
    }

    std::optional<size_t> PromptMatcher::find_first(const std::string_view text) const {
        size_t line = 0;
        while (line < text.size()) {
            for (const auto& pattern : patterns_) {
                std::match_results<std::string_view::const_iterator> match;
                if (std::regex_search(text.begin() + line, text.end(), match, pattern,
                                      std::regex_constants::match_continuous) &&
                    match.length(0) > 0)
                    return line + static_cast<size_t>(match.length(0));
            }
            const size_t newline = text.find('\n', line);
            if (newline == std::string_view::npos)
                break;
            line = newline + 1;
        }
        return std::nullopt;
    }

} // namespace rpl::shell
