/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "source/line_classifier.hpp"

#include <regex>

namespace rpl::source {

    namespace {

        constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::optimize;

        const std::regex& decorator_re() {
            static const std::regex re(R"(^[ \t]*@[A-Za-z_])", REGEX_FLAGS);
            return re;
        }

        const std::regex& def_re() {
            static const std::regex re(R"(^[ \t]*(?:async[ \t]+)?def[ \t])", REGEX_FLAGS);
            return re;
        }

        const std::regex& class_re() {
            static const std::regex re(R"(^[ \t]*class[ \t])", REGEX_FLAGS);
            return re;
        }

        const std::regex& else_elif_re() {
            static const std::regex re(R"(^[ \t]*(?:else[ \t]*:|elif\b|except\b|finally[ \t]*:))", REGEX_FLAGS);
            return re;
        }

        bool matches(const std::regex& re, const std::string_view line) {
            return std::regex_search(line.begin(), line.end(), re);
        }

    } // namespace

    LineKind classify(const std::string_view line) {
        if (matches(decorator_re(), line))
            return LineKind::Decorator;
        if (matches(def_re(), line))
            return LineKind::DefHeader;
        if (matches(class_re(), line))
            return LineKind::ClassHeader;
        if (matches(else_elif_re(), line))
            return LineKind::ElseElifContinuation;

        const size_t first = line.find_first_not_of(" \t\f\v\r");
        if (first == std::string_view::npos)
            return LineKind::Blank;
        if (line[first] == '#')
            return LineKind::Comment;
        return LineKind::Code;
    }

    int indentation(const std::string_view line) {
        int column = 0;
        for (const char c : line) {
            if (c == ' ') {
                ++column;
            } else if (c == '\t') {
                column = (column / TAB_WIDTH + 1) * TAB_WIDTH;
            } else if (c == '\f' || c == '\v') {
                // form feeds reset nothing and take no column
            } else {
                break;
            }
        }
        return column;
    }

    size_t indentation_bytes(const std::string_view line) {
        const size_t first = line.find_first_not_of(" \t\f\v");
        return first == std::string_view::npos ? line.size() : first;
    }

    std::string_view to_string(const LineKind kind) {
        switch (kind) {
        case LineKind::Blank: return "blank";
        case LineKind::Comment: return "comment";
        case LineKind::Decorator: return "decorator";
        case LineKind::DefHeader: return "def";
        case LineKind::ClassHeader: return "class";
        case LineKind::ElseElifContinuation: return "else/elif";
        case LineKind::Code: return "code";
        }
        return "code";
    }

} // namespace rpl::source
