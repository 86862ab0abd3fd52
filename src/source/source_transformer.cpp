/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "source/source_transformer.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <regex>
#include <vector>

namespace rpl::source {

    using core::ErrorKind;
    using core::make_error;

    namespace {

        constexpr std::string_view FILE_LOAD_PREAMBLE =
            "import codecs, os, ast;"
            "__pyfile = codecs.open('''{0}''', encoding='''{1}''');"
            "__code = __pyfile.read();"
            "__pyfile.close();"
            "os.remove('''{0}''');";

        constexpr std::string_view EVAL_COMMAND =
            "__block = ast.parse(__code, '''{0}''', mode='exec');"
            "__block.body = (__block.body[0].body if len(__block.body) == 1"
            " and isinstance(__block.body[0], ast.If) and not __block.body[0].orelse"
            " and isinstance(__block.body[0].test, ast.Constant)"
            " and __block.body[0].test.value is True else __block.body);"
            "__block.body = [__n for __n in __block.body if {1} or not (isinstance(__n, ast.If)"
            " and isinstance(__n.test, ast.Compare) and isinstance(__n.test.left, ast.Name)"
            " and __n.test.left.id == '__name__')];"
            "__last = __block.body.pop() if __block.body and isinstance(__block.body[-1], ast.Expr) else None;"
            "exec(compile(__block, '''{0}''', 'exec'));"
            "eval(compile(ast.Expression(__last.value), '''{0}''', 'eval')) if __last is not None else None\n";

        struct StripRule {
            std::regex pattern;
            const char* name;
        };

        const std::array<StripRule, 5>& strip_rules() {
            static const std::array<StripRule, 5> rules = {{
                {std::regex(R"(import codecs, os(?:, ast)?;__pyfile = codecs\.open\('''(?:[^']|'(?!''))*''', )"
                            R"(encoding='''[^']*'''\);__code = __pyfile\.read\(\)(?:\.encode\('''[^']*'''\))?;)"
                            R"(__pyfile\.close\(\);os\.remove\('''(?:[^']|'(?!''))*'''\);)"),
                 "file-load preamble"},
                {std::regex(R"((?:__block = ast\.parse\(__code, |exec\(compile\(__code, )[^\n]*\n?)"),
                 "compile preamble"},
                {std::regex(R"(^[ \t\f]*#[^\n]*?coding[:=][ \t]*[-\w.]+[^\n]*(?:\n|$))"), "coding cookie"},
                {std::regex(R"(^(?:[ \t\f]*\n)+)"), "leading blank lines"},
                {std::regex(R"(^if True:[ \t]*\n(?=[ \t]))"), "block guard"},
            }};
            return rules;
        }

        const std::regex& coding_re() {
            static const std::regex re(R"(^[ \t\f]*#.*?coding[:=][ \t]*([-\w.]+))");
            return re;
        }

        // Splits on '\n'; a trailing newline does not produce an empty last element.
        std::vector<std::string_view> split_lines(std::string_view text) {
            std::vector<std::string_view> lines;
            size_t begin = 0;
            while (begin < text.size()) {
                size_t end = text.find('\n', begin);
                if (end == std::string_view::npos)
                    end = text.size();
                lines.push_back(text.substr(begin, end - begin));
                begin = end + 1;
            }
            return lines;
        }

    } // namespace

    core::Result<std::string> dedent(const std::string_view code) {
        const SourceBuffer buffer{std::string(code)};

        std::optional<int> first_indent;
        for (size_t i = 0; i < buffer.line_count(); ++i) {
            if (!buffer.is_code(i))
                continue;
            const int indent = buffer.line(i).indent;
            if (!first_indent) {
                first_indent = indent;
            } else if (indent < *first_indent) {
                return make_error(ErrorKind::MalformedBlock,
                                  "Inconsistent indentation: line {} is indented {} columns, less than the first line ({})",
                                  i + 1, indent, *first_indent);
            }
        }

        const int shift = first_indent.value_or(0);
        if (shift == 0)
            return std::string(code);

        std::string result;
        result.reserve(code.size());
        for (size_t i = 0; i < buffer.line_count(); ++i) {
            const auto text = buffer.line_text(i);
            const int columns = std::max(0, indentation(text) - shift);
            result.append(static_cast<size_t>(columns), ' ');
            result.append(text.substr(indentation_bytes(text)));
            if (buffer.line(i).end < code.size())
                result.push_back('\n');
        }
        return result;
    }

    std::string strip_bootstrap(const std::string_view code) {
        std::string current(code);
        for (;;) {
            std::string next = current;
            for (const auto& rule : strip_rules()) {
                if (!std::regex_search(next, rule.pattern))
                    continue;
                LOG_TRACE("Stripping {}", rule.name);
                next = std::regex_replace(next, rule.pattern, "");
            }
            if (next == current)
                return current;
            current = std::move(next);
        }
    }

    std::string truncate_for_display(const std::string_view text, const size_t head, const size_t tail) {
        const auto lines = split_lines(text);
        if (lines.size() <= head + tail)
            return std::string(text);

        std::string result;
        for (size_t i = 0; i < head; ++i) {
            result.append(lines[i]);
            result.push_back('\n');
        }
        result.append(TRUNCATION_MARKER);
        for (size_t i = lines.size() - tail; i < lines.size(); ++i) {
            result.push_back('\n');
            result.append(lines[i]);
        }
        if (text.ends_with('\n'))
            result.push_back('\n');
        return result;
    }

    std::string detect_encoding(const std::string_view text) {
        const auto lines = split_lines(text);
        for (size_t i = 0; i < std::min<size_t>(2, lines.size()); ++i) {
            std::match_results<std::string_view::const_iterator> match;
            if (std::regex_search(lines[i].begin(), lines[i].end(), match, coding_re()))
                return match[1].str();
        }
        return "utf-8";
    }

    std::string prepare_region(const SourceBuffer& buffer, const Block& block) {
        const std::string_view body = std::string_view(buffer.text()).substr(block.begin, block.end - block.begin);

        const bool non_ascii = std::any_of(body.begin(), body.end(),
                                           [](const char c) { return static_cast<unsigned char>(c) >= 0x80; });

        bool indented = false;
        if (const auto first = buffer.next_code_line(block.first_line); first && *first <= block.last_line)
            indented = buffer.line(*first).indent > 0;

        size_t padding = block.first_line;
        std::string result;
        if (non_ascii) {
            result.append(UTF8_CODING_COOKIE);
            padding = padding > 0 ? padding - 1 : 0;
        }
        if (indented)
            padding = padding > 0 ? padding - 1 : 0;
        result.append(padding, '\n');
        if (indented)
            result.append(BLOCK_GUARD);
        result.append(body);

        LOG_DEBUG("Prepared {} lines {}-{} (guard: {}, cookie: {})",
                  to_string(block.kind), block.first_line + 1, block.last_line + 1, indented, non_ascii);
        return result;
    }

    std::string python_quote(const std::string_view value) {
        std::string quoted;
        quoted.reserve(value.size());
        for (const char c : value) {
            if (c == '\\' || c == '\'')
                quoted.push_back('\\');
            quoted.push_back(c);
        }
        return quoted;
    }

    std::string build_bootstrap(const std::filesystem::path& temp_file,
                                const std::string_view encoding,
                                const std::string_view display_name,
                                const bool keep_main_guard) {
        const std::string file = python_quote(core::path_to_utf8(temp_file));
        const std::string enc = python_quote(encoding);
        const std::string name = python_quote(display_name);
        const std::string_view keep = keep_main_guard ? "True" : "False";

        return std::vformat(FILE_LOAD_PREAMBLE, std::make_format_args(file, enc)) +
               std::vformat(EVAL_COMMAND, std::make_format_args(name, keep));
    }

} // namespace rpl::source
