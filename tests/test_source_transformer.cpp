/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "source/block_locator.hpp"
#include "source/source_buffer.hpp"
#include "source/source_transformer.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace rpl::source;
using rpl::core::ErrorKind;

namespace {

    std::string indent_lines(const std::string& code, const size_t columns) {
        std::string result;
        bool line_start = true;
        for (const char c : code) {
            if (line_start && c != '\n')
                result.append(columns, ' ');
            result.push_back(c);
            line_start = c == '\n';
        }
        return result;
    }

    std::string numbered_lines(const size_t count) {
        std::string text;
        for (size_t i = 1; i <= count; ++i)
            text += "line" + std::to_string(i) + "\n";
        return text;
    }

} // namespace

// ---------------------------------------------------------------------------
// dedent
// ---------------------------------------------------------------------------

TEST(DedentTest, UndoesAUniformShift) {
    const std::string code =
        "def f(x):\n"
        "    if x:\n"
        "        return 1\n"
        "\n"
        "    return 0\n";

    for (const size_t shift : {0u, 1u, 4u, 8u}) {
        const auto result = dedent(indent_lines(code, shift));
        ASSERT_TRUE(result.has_value()) << "shift " << shift;
        EXPECT_EQ(*result, code) << "shift " << shift;
    }
}

TEST(DedentTest, ExpandsTabs) {
    const auto result = dedent("\tx = 1\n\tif x:\n\t\ty = 2\n");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "x = 1\nif x:\n        y = 2\n");
}

TEST(DedentTest, KeepsTextWithoutTrailingNewline) {
    const auto result = dedent("    a = 1\n    b = 2");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "a = 1\nb = 2");
}

TEST(DedentTest, RejectsLineLeftOfFirst) {
    const auto result = dedent("    a = 1\n  b = 2\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::MalformedBlock);
    EXPECT_TRUE(result.error().is_fatal());
}

TEST(DedentTest, IgnoresStringContinuationLines) {
    const auto result = dedent("    s = '''\nraw\n    '''\n");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "s = '''\nraw\n'''\n");
}

TEST(DedentTest, CommentsDoNotSetTheShift) {
    const auto result = dedent("# leading\n    x = 1\n");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "# leading\nx = 1\n");
}

// ---------------------------------------------------------------------------
// strip_bootstrap
// ---------------------------------------------------------------------------

TEST(StripBootstrapTest, RemovesCookiePaddingAndGuard) {
    const std::string wrapped = "# -*- coding: utf-8 -*-\n\n\nif True:\n    x = 1\n    y = 2\n";
    EXPECT_EQ(strip_bootstrap(wrapped), "    x = 1\n    y = 2\n");
}

TEST(StripBootstrapTest, RemovesLoaderCommand) {
    const auto command = build_bootstrap("/tmp/replink-abc123.py", "utf-8", "<string>", true);
    EXPECT_EQ(strip_bootstrap(command), "");
}

TEST(StripBootstrapTest, KeepsGuardWithoutIndentedBody) {
    // A user's own `if True:` followed by an unindented line is not a guard
    EXPECT_EQ(strip_bootstrap("if True:\nx = 1\n"), "if True:\nx = 1\n");
}

TEST(StripBootstrapTest, IsIdempotent) {
    const std::vector<std::string> inputs = {
        "",
        "x = 1\n",
        "\n\n\nprint('hi')\n",
        "# -*- coding: latin-1 -*-\nif True:\n    pass\n",
        "if True:\n    if True:\n        nested()\n",
        build_bootstrap("/tmp/replink-q'uote.py", "utf-8", "script.py", false),
        "# coding: utf-8\n\n\n\nif True:\n    a = [1,\n  2]\n",
    };

    for (const auto& input : inputs) {
        const std::string once = strip_bootstrap(input);
        EXPECT_EQ(strip_bootstrap(once), once) << "input: " << input;
    }
}

// ---------------------------------------------------------------------------
// truncate_for_display
// ---------------------------------------------------------------------------

TEST(TruncateTest, KeepsHeadAndTailAroundMarker) {
    const auto result = truncate_for_display(numbered_lines(10), 2, 2);
    EXPECT_EQ(result, "line1\nline2\n  ...\nline9\nline10\n");
}

TEST(TruncateTest, ShortTextIsUnchanged) {
    const std::string text = numbered_lines(4);
    EXPECT_EQ(truncate_for_display(text, 2, 2), text);
    EXPECT_EQ(truncate_for_display("a\nb", 1, 1), "a\nb");
}

TEST(TruncateTest, ResultHasHeadPlusTailPlusOneLines) {
    for (const size_t count : {5u, 11u, 50u}) {
        const auto result = truncate_for_display(numbered_lines(count), 3, 1);
        EXPECT_EQ(std::count(result.begin(), result.end(), '\n'), 5) << count << " lines";
    }
}

// ---------------------------------------------------------------------------
// detect_encoding
// ---------------------------------------------------------------------------

TEST(DetectEncodingTest, ReadsDeclarationInFirstTwoLines) {
    EXPECT_EQ(detect_encoding("# -*- coding: latin-1 -*-\nx = 1\n"), "latin-1");
    EXPECT_EQ(detect_encoding("#!/usr/bin/env python\n# vim: set fileencoding=cp1252 :\n"), "cp1252");
}

TEST(DetectEncodingTest, DefaultsToUtf8) {
    EXPECT_EQ(detect_encoding(""), "utf-8");
    EXPECT_EQ(detect_encoding("x = 1\n"), "utf-8");
    EXPECT_EQ(detect_encoding("#!/usr/bin/env python\n\n# coding: latin-1\n"), "utf-8");
}

// ---------------------------------------------------------------------------
// prepare_region
// ---------------------------------------------------------------------------

TEST(PrepareRegionTest, PadsToOriginalLineNumbers) {
    const SourceBuffer buffer("a = 1\nb = 2\nc = 3\n");
    const auto block = BlockLocator(buffer).locate_statement(buffer.line(2).begin);
    ASSERT_TRUE(block.has_value());

    EXPECT_EQ(prepare_region(buffer, *block), "\n\nc = 3");
}

TEST(PrepareRegionTest, IndentedBlockGetsGuardInPlaceOfPadding) {
    const SourceBuffer buffer(
        "def f():\n"
        "    x = 1\n"
        "    return x\n");
    const auto block = BlockLocator(buffer).region(buffer.line(1).begin, buffer.line(2).end);
    ASSERT_TRUE(block.has_value());

    const std::string prepared = prepare_region(buffer, *block);
    EXPECT_EQ(prepared, "if True:\n    x = 1\n    return x");
    // The body still starts on its original line
    EXPECT_EQ(prepared.substr(0, prepared.find("x = 1")).find('\n'), BLOCK_GUARD.size() - 1);
}

TEST(PrepareRegionTest, NonAsciiTextGetsCodingCookie) {
    const SourceBuffer buffer("a = 1\nname = 'Zoë'\n");
    const auto block = BlockLocator(buffer).locate_statement(buffer.line(1).begin);
    ASSERT_TRUE(block.has_value());

    EXPECT_EQ(prepare_region(buffer, *block), std::string(UTF8_CODING_COOKIE) + "name = 'Zoë'");
}

TEST(PrepareRegionTest, GuardAtFirstLineAddsALine) {
    const SourceBuffer buffer("    x = 1\n");
    const auto block = BlockLocator(buffer).whole_buffer();
    ASSERT_TRUE(block.has_value());

    EXPECT_EQ(prepare_region(buffer, *block), "if True:\n    x = 1");
}

// ---------------------------------------------------------------------------
// build_bootstrap
// ---------------------------------------------------------------------------

TEST(BuildBootstrapTest, IsASingleLineCommand) {
    const auto command = build_bootstrap("/tmp/replink-x.py", "utf-8", "<string>", true);
    EXPECT_TRUE(command.ends_with('\n'));
    EXPECT_EQ(std::count(command.begin(), command.end(), '\n'), 1);
    EXPECT_NE(command.find("os.remove('''/tmp/replink-x.py''')"), std::string::npos);
    EXPECT_NE(command.find("'''<string>'''"), std::string::npos);
}

TEST(BuildBootstrapTest, MainGuardFlag) {
    const auto keep = build_bootstrap("/tmp/a.py", "utf-8", "a.py", true);
    const auto drop = build_bootstrap("/tmp/a.py", "utf-8", "a.py", false);
    EXPECT_NE(keep.find("if True or not"), std::string::npos);
    EXPECT_NE(drop.find("if False or not"), std::string::npos);
}

TEST(BuildBootstrapTest, QuotesPathsAndNames) {
    EXPECT_EQ(python_quote(R"(it's a\path)"), R"(it\'s a\\path)");
    const auto command = build_bootstrap("/tmp/a.py", "utf-8", "o'clock.py", true);
    EXPECT_NE(command.find(R"('''o\'clock.py''')"), std::string::npos);
}
