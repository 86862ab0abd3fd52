/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include <expected>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <system_error>
#include <unistd.h>
#include <variant>
#include <vector>

using namespace rpl::core::args;
using rpl::core::param::EchoMode;

class ArgumentParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = std::filesystem::temp_directory_path() /
                  ("replink_args_" + std::to_string(::getpid()) + ".py");
        std::ofstream(source_) << "x = 1\n";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(source_, ec);
    }

    std::expected<ParsedArgs, std::string> parse(std::vector<std::string> args) const {
        args.insert(args.begin(), "replink");
        std::vector<const char*> argv;
        for (const auto& arg : args)
            argv.push_back(arg.c_str());
        return parse_args(static_cast<int>(argv.size()), argv.data());
    }

    std::filesystem::path source_;
};

TEST_F(ArgumentParserTest, NoArgumentsShowsHelp) {
    const auto result = parse({});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(std::holds_alternative<HelpMode>(*result));

    const auto help = parse({"--help"});
    ASSERT_TRUE(help.has_value());
    EXPECT_TRUE(std::holds_alternative<HelpMode>(*help));
}

TEST_F(ArgumentParserTest, UnknownSubcommand) {
    const auto result = parse({"evaluate", "--file", source_.string()});
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("Unknown subcommand 'evaluate'"), std::string::npos);
}

TEST_F(ArgumentParserTest, LocateWithUnit) {
    const auto result = parse({"locate", "-f", source_.string(), "-l", "3", "-c", "4", "-u", "defun", "--step"});
    ASSERT_TRUE(result.has_value()) << result.error();
    ASSERT_TRUE(std::holds_alternative<LocateMode>(*result));

    const auto& request = std::get<LocateMode>(*result).request;
    EXPECT_EQ(request.file, source_);
    EXPECT_EQ(request.line, 3u);
    EXPECT_EQ(request.column, 4u);
    EXPECT_EQ(request.unit, Unit::Defun);
    EXPECT_TRUE(request.step);
}

TEST_F(ArgumentParserTest, SendOverridesSessionParameters) {
    const auto result = parse({"send", "--file", source_.string(), "--unit", "buffer", "--dedicated",
                               "--echo-output", "never", "--send-main", "--visible", "--timeout-ms", "500",
                               "--interpreter", "python3.12"});
    ASSERT_TRUE(result.has_value()) << result.error();
    ASSERT_TRUE(std::holds_alternative<SendMode>(*result));

    const auto& mode = std::get<SendMode>(*result);
    EXPECT_EQ(mode.request.unit, Unit::Buffer);
    EXPECT_TRUE(mode.params.dedicated);
    EXPECT_EQ(mode.params.echo_output, EchoMode::Never);
    EXPECT_EQ(mode.params.echo_input, EchoMode::Always);
    EXPECT_TRUE(mode.params.send_main_guard);
    EXPECT_EQ(mode.params.interpreter, "python3.12");
    EXPECT_TRUE(mode.visible);
    EXPECT_EQ(mode.timeout_ms, 500);
}

TEST_F(ArgumentParserTest, RegionNeedsEndLine) {
    EXPECT_FALSE(parse({"locate", "--file", source_.string(), "--unit", "region", "--line", "2"}).has_value());
    EXPECT_FALSE(parse({"locate", "--file", source_.string(), "--unit", "region", "--line", "4", "--end-line", "2"})
                     .has_value());

    const auto result = parse({"locate", "--file", source_.string(), "--unit", "region", "--line", "2", "--end-line", "4"});
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(std::get<LocateMode>(*result).request.end_line, 4u);
}

TEST_F(ArgumentParserTest, RejectsInvalidInput) {
    EXPECT_FALSE(parse({"locate"}).has_value());
    EXPECT_FALSE(parse({"locate", "--file", "/nonexistent/replink.py"}).has_value());
    EXPECT_FALSE(parse({"locate", "--file", source_.string(), "--line", "0"}).has_value());
    EXPECT_FALSE(parse({"locate", "--file", source_.string(), "--unit", "paragraph"}).has_value());
    EXPECT_FALSE(parse({"send", "--file", source_.string(), "--timeout-ms", "-1"}).has_value());
    EXPECT_FALSE(parse({"send", "--file", source_.string(), "--config", "/nonexistent/replink.json"}).has_value());
}
