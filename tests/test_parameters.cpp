/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/path_utils.hpp"
#include <filesystem>
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <nlohmann/json.hpp>
#include <unistd.h>

using namespace rpl::core;
using namespace rpl::core::param;

class ShellParametersTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("replink_params_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write_json(const std::string& name, const std::string& content) const {
        const auto path = dir_ / name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    std::filesystem::path dir_;
};

TEST_F(ShellParametersTest, Defaults) {
    const ShellParameters params;
    EXPECT_EQ(params.interpreter, "python3");
    EXPECT_EQ(params.session_name, "Python");
    EXPECT_FALSE(params.dedicated);
    EXPECT_EQ(params.working_directory, "current");
    EXPECT_EQ(params.echo_input, EchoMode::Always);
    EXPECT_EQ(params.echo_output, EchoMode::WhenShellNotVisible);
    EXPECT_EQ(params.continuation_prompt, "... ");
    EXPECT_FALSE(params.send_main_guard);
}

TEST_F(ShellParametersTest, SaveAndReadBack) {
    ShellParameters params;
    params.interpreter = "/opt/python/bin/python3.12";
    params.interpreter_args = {"-i", "-q"};
    params.dedicated = true;
    params.working_directory = "fixed";
    params.fixed_directory = dir_;
    params.prompt_patterns = {"> "};
    params.echo_output = EchoMode::Never;
    params.echo_head_lines = 3;
    params.ready_timeout_ms = 500;
    params.send_main_guard = true;

    const auto path = dir_ / "saved.json";
    ASSERT_TRUE(save_shell_params_to_json(params, path).has_value());

    const auto loaded = read_shell_params_from_json(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_EQ(loaded->interpreter, params.interpreter);
    EXPECT_EQ(loaded->interpreter_args, params.interpreter_args);
    EXPECT_TRUE(loaded->dedicated);
    EXPECT_EQ(loaded->working_directory, "fixed");
    EXPECT_EQ(loaded->fixed_directory, dir_);
    EXPECT_EQ(loaded->prompt_patterns, params.prompt_patterns);
    EXPECT_EQ(loaded->echo_output, EchoMode::Never);
    EXPECT_EQ(loaded->echo_head_lines, 3u);
    EXPECT_EQ(loaded->ready_timeout_ms, 500);
    EXPECT_TRUE(loaded->send_main_guard);
}

TEST_F(ShellParametersTest, FlatObjectKeepsDefaultsForMissingKeys) {
    const auto path = write_json("flat.json", R"({"interpreter": "python3.11", "echo_tail_lines": 2})");

    const auto loaded = read_shell_params_from_json(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_EQ(loaded->interpreter, "python3.11");
    EXPECT_EQ(loaded->echo_tail_lines, 2u);
    EXPECT_EQ(loaded->echo_head_lines, ShellParameters{}.echo_head_lines);
    EXPECT_EQ(loaded->session_name, "Python");
}

TEST_F(ShellParametersTest, BooleanEchoModes) {
    const auto path = write_json("bool.json", R"({"shell": {"echo_input": false, "echo_output": true}})");

    const auto loaded = read_shell_params_from_json(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_EQ(loaded->echo_input, EchoMode::Never);
    EXPECT_EQ(loaded->echo_output, EchoMode::Always);
}

TEST_F(ShellParametersTest, UnknownEchoModeFallsBack) {
    const auto path = write_json("echo.json", R"({"echo_input": "sometimes", "echo_output": "never"})");

    const auto loaded = read_shell_params_from_json(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error();
    EXPECT_EQ(loaded->echo_input, EchoMode::Always);
    EXPECT_EQ(loaded->echo_output, EchoMode::Never);
}

TEST_F(ShellParametersTest, ReportsMissingAndInvalidFiles) {
    const auto missing = read_shell_params_from_json(dir_ / "absent.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_NE(missing.error().find("not found"), std::string::npos);

    const auto broken = read_shell_params_from_json(write_json("broken.json", "{\"interpreter\": "));
    ASSERT_FALSE(broken.has_value());
    EXPECT_NE(broken.error().find("JSON parse error"), std::string::npos);

    const auto wrong_type = read_shell_params_from_json(write_json("type.json", R"({"interpreter": 3})"));
    ASSERT_FALSE(wrong_type.has_value());
}

TEST(EchoModeTest, ParseAndPrint) {
    for (const auto mode : {EchoMode::Never, EchoMode::Always, EchoMode::WhenShellNotVisible}) {
        const auto parsed = parse_echo_mode(to_string(mode));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, mode);
    }
    EXPECT_FALSE(parse_echo_mode("Always").has_value());
}

TEST(PathUtilsTest, WriteTempFile) {
    const auto path = write_temp_file("print('hi')\n");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->extension(), ".py");
    EXPECT_TRUE(path->filename().string().starts_with("replink-"));

    std::ifstream file(*path);
    const std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "print('hi')\n");
    std::filesystem::remove(*path);
}

TEST(PathUtilsTest, FindExecutable) {
    EXPECT_TRUE(find_executable("sh").has_value());
    EXPECT_TRUE(find_executable("/bin/sh").has_value());
    EXPECT_FALSE(find_executable("replink-no-such-interpreter").has_value());
    EXPECT_FALSE(find_executable("/nonexistent/python3").has_value());
}

TEST(PathUtilsTest, FindExecutableSkipsUnreadableCurrentDirectory) {
    const auto original_dir = std::filesystem::current_path();
    const char* const original_path = std::getenv("PATH");
    const std::string saved_path = original_path ? original_path : "";

    // An empty PATH entry refers to the current directory, which no longer exists
    const auto gone = std::filesystem::temp_directory_path() / ("replink_gone_" + std::to_string(getpid()));
    std::filesystem::create_directories(gone);
    ASSERT_EQ(chdir(gone.c_str()), 0);
    std::filesystem::remove(gone);
    setenv("PATH", ":/bin:/usr/bin", 1);

    std::optional<std::filesystem::path> found;
    EXPECT_NO_THROW(found = find_executable("sh"));

    setenv("PATH", saved_path.c_str(), 1);
    std::filesystem::current_path(original_dir);

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename(), "sh");
}
