/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace rpl::core {
    namespace param {
        // When a send echoes its input (or its captured output) to the user
        enum class EchoMode {
            Never,
            Always,
            WhenShellNotVisible // only while the session transcript is hidden
        };

        inline constexpr const char* DEFAULT_CELL_BOUNDARY_PATTERN =
            R"(^(?:##.*|#\s*<.+>|#\s*(?:In|Out)\[.*\]:)\s*$)";
        inline constexpr const char* DEFAULT_CELL_BEGINNING_PATTERN =
            R"(^(?:##.*|#\s*<codecell>|#\s*In\[.*\]:)\s*$)";

        struct RPL_CORE_API ShellParameters {
            std::string interpreter = "python3";
            std::vector<std::string> interpreter_args = {"-i"};
            std::string session_name = "Python"; // shared target name, prefix of dedicated ones
            bool dedicated = false;              // one session per source file

            // "current", "source-directory" or "fixed"; checked when a session starts
            std::string working_directory = "current";
            std::filesystem::path fixed_directory;

            // Each pattern must match a whole trailing line of output
            std::vector<std::string> prompt_patterns = {">>> ", R"(In \[[0-9]+\]: )"};
            std::string continuation_prompt = "... ";

            std::string cell_boundary_pattern = DEFAULT_CELL_BOUNDARY_PATTERN;
            std::string cell_beginning_pattern = DEFAULT_CELL_BEGINNING_PATTERN;

            EchoMode echo_input = EchoMode::Always;
            EchoMode echo_output = EchoMode::WhenShellNotVisible;
            size_t echo_head_lines = 10;
            size_t echo_tail_lines = 10;

            int ready_timeout_ms = 3000;
            int ready_poll_interval_ms = 100;

            bool send_main_guard = false; // whole-file sends run `if __name__ == '__main__':` blocks

            nlohmann::json to_json() const;
            static ShellParameters from_json(const nlohmann::json& json);
        };

        RPL_CORE_API std::optional<EchoMode> parse_echo_mode(std::string_view text);
        RPL_CORE_API std::string_view to_string(EchoMode mode);

        // Reads {"shell": {...}} or a flat object; missing keys keep their defaults.
        RPL_CORE_API std::expected<ShellParameters, std::string> read_shell_params_from_json(
            const std::filesystem::path& path);

        RPL_CORE_API std::expected<void, std::string> save_shell_params_to_json(
            const ShellParameters& params,
            const std::filesystem::path& path);
    } // namespace param
} // namespace rpl::core
