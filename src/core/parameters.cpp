/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace rpl::core {
    namespace param {
        namespace {
            std::expected<nlohmann::json, std::string> read_json_file(const std::filesystem::path& path) {
                if (!std::filesystem::exists(path)) {
                    return std::unexpected(std::format("Config file not found: {}", path_to_utf8(path)));
                }

                std::ifstream file;
                if (!open_file_for_read(path, file)) {
                    return std::unexpected(std::format("Cannot open config: {}", path_to_utf8(path)));
                }

                try {
                    std::stringstream buffer;
                    buffer << file.rdbuf();
                    return nlohmann::json::parse(buffer.str());
                } catch (const nlohmann::json::parse_error& e) {
                    return std::unexpected(std::format("JSON parse error in {}: {}", path_to_utf8(path), e.what()));
                }
            }

            EchoMode echo_mode_from_json(const nlohmann::json& value, const EchoMode fallback, const char* key) {
                if (value.is_boolean()) {
                    return value.get<bool>() ? EchoMode::Always : EchoMode::Never;
                }
                const std::string text = value.get<std::string>();
                if (const auto mode = parse_echo_mode(text)) {
                    return *mode;
                }
                LOG_WARN("Invalid {} '{}' in JSON, using default", key, text);
                return fallback;
            }
        } // namespace

        std::optional<EchoMode> parse_echo_mode(const std::string_view text) {
            if (text == "always")
                return EchoMode::Always;
            if (text == "never")
                return EchoMode::Never;
            if (text == "when-shell-not-visible")
                return EchoMode::WhenShellNotVisible;
            return std::nullopt;
        }

        std::string_view to_string(const EchoMode mode) {
            switch (mode) {
            case EchoMode::Always: return "always";
            case EchoMode::Never: return "never";
            case EchoMode::WhenShellNotVisible: return "when-shell-not-visible";
            }
            return "always";
        }

        nlohmann::json ShellParameters::to_json() const {

            nlohmann::json json;
            json["interpreter"] = interpreter;
            json["interpreter_args"] = interpreter_args;
            json["session_name"] = session_name;
            json["dedicated"] = dedicated;
            json["working_directory"] = working_directory;
            json["fixed_directory"] = path_to_utf8(fixed_directory);
            json["prompt_patterns"] = prompt_patterns;
            json["continuation_prompt"] = continuation_prompt;
            json["cell_boundary_pattern"] = cell_boundary_pattern;
            json["cell_beginning_pattern"] = cell_beginning_pattern;
            json["echo_input"] = std::string(to_string(echo_input));
            json["echo_output"] = std::string(to_string(echo_output));
            json["echo_head_lines"] = echo_head_lines;
            json["echo_tail_lines"] = echo_tail_lines;
            json["ready_timeout_ms"] = ready_timeout_ms;
            json["ready_poll_interval_ms"] = ready_poll_interval_ms;
            json["send_main_guard"] = send_main_guard;
            return json;
        }

        ShellParameters ShellParameters::from_json(const nlohmann::json& json) {

            ShellParameters params;
            if (json.contains("interpreter")) {
                params.interpreter = json["interpreter"].get<std::string>();
            }
            if (json.contains("interpreter_args")) {
                params.interpreter_args.clear();
                for (const auto& arg : json["interpreter_args"]) {
                    params.interpreter_args.push_back(arg.get<std::string>());
                }
            }
            if (json.contains("session_name")) {
                params.session_name = json["session_name"].get<std::string>();
            }
            if (json.contains("dedicated")) {
                params.dedicated = json["dedicated"];
            }
            if (json.contains("working_directory")) {
                params.working_directory = json["working_directory"].get<std::string>();
            }
            if (json.contains("fixed_directory")) {
                params.fixed_directory = utf8_to_path(json["fixed_directory"].get<std::string>());
            }
            if (json.contains("prompt_patterns")) {
                params.prompt_patterns.clear();
                for (const auto& pattern : json["prompt_patterns"]) {
                    params.prompt_patterns.push_back(pattern.get<std::string>());
                }
            }
            if (json.contains("continuation_prompt")) {
                params.continuation_prompt = json["continuation_prompt"].get<std::string>();
            }
            if (json.contains("cell_boundary_pattern")) {
                params.cell_boundary_pattern = json["cell_boundary_pattern"].get<std::string>();
            }
            if (json.contains("cell_beginning_pattern")) {
                params.cell_beginning_pattern = json["cell_beginning_pattern"].get<std::string>();
            }
            if (json.contains("echo_input")) {
                params.echo_input = echo_mode_from_json(json["echo_input"], params.echo_input, "echo_input");
            }
            if (json.contains("echo_output")) {
                params.echo_output = echo_mode_from_json(json["echo_output"], params.echo_output, "echo_output");
            }
            if (json.contains("echo_head_lines")) {
                params.echo_head_lines = json["echo_head_lines"];
            }
            if (json.contains("echo_tail_lines")) {
                params.echo_tail_lines = json["echo_tail_lines"];
            }
            if (json.contains("ready_timeout_ms")) {
                params.ready_timeout_ms = json["ready_timeout_ms"];
            }
            if (json.contains("ready_poll_interval_ms")) {
                params.ready_poll_interval_ms = json["ready_poll_interval_ms"];
            }
            if (json.contains("send_main_guard")) {
                params.send_main_guard = json["send_main_guard"];
            }

            return params;
        }

        std::expected<ShellParameters, std::string> read_shell_params_from_json(const std::filesystem::path& path) {
            auto json_result = read_json_file(path);
            if (!json_result) {
                return std::unexpected(json_result.error());
            }

            const auto& json = *json_result;
            // Support both flat and nested {"shell": {...}} formats
            const auto& shell_json = json.contains("shell") ? json["shell"] : json;

            try {
                return ShellParameters::from_json(shell_json);
            } catch (const std::exception& e) {
                return std::unexpected(std::format("Error parsing shell parameters: {}", e.what()));
            }
        }

        std::expected<void, std::string> save_shell_params_to_json(
            const ShellParameters& params,
            const std::filesystem::path& path) {
            try {
                nlohmann::json json;
                json["shell"] = params.to_json();

                std::ofstream file;
                if (!open_file_for_write(path, file)) {
                    return std::unexpected(std::format("Cannot write: {}", path_to_utf8(path)));
                }

                file << json.dump(4);
                LOG_INFO("Saved config: {}", path_to_utf8(path));
                return {};
            } catch (const std::exception& e) {
                return std::unexpected(std::format("Error saving shell parameters: {}", e.what()));
            }
        }
    } // namespace param
} // namespace rpl::core
