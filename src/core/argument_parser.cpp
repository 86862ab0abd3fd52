/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"
#include "core/path_utils.hpp"
#include <args.hxx>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <print>
#include <string_view>
#include <unordered_map>

namespace {

    constexpr const char* HELP_HEADER =
        "ReplLink: send Python code units to a live interpreter session.\n";

    constexpr const char* HELP_FOOTER =
        "\nSUBCOMMANDS:\n"
        "locate -- Print the bounds of the unit at a position\n"
        "send -- Send the unit at a position to the file's Python session\n"
        "\n"
        "Run '<subcommand> --help' for details.\n"
        "\n"
        "EXAMPLES:\n"
        "replink locate --file script.py --line 12 --unit defun\n"
        "replink send --file script.py --line 3 --unit cell --step\n"
        "replink send --file script.py --unit region --line 4 --end-line 9\n"
        "replink send --file script.py --unit buffer --send-main\n"
        "\n"
        "ENVIRONMENT:\n"
        "LOG_LEVEL -- Set log level (trace/debug/info/perf/warn/error)\n";

    using rpl::core::args::Unit;
    using rpl::core::param::EchoMode;

    const std::unordered_map<std::string, Unit> UNIT_NAMES = {
        {"statement", Unit::Statement},
        {"top", Unit::TopStatement},
        {"defun", Unit::Defun},
        {"defclass", Unit::Defclass},
        {"group", Unit::Group},
        {"cell", Unit::Cell},
        {"region", Unit::Region},
        {"buffer", Unit::Buffer}};

    const std::unordered_map<std::string, EchoMode> ECHO_NAMES = {
        {"always", EchoMode::Always},
        {"never", EchoMode::Never},
        {"when-shell-not-visible", EchoMode::WhenShellNotVisible}};

    void init_logger(const ::args::ValueFlag<std::string>& log_level,
                     const ::args::ValueFlag<std::string>& log_file,
                     const ::args::ValueFlag<std::string>& log_filter) {
        auto level = rpl::core::LogLevel::Warn;
        std::string log_file_path;
        std::string filter_pattern;

        if (const char* env_level = std::getenv("LOG_LEVEL")) {
            level = rpl::core::parse_log_level(env_level);
        }
        // CLI --log-level takes final precedence
        if (log_level) {
            level = rpl::core::parse_log_level(::args::get(log_level));
        }
        if (log_file) {
            log_file_path = ::args::get(log_file);
        }
        if (log_filter) {
            filter_pattern = ::args::get(log_filter);
        }

        rpl::core::Logger::get().init(level, log_file_path, filter_pattern);

        LOG_DEBUG("Logger initialized with level: {}", static_cast<int>(level));
        if (!filter_pattern.empty()) {
            LOG_DEBUG("Log filter: {}", filter_pattern);
        }
        if (!log_file_path.empty()) {
            LOG_DEBUG("Logging to file: {}", log_file_path);
        }
    }

    struct ParsedCommand {
        rpl::core::args::UnitRequest request;
        rpl::core::param::ShellParameters params;
        bool visible = false;
        int timeout_ms = 10000;
    };

    std::expected<std::optional<ParsedCommand>, std::string> parse_command(const std::string& subcommand,
                                                                           const int argc,
                                                                           const char* const argv[]) {
        const bool sending = subcommand == "send";

        ::args::ArgumentParser parser(
            sending ? "ReplLink send: send a unit to the file's Python session.\n"
                    : "ReplLink locate: print the bounds of a unit.\n",
            HELP_FOOTER);
        parser.helpParams.width = 120;

        // =============================================================================
        // UNIT SELECTION
        // =============================================================================
        ::args::Group unit_group(parser, "UNIT SELECTION:");
        ::args::HelpFlag help(unit_group, "help", "Display help menu", {'h', "help"});
        ::args::ValueFlag<std::string> file(unit_group, "path", "Python source file", {'f', "file"});
        ::args::ValueFlag<size_t> line(unit_group, "line", "Line of point, 1-based (default: 1)", {'l', "line"});
        ::args::ValueFlag<size_t> column(unit_group, "column", "Column of point, 0-based (default: 0)", {'c', "column"});
        ::args::MapFlag<std::string, Unit> unit(unit_group, "unit",
                                                "Unit: statement, top, defun, defclass, group, cell, region, buffer",
                                                {'u', "unit"}, UNIT_NAMES);
        ::args::ValueFlag<size_t> end_line(unit_group, "line", "Last line of a region, inclusive", {"end-line"});
        ::args::Flag step(unit_group, "step", "Also print the position after the unit", {"step"});

        // =============================================================================
        // SESSION
        // =============================================================================
        ::args::Group session_sep(parser, " ");
        ::args::Group session_group(parser, "SESSION:");
        ::args::ValueFlag<std::string> config_file(session_group, "config_file", "ReplLink config file (json)", {"config"});
        ::args::ValueFlag<std::string> interpreter(session_group, "program", "Interpreter (default: python3)", {"interpreter"});
        ::args::Flag dedicated(session_group, "dedicated", "Use a session private to the file", {"dedicated"});
        ::args::MapFlag<std::string, EchoMode> echo_input(session_group, "mode",
                                                          "Echo input: always, never, when-shell-not-visible",
                                                          {"echo-input"}, ECHO_NAMES);
        ::args::MapFlag<std::string, EchoMode> echo_output(session_group, "mode",
                                                           "Echo output: always, never, when-shell-not-visible",
                                                           {"echo-output"}, ECHO_NAMES);
        ::args::Flag visible(session_group, "visible", "Treat the session as visible and print its transcript", {"visible"});
        ::args::Flag send_main(session_group, "send_main", "Run `if __name__ == '__main__':` blocks on buffer sends", {"send-main"});
        ::args::ValueFlag<int> timeout_ms(session_group, "ms", "How long to wait for output (default: 10000)", {"timeout-ms"});

        // =============================================================================
        // LOGGING
        // =============================================================================
        ::args::Group log_sep(parser, " ");
        ::args::Group log_group(parser, "LOGGING:");
        ::args::ValueFlag<std::string> log_level(log_group, "level", "Log level: trace, debug, info, perf, warn, error, critical, off", {"log-level"});
        ::args::ValueFlag<std::string> log_file(log_group, "file", "Also write the log to a file", {"log-file"});
        ::args::ValueFlag<std::string> log_filter(log_group, "pattern", "Only log messages containing pattern", {"log-filter"});

        std::vector<std::string> args_vec(argv + 1, argv + argc);
        args_vec[0] = std::string(argv[0]) + " " + subcommand;
        parser.Prog(args_vec[0]);

        try {
            parser.ParseArgs(std::vector<std::string>(args_vec.begin() + 1, args_vec.end()));
        } catch (const ::args::Help&) {
            std::print("{}", parser.Help());
            return std::optional<ParsedCommand>{};
        } catch (const ::args::ParseError& e) {
            return std::unexpected(std::format("{}\n\n{}", e.what(), parser.Help()));
        } catch (const ::args::ValidationError& e) {
            return std::unexpected(std::format("{}\n\n{}", e.what(), parser.Help()));
        }

        init_logger(log_level, log_file, log_filter);

        if (!file) {
            return std::unexpected(std::format("Missing --file\n\n{}", parser.Help()));
        }

        ParsedCommand command;
        if (config_file) {
            const auto loaded = rpl::core::param::read_shell_params_from_json(
                rpl::core::utf8_to_path(::args::get(config_file)));
            if (!loaded) {
                return std::unexpected(std::format("Config load failed: {}", loaded.error()));
            }
            command.params = *loaded;
        }

        auto& request = command.request;
        request.file = rpl::core::utf8_to_path(::args::get(file));
        if (line)
            request.line = ::args::get(line);
        if (column)
            request.column = ::args::get(column);
        if (unit)
            request.unit = ::args::get(unit);
        if (end_line)
            request.end_line = ::args::get(end_line);
        request.step = step;

        if (request.line == 0) {
            return std::unexpected("Line numbers start at 1");
        }
        if (request.unit == Unit::Region) {
            if (!request.end_line) {
                return std::unexpected("--unit region requires --end-line");
            }
            if (*request.end_line < request.line) {
                return std::unexpected("--end-line must not be before --line");
            }
        }
        if (!std::filesystem::exists(request.file)) {
            return std::unexpected(std::format("File not found: {}", rpl::core::path_to_utf8(request.file)));
        }

        auto& params = command.params;
        if (interpreter)
            params.interpreter = ::args::get(interpreter);
        if (dedicated)
            params.dedicated = true;
        if (echo_input)
            params.echo_input = ::args::get(echo_input);
        if (echo_output)
            params.echo_output = ::args::get(echo_output);
        if (send_main)
            params.send_main_guard = true;

        command.visible = visible;
        if (timeout_ms) {
            command.timeout_ms = ::args::get(timeout_ms);
            if (command.timeout_ms < 0) {
                return std::unexpected("--timeout-ms must not be negative");
            }
        }

        return command;
    }

} // anonymous namespace

std::expected<rpl::core::args::ParsedArgs, std::string>
rpl::core::args::parse_args(const int argc, const char* const argv[]) {
    if (argc < 2) {
        std::print("{}{}", HELP_HEADER, HELP_FOOTER);
        return HelpMode{};
    }

    const std::string subcommand = argv[1];
    if (subcommand == "-h" || subcommand == "--help" || subcommand == "help") {
        std::print("{}{}", HELP_HEADER, HELP_FOOTER);
        return HelpMode{};
    }
    if (subcommand != "locate" && subcommand != "send") {
        return std::unexpected(std::format("Unknown subcommand '{}'\n\n{}{}", subcommand, HELP_HEADER, HELP_FOOTER));
    }

    auto parsed = parse_command(subcommand, argc, argv);
    if (!parsed)
        return std::unexpected(parsed.error());
    if (!*parsed)
        return HelpMode{};

    auto& command = **parsed;
    if (subcommand == "locate")
        return LocateMode{std::move(command.request), std::move(command.params)};
    return SendMode{std::move(command.request), std::move(command.params), command.visible, command.timeout_ms};
}
