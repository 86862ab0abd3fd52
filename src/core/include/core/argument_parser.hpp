/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include "core/parameters.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace rpl::core {
    namespace args {

        enum class Unit {
            Statement,
            TopStatement,
            Defun,
            Defclass,
            Group,
            Cell,
            Region,
            Buffer
        };

        // Which unit of which file, at which point
        struct UnitRequest {
            std::filesystem::path file;
            size_t line = 1;   // 1-based
            size_t column = 0; // 0-based, clamped to the line length
            Unit unit = Unit::Statement;
            std::optional<size_t> end_line; // regions: last line, inclusive
            bool step = false;              // report the position after the unit
        };

        struct LocateMode {
            UnitRequest request;
            param::ShellParameters params;
        };

        struct SendMode {
            UnitRequest request;
            param::ShellParameters params;
            bool visible = false; // print the session transcript
            int timeout_ms = 10000;
        };

        struct HelpMode {};

        using ParsedArgs = std::variant<HelpMode, LocateMode, SendMode>;

        // Also initializes the logger from LOG_LEVEL and the --log-* flags.
        RPL_CORE_API std::expected<ParsedArgs, std::string> parse_args(int argc, const char* const argv[]);

    } // namespace args
} // namespace rpl::core
