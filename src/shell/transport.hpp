/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rpl::shell {

    // Program, arguments and directory of an interpreter process
    struct LaunchSpec {
        std::string program;
        std::vector<std::string> args;
        std::filesystem::path working_directory;
    };

    /**
     * Bidirectional text stream to an interpreter.
     *
     * Output arrives on an implementation-owned thread in chunks of any size;
     * a chunk may end in the middle of a line. Output produced before a handler
     * is installed is held and delivered to the first handler.
     */
    class Transport {
    public:
        using OutputHandler = std::function<void(std::string_view chunk)>;

        virtual ~Transport() = default;

        virtual core::Result<void> write(std::string_view data) = 0;
        virtual void set_output_handler(OutputHandler handler) = 0;
        virtual bool is_running() const = 0;
        // Stops output delivery, then ends the process. Idempotent.
        virtual void terminate() = 0;
    };

    using TransportFactory = std::function<core::Result<std::unique_ptr<Transport>>(const LaunchSpec&)>;

} // namespace rpl::shell
