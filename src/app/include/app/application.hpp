/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/argument_parser.hpp"

namespace rpl::app {

    class Application {
    public:
        // Both return the process exit code.
        int run(const core::args::LocateMode& mode);
        int run(const core::args::SendMode& mode);
    };

} // namespace rpl::app
