/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "core/argument_parser.hpp"
#include "core/logger.hpp"

#include <cstdio>
#include <print>
#include <type_traits>
#include <variant>

int main(int argc, char* argv[]) {
    const auto parsed = rpl::core::args::parse_args(argc, argv);
    if (!parsed) {
        std::println(stderr, "{}", parsed.error());
        return 1;
    }

    rpl::app::Application app;
    const int code = std::visit([&](auto&& mode) -> int {
        using T = std::decay_t<decltype(mode)>;

        if constexpr (std::is_same_v<T, rpl::core::args::HelpMode>) {
            return 0;
        } else {
            return app.run(mode);
        }
    },
                                *parsed);

    rpl::core::Logger::get().flush();
    return code;
}
