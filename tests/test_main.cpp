/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <cstdlib>
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    // Initialize loggers - check LOG_LEVEL env var
    auto log_level = rpl::core::LogLevel::Warn;
    if (const char* env = std::getenv("LOG_LEVEL")) {
        log_level = rpl::core::parse_log_level(env);
    }
    rpl::core::Logger::get().init(log_level);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
