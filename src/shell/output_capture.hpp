/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "prompt.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace rpl::shell {

    inline constexpr std::string_view TRACEBACK_MARKER = "Traceback (most recent call last):";

    enum class EchoKind {
        Output,
        NoOutput,
        Exception
    };

    // What one send produced, as shown to the user
    struct EchoMessage {
        EchoKind kind = EchoKind::NoOutput;
        std::string text; // trimmed output; the full trace for exceptions

        std::string summary() const;
    };

    /**
     * Accumulates interpreter output for one send until the prompt comes back.
     *
     * Chunks may split lines or the prompt itself anywhere. The first chunk that
     * completes a prompt yields the message; the buffer is then cleared and every
     * later chunk is ignored.
     */
    class OutputCapture {
    public:
        explicit OutputCapture(PromptMatcher prompt) : prompt_(std::move(prompt)) {}

        std::optional<EchoMessage> feed(std::string_view chunk);

        bool flushed() const { return flushed_; }
        const std::string& buffer() const { return buffer_; }

        static EchoMessage classify(std::string_view output);

    private:
        PromptMatcher prompt_;
        std::string buffer_;
        bool flushed_ = false;
    };

} // namespace rpl::shell
