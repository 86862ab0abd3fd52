/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "output_capture.hpp"
#include "session.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace rpl::shell {

    using MessageSink = std::function<void(const EchoMessage&)>;

    // Effective echo setting for a session that is (or is not) on screen
    bool echo_active(core::param::EchoMode mode, bool session_visible);

    /**
     * Drives one send end to end.
     *
     * Echoed input is the transmitted text with loader artifacts stripped,
     * dedented and truncated, spliced into the transcript with a continuation
     * prompt before every line after the first. Echoed output is delivered to
     * the sink once, when the prompt returns. The transmitted text itself is
     * never altered.
     */
    class EchoController {
    public:
        explicit EchoController(const core::param::ShellParameters& params);

        // SessionBusy while a previous capture is pending; MalformedBlock when the
        // echo copy cannot be dedented. Nothing is transmitted in either case.
        core::Result<void> send(Session& session, const SendRequest& request, MessageSink sink = {}) const;

        core::Result<std::string> format_input(std::string_view text) const;

    private:
        core::param::EchoMode echo_input_;
        core::param::EchoMode echo_output_;
        size_t head_lines_;
        size_t tail_lines_;
        std::string continuation_prompt_;
    };

} // namespace rpl::shell
