/* SPDX-FileCopyrightText: 2025 ReplLink Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "echo_controller.hpp"

#include <core/logger.hpp>
#include <source/source_transformer.hpp>

namespace rpl::shell {

    using core::param::EchoMode;

    bool echo_active(const EchoMode mode, const bool session_visible) {
        switch (mode) {
        case EchoMode::Always: return true;
        case EchoMode::Never: return false;
        case EchoMode::WhenShellNotVisible: return !session_visible;
        }
        return true;
    }

    EchoController::EchoController(const core::param::ShellParameters& params)
        : echo_input_(params.echo_input),
          echo_output_(params.echo_output),
          head_lines_(params.echo_head_lines),
          tail_lines_(params.echo_tail_lines),
          continuation_prompt_(params.continuation_prompt) {
    }

    core::Result<std::string> EchoController::format_input(const std::string_view text) const {
        auto dedented = source::dedent(source::strip_bootstrap(text));
        if (!dedented)
            return std::unexpected(dedented.error());

        std::string_view body = *dedented;
        while (!body.empty() && body.back() == '\n')
            body.remove_suffix(1);

        const std::string truncated = source::truncate_for_display(body, head_lines_, tail_lines_);

        std::string result;
        result.reserve(truncated.size() + 16);
        size_t begin = 0;
        while (begin <= truncated.size()) {
            size_t end = truncated.find('\n', begin);
            if (end == std::string::npos)
                end = truncated.size();
            if (begin > 0)
                result.append(continuation_prompt_);
            result.append(truncated, begin, end - begin);
            result.push_back('\n');
            begin = end + 1;
        }
        return result;
    }

    core::Result<void> EchoController::send(Session& session, const SendRequest& request, MessageSink sink) const {
        const bool echo_in = request.echo && echo_active(echo_input_, session.visible());
        const bool echo_out = request.echo && echo_active(echo_output_, session.visible());

        if (session.capture_pending())
            return core::make_error(core::ErrorKind::SessionBusy,
                                    "Session {} is still evaluating the previous input", session.name());

        std::string echoed;
        if (echo_in) {
            auto formatted = format_input(request.text);
            if (!formatted)
                return std::unexpected(formatted.error());
            echoed = std::move(*formatted);
        }

        SendStrategy strategy;
        strategy.before_transmit = [&](Session& target) {
            if (echo_in)
                target.append_transcript(echoed);
            if (request.add_to_history)
                target.add_history(source::strip_bootstrap(request.text));
        };
        if (echo_out) {
            strategy.on_output = [sink = std::move(sink)](const EchoMessage& message) {
                LOG_DEBUG("Echo: {}", message.summary());
                if (sink)
                    sink(message);
            };
        }

        return session.send(request, strategy);
    }

} // namespace rpl::shell
